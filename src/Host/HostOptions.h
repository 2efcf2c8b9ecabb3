#pragma once
/**
 * @file HostOptions.h
 * @brief Command line of the host server.
 */

#include <stddef.h>

#include "Core/BridgeConfig.h"

struct HostOptions {
    BridgeConfig config{};
    char bindAddress[48] = "0.0.0.0";
    bool showHelp = false;
};

/** Host defaults: mock backend, unlimited clients. */
void hostDefaults(BridgeConfig& cfg);

/**
 * @brief Parse argv into out.
 *
 * The --config file is applied first, then every other option on top of it,
 * whatever their order on the command line.
 */
bool parseHostOptions(int argc, char** argv, HostOptions& out, char* err, size_t errLen);

void printHostUsage(const char* prog);
