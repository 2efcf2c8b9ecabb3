#pragma once
/**
 * @file ConfigNvs.h
 * @brief BridgeConfig persisted as one JSON string in NVS.
 */

#include "Core/BridgeConfig.h"

namespace ConfigNvs {

constexpr const char* Namespace = "sigmalink";
constexpr const char* Key = "cfg";

/** Patch cfg with the stored document. False when nothing valid is stored. */
bool load(BridgeConfig& cfg);
bool save(const BridgeConfig& cfg);
bool erase();

}  // namespace ConfigNvs
