/**
 * @file main.cpp
 * @brief Host server: the sigma TCP protocol over the mock backend.
 */

#include <chrono>
#include <signal.h>
#include <stdio.h>
#include <thread>

#include "Backends/MockBackend.h"
#include "Host/HostOptions.h"
#include "Host/PosixTcpServer.h"

#define LOG_TAG "Main"
#include "Core/ModuleLog.h"

namespace {

volatile sig_atomic_t gStop = 0;

void onSignal(int)
{
    gStop = 1;
}

}  // namespace

int main(int argc, char** argv)
{
    HostOptions options;
    char err[160] = {0};
    if (!parseHostOptions(argc, argv, options, err, sizeof(err))) {
        fprintf(stderr, "%s\n", err);
        printHostUsage(argv[0]);
        return 2;
    }
    if (options.showHelp) {
        printHostUsage(argv[0]);
        return 0;
    }

    const BridgeConfig& cfg = options.config;
    logSetLevel(cfg.logLevel);

    MockBackend backend(cfg.mockFill);

    TcpServerOptions serverOpts;
    serverOpts.bindAddress = options.bindAddress;
    serverOpts.port = cfg.tcpPort;
    serverOpts.maxClients = cfg.maxClients;
    serverOpts.connection = cfg.connectionOptions();

    PosixTcpServer server(backend, serverOpts);
    if (!server.start(err, sizeof(err))) {
        LOGE("server start failed: %s", err);
        return 1;
    }
    LOGI("backend=%s resync=%s read_padding=%s failure_reply=%s buffer=%u",
         backend.backendId(),
         resyncPolicyStr(cfg.resync),
         readPaddingPolicyStr(cfg.readPadding),
         failureReplyStr(cfg.failureReply),
         (unsigned)cfg.bufferSize);

    signal(SIGINT, onSignal);
    signal(SIGTERM, onSignal);
    while (!gStop && server.running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    const TcpServerStats st = server.stats();
    LOGI("exit accepted=%lu refused=%lu reads=%lu writes=%lu",
         (unsigned long)st.accepted,
         (unsigned long)st.refused,
         (unsigned long)backend.readCount(),
         (unsigned long)backend.writeCount());
    return 0;
}
