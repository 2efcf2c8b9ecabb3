/**
 * @file HostOptions.cpp
 */

#include "Host/HostOptions.h"

#include <ArduinoJson.h>
#include <fstream>
#include <getopt.h>
#include <sstream>
#include <stdio.h>
#include <stdlib.h>
#include <string>

#include "Core/BridgeConfigJson.h"

namespace {

enum OptionId : int {
    OptConfig = 'c',
    OptPort = 'p',
    OptBackend = 'b',
    OptLogLevel = 'l',
    OptHelp = 'h',
    OptBind = 1000,
    OptResync,
    OptReadPadding,
    OptFailureReply,
    OptBufferSize,
    OptMaxClients,
    OptMockFill
};

const option kLongOptions[] = {
    {"config", required_argument, nullptr, OptConfig},
    {"port", required_argument, nullptr, OptPort},
    {"bind", required_argument, nullptr, OptBind},
    {"backend", required_argument, nullptr, OptBackend},
    {"resync", required_argument, nullptr, OptResync},
    {"read-padding", required_argument, nullptr, OptReadPadding},
    {"failure-reply", required_argument, nullptr, OptFailureReply},
    {"buffer-size", required_argument, nullptr, OptBufferSize},
    {"max-clients", required_argument, nullptr, OptMaxClients},
    {"mock-fill", required_argument, nullptr, OptMockFill},
    {"log-level", required_argument, nullptr, OptLogLevel},
    {"help", no_argument, nullptr, OptHelp},
    {nullptr, 0, nullptr, 0}
};

bool fail_(char* err, size_t errLen, const char* fmt, const char* arg)
{
    if (err && errLen > 0) snprintf(err, errLen, fmt, arg);
    return false;
}

bool parseNumber_(const char* text, unsigned long& out)
{
    if (!text || *text == '\0') return false;
    char* end = nullptr;
    out = strtoul(text, &end, 0);
    return end && *end == '\0';
}

bool readFile_(const char* path, std::string& out)
{
    std::ifstream in(path);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

}  // namespace

void hostDefaults(BridgeConfig& cfg)
{
    cfg.backend = BackendKind::Mock;
    cfg.maxClients = 0;
}

bool parseHostOptions(int argc, char** argv, HostOptions& out, char* err, size_t errLen)
{
    hostDefaults(out.config);

    const char* configPath = nullptr;
    StaticJsonDocument<512> overrides;

    optind = 0;  // glibc: full rescan, parseHostOptions may run more than once
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "c:p:b:l:h", kLongOptions, nullptr)) != -1) {
        unsigned long n = 0;
        switch (opt) {
        case OptConfig: configPath = optarg; break;
        case OptBind:
            if (snprintf(out.bindAddress, sizeof(out.bindAddress), "%s", optarg) >= (int)sizeof(out.bindAddress)) {
                return fail_(err, errLen, "bind address too long: %s", optarg);
            }
            break;
        case OptPort:
            if (!parseNumber_(optarg, n)) return fail_(err, errLen, "invalid port: %s", optarg);
            overrides["tcp_port"] = n;
            break;
        case OptBufferSize:
            if (!parseNumber_(optarg, n)) return fail_(err, errLen, "invalid buffer size: %s", optarg);
            overrides["buffer_size"] = n;
            break;
        case OptMaxClients:
            if (!parseNumber_(optarg, n)) return fail_(err, errLen, "invalid client count: %s", optarg);
            overrides["max_clients"] = n;
            break;
        case OptMockFill:
            if (!parseNumber_(optarg, n)) return fail_(err, errLen, "invalid fill byte: %s", optarg);
            overrides["mock_fill"] = n;
            break;
        case OptBackend: overrides["backend"] = (const char*)optarg; break;
        case OptResync: overrides["resync"] = (const char*)optarg; break;
        case OptReadPadding: overrides["read_padding"] = (const char*)optarg; break;
        case OptFailureReply: overrides["failure_reply"] = (const char*)optarg; break;
        case OptLogLevel: overrides["log_level"] = (const char*)optarg; break;
        case OptHelp: out.showHelp = true; return true;
        default:
            return fail_(err, errLen, "unknown or incomplete option %s", argv[optind - 1]);
        }
    }
    if (optind < argc) return fail_(err, errLen, "unexpected argument %s", argv[optind]);

    if (configPath) {
        std::string text;
        if (!readFile_(configPath, text)) return fail_(err, errLen, "cannot read %s", configPath);
        if (BridgeConfigJson::apply(out.config, text.c_str(), err, errLen) != ErrorCode::Ok) return false;
    }

    if (overrides.size() > 0) {
        std::string text;
        serializeJson(overrides, text);
        if (BridgeConfigJson::apply(out.config, text.c_str(), err, errLen) != ErrorCode::Ok) return false;
    }

    if (out.config.backend != BackendKind::Mock) {
        return fail_(err, errLen, "backend %s is only available on the device", backendKindStr(out.config.backend));
    }
    return true;
}

void printHostUsage(const char* prog)
{
    printf("usage: %s [options]\n"
           "  -c, --config FILE          JSON configuration, applied before other options\n"
           "  -p, --port N               TCP port (default 8086, 0 = ephemeral)\n"
           "      --bind ADDR            listen address (default 0.0.0.0)\n"
           "  -b, --backend NAME         mock\n"
           "      --resync POLICY        drop_byte | drop_buffer\n"
           "      --read-padding POLICY  skip | frame\n"
           "      --failure-reply MODE   log | response\n"
           "      --buffer-size N        per-connection receive buffer\n"
           "      --max-clients N        concurrent sessions (0 = unlimited)\n"
           "      --mock-fill N          byte returned by mock reads (default 12)\n"
           "  -l, --log-level LEVEL      error | warn | info | debug\n"
           "  -h, --help\n",
           prog);
}
