#pragma once
/**
 * @file BridgeConfigJson.h
 * @brief JSON form of BridgeConfig (NVS blob, --config file, GET /config).
 */

#include <stddef.h>
#include <string>

#include "Core/BridgeConfig.h"
#include "Core/ErrorCodes.h"

namespace BridgeConfigJson {

/** Stands in for wifi_pass in public dumps; applying it keeps the stored value. */
constexpr const char* MaskedSecret = "********";

/**
 * @brief Patch cfg with the keys present in json.
 *
 * Unknown keys are ignored. The patch is all-or-nothing: on any bad value
 * cfg is left untouched and err names the offending key. A wifi_pass equal
 * to MaskedSecret leaves the password unchanged, so a dump from toJson can
 * be edited and posted back.
 */
ErrorCode apply(BridgeConfig& cfg, const char* json, char* err, size_t errLen);

/** Serialize every key. wifi_pass is masked unless includeSecrets is set. */
bool toJson(const BridgeConfig& cfg, std::string& out, bool includeSecrets = false);

}  // namespace BridgeConfigJson
