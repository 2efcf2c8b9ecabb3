/**
 * @file ConfigNvs.cpp
 */

#include "Core/ConfigNvs.h"

#include <Preferences.h>
#include <string>

#include "Core/BridgeConfigJson.h"

#define LOG_TAG "CfgNvs"
#include "Core/ModuleLog.h"

namespace ConfigNvs {

bool load(BridgeConfig& cfg)
{
    Preferences prefs;
    if (!prefs.begin(Namespace, /*readOnly=*/true)) {
        LOGI("no stored config, using defaults");
        return false;
    }
    const String stored = prefs.getString(Key, "");
    prefs.end();
    if (stored.length() == 0) {
        LOGI("no stored config, using defaults");
        return false;
    }

    char err[96] = {0};
    const ErrorCode rc = BridgeConfigJson::apply(cfg, stored.c_str(), err, sizeof(err));
    if (rc != ErrorCode::Ok) {
        LOGE("stored config rejected (%s): %s", errorCodeStr(rc), err);
        return false;
    }
    LOGI("config loaded (%u bytes)", (unsigned)stored.length());
    return true;
}

bool save(const BridgeConfig& cfg)
{
    std::string json;
    if (!BridgeConfigJson::toJson(cfg, json, /*includeSecrets=*/true)) return false;

    Preferences prefs;
    if (!prefs.begin(Namespace, /*readOnly=*/false)) {
        LOGE("nvs open failed ns=%s", Namespace);
        return false;
    }
    const size_t written = prefs.putString(Key, json.c_str());
    prefs.end();
    if (written != json.size()) {
        LOGE("nvs write failed (%u/%u bytes)", (unsigned)written, (unsigned)json.size());
        return false;
    }
    LOGI("config saved (%u bytes)", (unsigned)written);
    return true;
}

bool erase()
{
    Preferences prefs;
    if (!prefs.begin(Namespace, /*readOnly=*/false)) return false;
    const bool ok = prefs.remove(Key);
    prefs.end();
    return ok;
}

}  // namespace ConfigNvs
