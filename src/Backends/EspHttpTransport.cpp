/**
 * @file EspHttpTransport.cpp
 */

#include "Backends/EspHttpTransport.h"

#include <HTTPClient.h>
#include <WiFi.h>

#define LOG_TAG "HttpCli"
#include "Core/ModuleLog.h"

bool EspHttpTransport::get(const std::string& url, int& statusOut, std::string& bodyOut)
{
    statusOut = 0;
    bodyOut.clear();

    WiFiClient client;
    HTTPClient http;
    http.setTimeout(timeoutMs_);
    if (!http.begin(client, url.c_str())) {
        LOGW("cannot open %s", url.c_str());
        return false;
    }

    const int code = http.GET();
    if (code <= 0) {
        LOGW("GET %s failed: %s", url.c_str(), HTTPClient::errorToString(code).c_str());
        http.end();
        return false;
    }

    statusOut = code;
    const String body = http.getString();
    bodyOut.assign(body.c_str(), body.length());
    http.end();
    return true;
}
