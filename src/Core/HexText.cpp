/**
 * @file HexText.cpp
 * @brief Hex/decimal parsing and formatting helpers.
 */

#include "Core/HexText.h"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

namespace {

int hexNibble_(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool hasHexPrefix_(const char* s)
{
    return s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

}  // namespace

namespace HexText {

bool parseU16(const char* text, uint16_t& out)
{
    if (!text || text[0] == '\0') return false;

    uint32_t value = 0;
    if (hasHexPrefix_(text)) {
        const char* p = text + 2;
        if (*p == '\0') return false;
        for (; *p != '\0'; ++p) {
            const int v = hexNibble_(*p);
            if (v < 0) return false;
            value = (value << 4) | (uint32_t)v;
            if (value > 0xFFFFu) return false;
        }
    } else {
        for (const char* p = text; *p != '\0'; ++p) {
            if (!isdigit((unsigned char)*p)) return false;
            value = value * 10U + (uint32_t)(*p - '0');
            if (value > 0xFFFFu) return false;
        }
    }
    out = (uint16_t)value;
    return true;
}

bool parseHexBytes(const char* text, std::vector<uint8_t>& out)
{
    out.clear();
    if (!text) return false;
    if (hasHexPrefix_(text)) text += 2;

    const size_t len = strlen(text);
    for (size_t i = 0; i < len; ++i) {
        if (hexNibble_(text[i]) < 0) {
            out.clear();
            return false;
        }
    }

    out.reserve(len / 2);
    for (size_t i = 0; i + 1 < len; i += 2) {
        out.push_back((uint8_t)((hexNibble_(text[i]) << 4) | hexNibble_(text[i + 1])));
    }
    return true;
}

std::string toHexBytes(const uint8_t* data, size_t len)
{
    static const char kDigits[] = "0123456789abcdef";
    std::string s;
    s.reserve(len * 2);
    for (size_t i = 0; data && i < len; ++i) {
        s.push_back(kDigits[data[i] >> 4]);
        s.push_back(kDigits[data[i] & 0x0F]);
    }
    return s;
}

std::string toByteList(const uint8_t* data, size_t len)
{
    std::string s;
    s.reserve(2 + len * 6);
    s.push_back('[');
    char item[8];
    for (size_t i = 0; data && i < len; ++i) {
        snprintf(item, sizeof(item), i == 0 ? "0x%02x" : ", 0x%02x", (unsigned)data[i]);
        s += item;
    }
    s.push_back(']');
    return s;
}

bool parseByteList(const char* text, std::vector<uint8_t>& out)
{
    out.clear();
    if (!text) return false;

    const char* p = text;
    while (isspace((unsigned char)*p)) ++p;
    if (*p == '[') ++p;

    while (true) {
        while (isspace((unsigned char)*p)) ++p;
        if (*p == '\0' || *p == ']') break;

        if (hasHexPrefix_(p)) p += 2;
        int digits = 0;
        uint8_t value = 0;
        while (hexNibble_(*p) >= 0) {
            if (++digits > 2) {
                out.clear();
                return false;
            }
            value = (uint8_t)((value << 4) | (uint8_t)hexNibble_(*p));
            ++p;
        }
        if (digits == 0) {
            out.clear();
            return false;
        }
        out.push_back(value);

        while (isspace((unsigned char)*p)) ++p;
        if (*p == ',') {
            ++p;
            continue;
        }
        if (*p == ']' || *p == '\0') break;
        out.clear();
        return false;
    }
    return true;
}

std::string toAddr(uint16_t address)
{
    char buf[8];
    snprintf(buf, sizeof(buf), "0x%04x", (unsigned)address);
    return buf;
}

}  // namespace HexText
