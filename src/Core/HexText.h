#pragma once
/**
 * @file HexText.h
 * @brief Text forms of addresses and byte strings used by the HTTP API.
 */

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace HexText {

/** "0x3B", "0X3b" or "59" into a 16-bit value. Rejects empty, junk and overflow. */
bool parseU16(const char* text, uint16_t& out);

/**
 * @brief Contiguous hex digits into bytes ("01020a" -> 01 02 0a).
 *
 * An optional 0x prefix is accepted and an odd trailing digit is ignored.
 * Any non-hex character rejects the whole string.
 */
bool parseHexBytes(const char* text, std::vector<uint8_t>& out);

/** Bytes into contiguous lowercase hex ("01020a"). */
std::string toHexBytes(const uint8_t* data, size_t len);

/** Bytes into the "[0x01, 0x02]" list carried in JSON replies. */
std::string toByteList(const uint8_t* data, size_t len);

/**
 * @brief Parse a byte list back into bytes.
 *
 * Accepts "[0x01, 0x02]", "[01, 02]" and "[]"; brackets and 0x prefixes are
 * optional. Returns false on any entry that is not one hex byte.
 */
bool parseByteList(const char* text, std::vector<uint8_t>& out);

/** "0x003b" form of a register address. */
std::string toAddr(uint16_t address);

}  // namespace HexText
