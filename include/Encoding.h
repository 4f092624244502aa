#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Encoding {
std::string base64Encode(const std::vector<uint8_t>& data);

/**
 * @brief Decodes padded standard-alphabet base64. Whitespace is not accepted.
 * @return false on any invalid character, bad padding or length.
 */
bool base64Decode(const std::string& text, std::vector<uint8_t>& out);

std::array<uint32_t, 5> sha1(const std::vector<uint8_t>& input);
std::string sha1Hex(const std::vector<uint8_t>& input);

/**
 * @brief Length of the well-formed UTF-8 sequence starting at text[pos], or 0 when it is not one.
 * @details Rejects overlong forms, surrogates and code points above U+10FFFF.
 */
size_t utf8SequenceLength(const std::string& text, size_t pos);

// Byte offset of the first invalid UTF-8 sequence, std::string::npos when the text is valid.
size_t findInvalidUtf8(const std::string& text);

// Replaces every byte that does not start a well-formed sequence with U+FFFD.
std::string toValidUtf8(const std::string& text);

// Escapes a string for inclusion between JSON double quotes; invalid UTF-8 becomes U+FFFD.
std::string jsonEscape(const std::string& v);
} // namespace Encoding
