/*
 * Base64 helpers
 *
 * Frames travel to browsers as base64 text inside JSON, and DevTools hands
 * screenshots back the same way. Both directions go through libwebsockets'
 * codec so the server has a single implementation.
 */

#ifndef BASE64_H
#define BASE64_H

#include <cstdint>
#include <string>
#include <vector>

namespace base64 {

std::string encode(const uint8_t* data, size_t len);
std::string encode(const std::vector<uint8_t>& data);

/**
 * Decode base64 text
 * @return false if the text is not valid base64
 */
bool decode(const std::string& text, std::vector<uint8_t>& out);

} // namespace base64

#endif // BASE64_H
