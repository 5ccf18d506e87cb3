/*
 * Base64 helpers (libwebsockets codec)
 */

#include "base64.h"
#include <libwebsockets.h>
#include <climits>

namespace base64 {

std::string encode(const uint8_t* data, size_t len) {
    if (len == 0) return std::string();
    if (len > static_cast<size_t>(INT_MAX / 2)) return std::string();

    // 4 output chars per 3 input bytes, plus terminator
    size_t out_size = ((len + 2) / 3) * 4 + 1;
    std::string out(out_size, '\0');

    int n = lws_b64_encode_string(reinterpret_cast<const char*>(data),
                                  static_cast<int>(len),
                                  &out[0], static_cast<int>(out_size));
    if (n < 0) return std::string();

    out.resize(static_cast<size_t>(n));
    return out;
}

std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

bool decode(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    if (text.empty()) return true;
    if (text.size() > static_cast<size_t>(INT_MAX)) return false;

    size_t out_size = (text.size() / 4) * 3 + 4;
    out.resize(out_size);

    int n = lws_b64_decode_string(text.c_str(),
                                  reinterpret_cast<char*>(out.data()),
                                  static_cast<int>(out_size));
    if (n < 0) {
        out.clear();
        return false;
    }

    out.resize(static_cast<size_t>(n));
    return true;
}

} // namespace base64
