/*
 * Frame and Viewport
 *
 * A Frame is the latest compressed snapshot of the page. Nothing keeps
 * history; each capture replaces the previous one.
 */

#ifndef STREAM_FRAME_H
#define STREAM_FRAME_H

#include <cstdint>
#include <string>
#include <vector>

namespace stream {

struct Viewport {
    int width = 1280;
    int height = 720;
};

struct Frame {
    std::vector<uint8_t> image;          // Compressed image bytes
    std::string mime = "image/jpeg";
    int width = 0;
    int height = 0;
};

} // namespace stream

#endif // STREAM_FRAME_H
