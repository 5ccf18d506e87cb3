/*
 * Viewer Wire Protocol
 *
 * JSON text messages over the viewer WebSocket:
 *
 *   server -> client  {"type":"meta","viewport":{"width":W,"height":H},"url":U}
 *   server -> client  {"type":"frame","image":<base64>,"width":W,"height":H}
 *   client -> server  {"type":"event","name":"click","x_ratio":X,"y_ratio":Y}
 *                     {"type":"event","name":"key","key":K}
 *                     {"type":"event","name":"navigate","url":U}
 *                     {"type":"event","name":"wheel","deltaY":D,"clientHeight":H}
 */

#ifndef STREAM_PROTOCOL_H
#define STREAM_PROTOCOL_H

#include "frame.h"
#include <string>

namespace stream {

enum class ControlEventType {
    Click,
    Key,
    Navigate,
    Wheel,
};

// One inbound viewer action. Only the fields of its type are meaningful.
struct ControlEvent {
    ControlEventType type = ControlEventType::Click;

    double x_ratio = 0.0;        // Click, in [0,1]
    double y_ratio = 0.0;
    std::string value;           // Key value or Navigate URL
    double delta_y = 0.0;        // Wheel
    double client_height = 0.0;

    static ControlEvent click(double x_ratio, double y_ratio);
    static ControlEvent key(const std::string& value);
    static ControlEvent navigate(const std::string& url);
    static ControlEvent wheel(double delta_y, double client_height);
};

const char* event_name(ControlEventType type);

enum class ParseResult {
    Ok,
    Malformed,      // Not JSON or not an object
    NotAnEvent,     // "type" is not "event"
    UnknownName,    // "name" is missing or not one of the four
};

/**
 * Parse one client message into a control event
 *
 * Ratios are clamped to [0,1]; missing numeric fields default to 0.
 * @param error Reason when the result is not Ok
 */
ParseResult parse_client_message(const std::string& text, ControlEvent& out,
                                 std::string& error);

// Serialized once per broadcast
std::string make_frame_message(const Frame& frame);

std::string make_meta_message(const Viewport& viewport, const std::string& url);

} // namespace stream

#endif // STREAM_PROTOCOL_H
