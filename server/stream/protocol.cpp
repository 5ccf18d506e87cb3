/*
 * Viewer Wire Protocol Implementation
 */

#include "protocol.h"
#include "../utils/base64.h"
#include "../utils/json_utils.h"
#include <algorithm>

namespace stream {

ControlEvent ControlEvent::click(double x_ratio, double y_ratio) {
    ControlEvent ev;
    ev.type = ControlEventType::Click;
    ev.x_ratio = x_ratio;
    ev.y_ratio = y_ratio;
    return ev;
}

ControlEvent ControlEvent::key(const std::string& value) {
    ControlEvent ev;
    ev.type = ControlEventType::Key;
    ev.value = value;
    return ev;
}

ControlEvent ControlEvent::navigate(const std::string& url) {
    ControlEvent ev;
    ev.type = ControlEventType::Navigate;
    ev.value = url;
    return ev;
}

ControlEvent ControlEvent::wheel(double delta_y, double client_height) {
    ControlEvent ev;
    ev.type = ControlEventType::Wheel;
    ev.delta_y = delta_y;
    ev.client_height = client_height;
    return ev;
}

const char* event_name(ControlEventType type) {
    switch (type) {
        case ControlEventType::Click:    return "click";
        case ControlEventType::Key:      return "key";
        case ControlEventType::Navigate: return "navigate";
        case ControlEventType::Wheel:    return "wheel";
    }
    return "unknown";
}

static double clamp_ratio(double v) {
    return std::min(1.0, std::max(0.0, v));
}

ParseResult parse_client_message(const std::string& text, ControlEvent& out,
                                 std::string& error) {
    json_utils::json j;
    if (!json_utils::try_parse(text, j, error)) {
        return ParseResult::Malformed;
    }
    if (!j.is_object()) {
        error = "message is not a JSON object";
        return ParseResult::Malformed;
    }

    std::string type = json_utils::get_string(j, "type");
    if (type != "event") {
        error = "unsupported message type '" + type + "'";
        return ParseResult::NotAnEvent;
    }

    std::string name = json_utils::get_string(j, "name");
    if (name == "click") {
        out = ControlEvent::click(clamp_ratio(json_utils::get_double(j, "x_ratio")),
                                  clamp_ratio(json_utils::get_double(j, "y_ratio")));
    } else if (name == "key") {
        out = ControlEvent::key(json_utils::get_string(j, "key"));
    } else if (name == "navigate") {
        out = ControlEvent::navigate(json_utils::get_string(j, "url"));
    } else if (name == "wheel") {
        out = ControlEvent::wheel(json_utils::get_double(j, "deltaY"),
                                  json_utils::get_double(j, "clientHeight"));
    } else {
        error = "unknown event name '" + name + "'";
        return ParseResult::UnknownName;
    }

    return ParseResult::Ok;
}

std::string make_frame_message(const Frame& frame) {
    json_utils::json j;
    j["type"] = "frame";
    j["image"] = base64::encode(frame.image);
    j["width"] = frame.width;
    j["height"] = frame.height;
    return json_utils::to_string(j);
}

std::string make_meta_message(const Viewport& viewport, const std::string& url) {
    json_utils::json j;
    j["type"] = "meta";
    j["viewport"]["width"] = viewport.width;
    j["viewport"]["height"] = viewport.height;
    j["url"] = url;
    return json_utils::to_string(j);
}

} // namespace stream
