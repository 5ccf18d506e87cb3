/*
 * Viewer protocol tests
 */

#include "test_framework.h"
#include "stream/protocol.h"
#include "utils/base64.h"
#include "utils/json_utils.h"
#include <string>
#include <vector>

using stream::ControlEvent;
using stream::ControlEventType;
using stream::ParseResult;

static ParseResult parse(const std::string& text, ControlEvent& ev) {
    std::string error;
    return stream::parse_client_message(text, ev, error);
}

TEST(parses_click) {
    ControlEvent ev;
    ASSERT_TRUE(parse("{\"type\":\"event\",\"name\":\"click\",\"x_ratio\":0.25,\"y_ratio\":0.75}", ev) == ParseResult::Ok);
    ASSERT_TRUE(ev.type == ControlEventType::Click);
    ASSERT_NEAR(ev.x_ratio, 0.25, 1e-9);
    ASSERT_NEAR(ev.y_ratio, 0.75, 1e-9);
}

TEST(clamps_click_ratios) {
    ControlEvent ev;
    ASSERT_TRUE(parse("{\"type\":\"event\",\"name\":\"click\",\"x_ratio\":1.7,\"y_ratio\":-0.2}", ev) == ParseResult::Ok);
    ASSERT_NEAR(ev.x_ratio, 1.0, 1e-9);
    ASSERT_NEAR(ev.y_ratio, 0.0, 1e-9);
}

TEST(missing_numbers_default_to_zero) {
    ControlEvent ev;
    ASSERT_TRUE(parse("{\"type\":\"event\",\"name\":\"wheel\"}", ev) == ParseResult::Ok);
    ASSERT_TRUE(ev.type == ControlEventType::Wheel);
    ASSERT_NEAR(ev.delta_y, 0.0, 1e-9);
    ASSERT_NEAR(ev.client_height, 0.0, 1e-9);
}

TEST(parses_key_navigate_wheel) {
    ControlEvent ev;
    ASSERT_TRUE(parse("{\"type\":\"event\",\"name\":\"key\",\"key\":\"Enter\"}", ev) == ParseResult::Ok);
    ASSERT_TRUE(ev.type == ControlEventType::Key);
    ASSERT_EQ(ev.value, std::string("Enter"));

    ASSERT_TRUE(parse("{\"type\":\"event\",\"name\":\"navigate\",\"url\":\"example.org\"}", ev) == ParseResult::Ok);
    ASSERT_TRUE(ev.type == ControlEventType::Navigate);
    ASSERT_EQ(ev.value, std::string("example.org"));

    ASSERT_TRUE(parse("{\"type\":\"event\",\"name\":\"wheel\",\"deltaY\":-120,\"clientHeight\":480}", ev) == ParseResult::Ok);
    ASSERT_NEAR(ev.delta_y, -120.0, 1e-9);
    ASSERT_NEAR(ev.client_height, 480.0, 1e-9);
}

TEST(rejects_bad_messages) {
    ControlEvent ev;
    ASSERT_TRUE(parse("not json", ev) == ParseResult::Malformed);
    ASSERT_TRUE(parse("[1,2,3]", ev) == ParseResult::Malformed);
    ASSERT_TRUE(parse("{\"type\":\"ping\"}", ev) == ParseResult::NotAnEvent);
    ASSERT_TRUE(parse("{\"name\":\"click\"}", ev) == ParseResult::NotAnEvent);
    ASSERT_TRUE(parse("{\"type\":\"event\",\"name\":\"hover\"}", ev) == ParseResult::UnknownName);
    ASSERT_TRUE(parse("{\"type\":\"event\"}", ev) == ParseResult::UnknownName);
}

TEST(error_text_is_filled) {
    ControlEvent ev;
    std::string error;
    stream::parse_client_message("{\"type\":\"event\",\"name\":\"hover\"}", ev, error);
    ASSERT_TRUE(error.find("hover") != std::string::npos);
}

TEST(frame_message_layout) {
    stream::Frame frame;
    frame.image = {'h', 'i'};
    frame.width = 320;
    frame.height = 200;

    json_utils::json j = json_utils::parse(stream::make_frame_message(frame));
    ASSERT_EQ(json_utils::get_string(j, "type"), std::string("frame"));
    ASSERT_EQ(json_utils::get_string(j, "image"), std::string("aGk="));
    ASSERT_EQ(json_utils::get_int(j, "width"), 320);
    ASSERT_EQ(json_utils::get_int(j, "height"), 200);
}

TEST(meta_message_layout) {
    stream::Viewport vp;
    json_utils::json j = json_utils::parse(stream::make_meta_message(vp, ""));
    ASSERT_EQ(json_utils::get_string(j, "type"), std::string("meta"));
    ASSERT_EQ(json_utils::get_int(j["viewport"], "width"), 1280);
    ASSERT_EQ(json_utils::get_int(j["viewport"], "height"), 720);
    ASSERT_TRUE(j.contains("url"));
    ASSERT_EQ(json_utils::get_string(j, "url", "x"), std::string(""));
}

TEST(base64_decodes_what_it_encodes) {
    std::vector<uint8_t> bytes = {0x00, 0xFF, 0x10, 0x80, 0x7F};
    std::vector<uint8_t> out;
    ASSERT_TRUE(base64::decode(base64::encode(bytes), out));
    ASSERT_TRUE(out == bytes);
    ASSERT_EQ(base64::encode(std::vector<uint8_t>()), std::string(""));
}

int main() {
    return test_framework::run_all_tests("protocol");
}
