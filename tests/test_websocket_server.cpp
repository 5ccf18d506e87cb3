/*
 * WebSocket transport tests (no sockets required)
 */

#include "test_framework.h"
#include "websocket_server.h"
#include <string>

TEST(fragments_reassemble_up_to_limit) {
    std::string buffer;
    ASSERT_TRUE(ws::append_fragment(buffer, "{\"type\":", 8, 16));
    ASSERT_TRUE(ws::append_fragment(buffer, "\"event\"}", 8, 16));
    ASSERT_EQ(buffer, std::string("{\"type\":\"event\"}"));
}

TEST(endless_fragments_are_cut_off) {
    std::string chunk(64 * 1024, 'x');
    std::string buffer;

    size_t accepted = 0;
    while (ws::append_fragment(buffer, chunk.data(), chunk.size(), ws::MAX_MESSAGE_SIZE)) {
        accepted++;
        ASSERT_TRUE(accepted <= ws::MAX_MESSAGE_SIZE / chunk.size());
    }

    ASSERT_EQ(accepted, ws::MAX_MESSAGE_SIZE / chunk.size());
    ASSERT_TRUE(buffer.empty());
}

TEST(single_oversized_fragment_is_rejected) {
    std::string buffer("{");
    std::string big(ws::MAX_MESSAGE_SIZE + 1, 'y');
    ASSERT_FALSE(ws::append_fragment(buffer, big.data(), big.size(), ws::MAX_MESSAGE_SIZE));
    ASSERT_TRUE(buffer.empty());
}

int main() {
    return test_framework::run_all_tests("websocket transport");
}
