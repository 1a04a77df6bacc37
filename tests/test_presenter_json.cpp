#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/pipeline/Presenter.h"
#include "../src/core/JsonUtil.h"
#include <nlohmann/json.hpp>
#include <sstream>

namespace open_ports {

class PresenterJsonTest : public ::testing::Test {
protected:
    std::string render(const std::vector<UnifiedRecord>& rs) {
        std::ostringstream os;
        Presenter(OutputMode::Json, false).render(rs, os);
        return os.str();
    }
};

TEST_F(PresenterJsonTest, EmptyIsValid) {
    nlohmann::json parsed;
    ASSERT_NO_THROW(parsed = nlohmann::json::parse(render({})));
    EXPECT_EQ(parsed["count"], 0);
    EXPECT_TRUE(parsed["connections"].is_array());
    EXPECT_TRUE(parsed["generated_at"].is_string());
}

TEST_F(PresenterJsonTest, FieldsAndNulls) {
    UnifiedRecord listen;
    listen.protocol = Protocol::Tcp;
    listen.local = {"127.0.0.1", 8080};
    listen.state = ConnState::Listen;
    listen.pid = 100;
    listen.program = "nginx";

    UnifiedRecord peer;
    peer.protocol = Protocol::Udp6;
    peer.local = {"::1", 5353};
    peer.remote = Endpoint{"::1", 53};
    peer.remote_host = "localhost";
    peer.state = ConnState::Established;

    auto parsed = nlohmann::json::parse(render({listen, peer}));
    ASSERT_EQ(parsed["count"], 2);
    const auto& a = parsed["connections"][0];
    EXPECT_EQ(a["pid"], 100);
    EXPECT_EQ(a["program"], "nginx");
    EXPECT_EQ(a["proto"], "tcp");
    EXPECT_EQ(a["local_port"], 8080);
    EXPECT_TRUE(a["remote_address"].is_null());
    EXPECT_TRUE(a["remote_port"].is_null());
    EXPECT_EQ(a["state"], "LISTEN");

    const auto& b = parsed["connections"][1];
    EXPECT_TRUE(b["pid"].is_null());
    EXPECT_TRUE(b["program"].is_null());
    EXPECT_EQ(b["remote_address"], "::1");
    EXPECT_EQ(b["remote_port"], 53);
    EXPECT_EQ(b["remote_host"], "localhost");
}

TEST_F(PresenterJsonTest, EscapesProgramNames) {
    UnifiedRecord r;
    r.local = {"0.0.0.0", 1};
    r.program = std::string("we\"ird\\name\n\x01");
    auto parsed = nlohmann::json::parse(render({r}));
    EXPECT_EQ(parsed["connections"][0]["program"], "we\"ird\\name\n\x01");
}

TEST_F(PresenterJsonTest, IsoTimestamp) {
    auto epoch = std::chrono::system_clock::time_point{};
    EXPECT_EQ(jsonutil::time_to_iso(epoch), "1970-01-01T00:00:00Z");
}

} // namespace open_ports
