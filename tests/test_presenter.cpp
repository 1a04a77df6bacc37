#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/pipeline/Presenter.h"
#include <algorithm>
#include <sstream>

namespace open_ports {

class PresenterTest : public ::testing::Test {
protected:
    void SetUp() override {
        UnifiedRecord l;
        l.protocol = Protocol::Tcp;
        l.local = {"127.0.0.1", 8080};
        l.state = ConnState::Listen;
        l.pid = 100;
        l.program = "nginx";

        UnifiedRecord e;
        e.protocol = Protocol::Tcp;
        e.local = {"10.0.0.5", 443};
        e.remote = Endpoint{"93.184.216.34", 51000};
        e.state = ConnState::Established;
        e.pid = 200;
        e.program = "curl";

        UnifiedRecord anon;
        anon.protocol = Protocol::Tcp6;
        anon.local = {"::1", 22};
        anon.state = ConnState::Listen;

        records = {l, e, anon};
    }

    std::string render(OutputMode mode, bool listening_only = false) {
        std::ostringstream os;
        Presenter(mode, listening_only).render(records, os);
        return os.str();
    }

    static std::vector<std::string> lines(const std::string& s) {
        std::vector<std::string> out;
        std::istringstream is(s);
        std::string line;
        while (std::getline(is, line)) out.push_back(line);
        return out;
    }

    std::vector<UnifiedRecord> records;
};

TEST_F(PresenterTest, BareLineLayout) {
    EXPECT_EQ(Presenter::bare_line(records[0]), "100\tnginx\ttcp\t127.0.0.1\t8080\t-\t-\tLISTEN");
    EXPECT_EQ(Presenter::bare_line(records[1]), "200\tcurl\ttcp\t10.0.0.5\t443\t93.184.216.34\t51000\tESTABLISHED");
    EXPECT_EQ(Presenter::bare_line(records[2]), "-\t-\ttcp6\t::1\t22\t-\t-\tLISTEN");
}

TEST_F(PresenterTest, BareHasFixedFieldCount) {
    records[1].remote_host = "example.com";
    auto out = lines(render(OutputMode::Bare));
    ASSERT_EQ(out.size(), records.size());
    for (const auto& l : out) {
        size_t fields = 1 + std::count(l.begin(), l.end(), '\t');
        EXPECT_EQ(fields, Presenter::kBareFieldCount) << l;
    }
    EXPECT_THAT(out[1], ::testing::HasSubstr("\texample.com\t51000\t"));
}

TEST_F(PresenterTest, ControlCharactersInNamesKeepBareShape) {
    records[0].program = std::string("a\tb\nc");
    records[1].remote_host = std::string("evil\rhost\x7f");
    auto out = lines(render(OutputMode::Bare));
    ASSERT_EQ(out.size(), records.size());
    for (const auto& l : out) {
        size_t fields = 1 + std::count(l.begin(), l.end(), '\t');
        EXPECT_EQ(fields, Presenter::kBareFieldCount) << l;
    }
    EXPECT_EQ(out[0], "100\ta?b?c\ttcp\t127.0.0.1\t8080\t-\t-\tLISTEN");
    EXPECT_THAT(out[1], ::testing::HasSubstr("\tevil?host?\t51000\t"));
}

TEST_F(PresenterTest, ControlCharactersInNamesKeepFullRowsWhole) {
    records[0].program = std::string("a\tb\nc");
    std::string full = render(OutputMode::Full);
    EXPECT_THAT(full, ::testing::HasSubstr("a?b?c"));
    EXPECT_EQ(full.find('\t'), std::string::npos);
    std::string clean = [this] {
        records[0].program = std::string("a?b?c");
        return render(OutputMode::Full);
    }();
    EXPECT_EQ(lines(full).size(), lines(clean).size());
}

TEST_F(PresenterTest, BareKeepsInputOrderWithoutHeaders) {
    auto out = lines(render(OutputMode::Bare));
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].substr(0, 3), "100");
    EXPECT_EQ(out[1].substr(0, 3), "200");
    EXPECT_EQ(out[2].substr(0, 1), "-");
}

TEST_F(PresenterTest, FullTableSections) {
    std::string out = render(OutputMode::Full);
    auto ls = lines(out);
    ASSERT_GE(ls.size(), 7u);
    EXPECT_THAT(ls[0], ::testing::HasSubstr("LISTENING ("));
    EXPECT_THAT(ls[1], ::testing::HasSubstr("PID"));
    EXPECT_THAT(ls[1], ::testing::HasSubstr("Program"));
    EXPECT_THAT(ls[1], ::testing::HasSubstr("Local Address:Port"));
    EXPECT_THAT(ls[1], ::testing::HasSubstr("Remote Address:Port"));
    EXPECT_THAT(ls[1], ::testing::HasSubstr("State"));
    EXPECT_EQ(ls[2].find_first_not_of('-'), std::string::npos);
    EXPECT_THAT(ls[3], ::testing::HasSubstr("nginx"));
    EXPECT_THAT(ls[4], ::testing::HasSubstr("<unknown>"));
    EXPECT_THAT(ls[4], ::testing::HasSubstr("[::1]:22"));
    EXPECT_THAT(out, ::testing::HasSubstr("NON-LISTENING ("));
    EXPECT_THAT(out, ::testing::HasSubstr("93.184.216.34:51000"));
    // header printed once
    EXPECT_EQ(out.find("Local Address:Port"), out.rfind("Local Address:Port"));
}

TEST_F(PresenterTest, FullColumnsAligned) {
    auto ls = lines(render(OutputMode::Full));
    size_t col = ls[1].find("Program");
    ASSERT_NE(col, std::string::npos);
    EXPECT_EQ(ls[3].find("nginx"), col);
    EXPECT_EQ(ls[4].find("<unknown>"), col);
}

TEST_F(PresenterTest, FullShowsResolvedHost) {
    records[1].remote_host = "example.com";
    EXPECT_THAT(render(OutputMode::Full), ::testing::HasSubstr("93.184.216.34:51000 (example.com)"));
}

TEST_F(PresenterTest, ListeningOnlyOmitsSecondSection) {
    EXPECT_THAT(render(OutputMode::Full, true), ::testing::Not(::testing::HasSubstr("NON-LISTENING")));
}

TEST_F(PresenterTest, EmptyResult) {
    records.clear();
    EXPECT_EQ(render(OutputMode::Full), "No matching connections.\n");
    EXPECT_EQ(render(OutputMode::Bare), "");
}

TEST_F(PresenterTest, EndpointText) {
    EXPECT_EQ(Presenter::endpoint_text({"127.0.0.1", 80}), "127.0.0.1:80");
    EXPECT_EQ(Presenter::endpoint_text({"fe80::1", 443}), "[fe80::1]:443");
    EXPECT_EQ(Presenter::endpoint_text({"1.2.3.4", 53}, std::string("dns.example")), "1.2.3.4:53 (dns.example)");
}

TEST_F(PresenterTest, BannerTimeFormat) {
    std::string t = Presenter::banner_time(std::chrono::system_clock::now());
    EXPECT_THAT(t, ::testing::MatchesRegex("[0-9]{2}\\.[0-9]{2}\\.[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2} \\([+-][0-9]{2}:[0-9]{2}\\)"));
}

} // namespace open_ports
