#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/pipeline/Pipeline.h"
#include "../src/pipeline/Presenter.h"
#include "../src/core/ConfigValidator.h"
#include "../src/core/Errors.h"
#include "../src/core/Logging.h"
#include <sstream>

namespace open_ports {

using ::testing::NiceMock;
using ::testing::Return;
using ::testing::_;

class MockSnapshotSource : public SnapshotSource {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(Snapshot, snapshot, (), (override));
};

class MockHostResolver : public HostResolver {
public:
    MOCK_METHOD(std::optional<std::string>, reverse_lookup, (const std::string&), (override));
};

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        source = std::make_shared<NiceMock<MockSnapshotSource>>();
        ON_CALL(*source, name()).WillByDefault(Return(std::string("mock")));
        ON_CALL(*source, snapshot()).WillByDefault(Return(two_sockets()));
    }

    // 127.0.0.1:8080 LISTEN nginx(100); 10.0.0.5:443 <-> 93.184.216.34:51000 curl(200)
    static Snapshot two_sockets() {
        Snapshot s;
        Connection l;
        l.protocol = Protocol::Tcp;
        l.local = {"127.0.0.1", 8080};
        l.state = ConnState::Listen;
        l.pid = 100;
        l.inode = 1;
        Connection e;
        e.protocol = Protocol::Tcp;
        e.local = {"10.0.0.5", 443};
        e.remote = Endpoint{"93.184.216.34", 51000};
        e.state = ConnState::Established;
        e.pid = 200;
        e.inode = 2;
        s.connections = {l, e};
        Process p1; p1.pid = 100; p1.name = "nginx";
        Process p2; p2.pid = 200; p2.name = "curl";
        s.processes = {p1, p2};
        return s;
    }

    std::shared_ptr<NiceMock<MockSnapshotSource>> source;
};

TEST_F(PipelineTest, ListeningOnlyScenario) {
    Config cfg;
    cfg.listening_only = true;
    ConfigValidator::validate(cfg);

    auto records = Pipeline(source).run(cfg);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].pid.value_or(0), 100);
    EXPECT_EQ(records[0].program.value_or(""), "nginx");
    EXPECT_EQ(records[0].state, ConnState::Listen);

    std::ostringstream os;
    Presenter(OutputMode::Bare, true).render(records, os);
    EXPECT_EQ(os.str(), "100\tnginx\ttcp\t127.0.0.1\t8080\t-\t-\tLISTEN\n");
}

TEST_F(PipelineTest, DefaultSortIsProgram) {
    Config cfg;
    ConfigValidator::validate(cfg);
    auto records = Pipeline(source).run(cfg);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].program.value_or(""), "curl");
    EXPECT_EQ(records[1].program.value_or(""), "nginx");
}

TEST_F(PipelineTest, SortByPort) {
    Config cfg;
    cfg.sort_by_port = true;
    ConfigValidator::validate(cfg);
    auto records = Pipeline(source).run(cfg);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].local.port, 443);
    EXPECT_EQ(records[1].local.port, 8080);
}

TEST_F(PipelineTest, DnsDisabledNeverLooksUp) {
    auto resolver = std::make_shared<MockHostResolver>();
    EXPECT_CALL(*resolver, reverse_lookup(_)).Times(0);

    Config cfg;
    ConfigValidator::validate(cfg);
    auto records = Pipeline(source, resolver).run(cfg);
    ASSERT_EQ(records.size(), 2u);
    for (const auto& r : records) EXPECT_FALSE(r.remote_host.has_value());
}

TEST_F(PipelineTest, InvalidRegexFailsBeforeEnumeration) {
    EXPECT_CALL(*source, snapshot()).Times(0);

    Config cfg;
    cfg.regex = "(unbalanced";
    EXPECT_THROW(ConfigValidator::validate(cfg), ConfigError);
    EXPECT_THROW(Pipeline(source).run(cfg), ConfigError);
}

TEST_F(PipelineTest, EnumerationFailurePropagates) {
    EXPECT_CALL(*source, snapshot()).WillOnce(::testing::Throw(EnumerationError("no tables")));
    Config cfg;
    ConfigValidator::validate(cfg);
    EXPECT_THROW(Pipeline(source).run(cfg), EnumerationError);
}

TEST_F(PipelineTest, RepeatedRunsAreIdentical) {
    Config cfg;
    ConfigValidator::validate(cfg);
    Pipeline pipeline(source);
    auto a = pipeline.run(cfg);
    auto b = pipeline.run(cfg);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) EXPECT_EQ(Presenter::bare_line(a[i]), Presenter::bare_line(b[i]));
}

TEST_F(PipelineTest, RegexOrListening) {
    Config cfg;
    cfg.regex = "44.";
    ConfigValidator::validate(cfg);
    auto records = Pipeline(source).run(cfg);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].program.value_or(""), "curl");

    cfg.listening_only = true;
    EXPECT_TRUE(Pipeline(source).run(cfg).empty());
}

} // namespace open_ports
