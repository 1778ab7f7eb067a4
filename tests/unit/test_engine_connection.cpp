#include <gtest/gtest.h>
#include "engine_connection.h"
#include "fake_engine.h"
#include <vector>

namespace runbox {
namespace {

using namespace std::chrono_literals;

class EngineConnectionTest : public ::testing::Test {
protected:
    // Records requested delays instead of sleeping
    Sleeper recording_sleeper() {
        return [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); };
    }

    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(EngineConnectionTest, ConnectsOnFirstAttempt) {
    test::FakeEngine engine;

    ConnectResult result = connect_with_retry(engine, 5, 2000ms, recording_sleeper());

    EXPECT_TRUE(result.connected);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(EngineConnectionTest, RetriesUntilDaemonAnswers) {
    // Given: A daemon that comes up on the third ping
    test::FakeEngine engine;
    engine.ping_failures = 2;

    // When: Connecting with the default budget
    ConnectResult result = connect_with_retry(engine, 5, 2000ms, recording_sleeper());

    // Then: Two 2s pauses, three attempts
    EXPECT_TRUE(result.connected);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(engine.ping_calls.load(), 3);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], 2000ms);
    EXPECT_TRUE(result.last_error.empty());
}

TEST_F(EngineConnectionTest, GivesUpAfterMaxAttemptsWithoutTrailingSleep) {
    test::FakeEngine engine;
    engine.ping_failures = -1;

    ConnectResult result = connect_with_retry(engine, 5, 2000ms, recording_sleeper());

    EXPECT_FALSE(result.connected);
    EXPECT_EQ(result.attempts, 5);
    EXPECT_EQ(engine.ping_calls.load(), 5);
    EXPECT_EQ(sleeps.size(), 4u) << "no pause after the final attempt";
    EXPECT_NE(result.last_error.find("docker.sock"), std::string::npos);
}

TEST_F(EngineConnectionTest, StartsDisconnectedAndHidesClient) {
    EngineConnection connection(std::make_shared<test::FakeEngine>());

    EXPECT_EQ(connection.state(), ConnectionState::DISCONNECTED);
    EXPECT_FALSE(connection.is_connected());
    EXPECT_FALSE(connection.client());
}

TEST_F(EngineConnectionTest, EstablishMovesToConnected) {
    auto engine = std::make_shared<test::FakeEngine>();
    engine->ping_failures = 1;
    EngineConnection connection(engine);

    ConnectResult result = connection.establish(5, 10ms, recording_sleeper());

    EXPECT_TRUE(result.connected);
    EXPECT_EQ(connection.state(), ConnectionState::CONNECTED);
    EXPECT_EQ(connection.client().get(), engine.get());
}

TEST_F(EngineConnectionTest, EstablishMovesToFailed) {
    auto engine = std::make_shared<test::FakeEngine>();
    engine->ping_failures = -1;
    EngineConnection connection(engine);

    connection.establish(5, 10ms, recording_sleeper());

    EXPECT_EQ(connection.state(), ConnectionState::FAILED);
    EXPECT_FALSE(connection.client());
}

TEST_F(EngineConnectionTest, MissingClientFails) {
    EngineConnection connection(nullptr);

    ConnectResult result = connection.establish(5, 10ms, recording_sleeper());

    EXPECT_FALSE(result.connected);
    EXPECT_EQ(connection.state(), ConnectionState::FAILED);
}

TEST_F(EngineConnectionTest, StateNames) {
    EXPECT_STREQ(connection_state_to_string(ConnectionState::DISCONNECTED), "disconnected");
    EXPECT_STREQ(connection_state_to_string(ConnectionState::CONNECTING), "connecting");
    EXPECT_STREQ(connection_state_to_string(ConnectionState::CONNECTED), "connected");
    EXPECT_STREQ(connection_state_to_string(ConnectionState::FAILED), "failed");
}

} // namespace
} // namespace runbox
