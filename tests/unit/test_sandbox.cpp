#include <gtest/gtest.h>
#include "sandbox.h"
#include "language_registry.h"
#include "fake_engine.h"
#include <chrono>

namespace runbox {
namespace {

using namespace std::chrono_literals;

class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.drain_grace = 50ms;
        python = *registry.lookup("python");
        java = *registry.lookup("java");
    }

    JobResult run(const LanguageSpec& language, const std::string& input = "") {
        Sandbox sandbox(engine, config);
        return sandbox.execute("job-1", language, "/srv/temp/job-1", input);
    }

    // Runs a job that must fail and returns the failure phase
    ExecutionPhase run_failing(const LanguageSpec& language, const std::string& input = "") {
        try {
            run(language, input);
        } catch (const ExecutionError& e) {
            last_error = e.what();
            return e.phase();
        }
        ADD_FAILURE() << "execute should have thrown";
        return ExecutionPhase::INTERNAL;
    }

    test::FakeEngine engine;
    SandboxConfig config;
    LanguageRegistry registry;
    LanguageSpec python;
    LanguageSpec java;
    std::string last_error;
};

// ============================================================================
// Container description
// ============================================================================

TEST_F(SandboxTest, ContainerSpecMountsWorkspaceAndCapsResources) {
    Sandbox sandbox(engine);

    ContainerSpec spec = sandbox.make_container_spec(java, "/srv/temp/abc");

    EXPECT_EQ(spec.image, "openjdk:17");
    ASSERT_EQ(spec.command.size(), 3u);
    EXPECT_EQ(spec.command[0], "/bin/sh");
    EXPECT_EQ(spec.command[1], "-c");
    EXPECT_EQ(spec.command[2], "javac Main.java && java Main");
    EXPECT_EQ(spec.working_dir, "/app");
    ASSERT_EQ(spec.binds.size(), 1u);
    EXPECT_EQ(spec.binds[0], "/srv/temp/abc:/app");
    EXPECT_EQ(spec.memory_bytes, 1536LL * 1024 * 1024);
    EXPECT_EQ(spec.cpu_period_us, 100000);
    EXPECT_EQ(spec.cpu_quota_us, 150000);
    EXPECT_TRUE(spec.open_stdin);
}

// ============================================================================
// Normal termination
// ============================================================================

TEST_F(SandboxTest, CollectsDemultiplexedOutput) {
    // Given: A container printing to both streams and exiting 0
    engine.output = {"Hello, World!\n", "deprecated API\n"};

    // When: The job runs
    JobResult result = run(python);

    // Then: Streams are separated and the container is force-removed
    EXPECT_EQ(result.job_id, "job-1");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "Hello, World!\n");
    EXPECT_EQ(result.error, "deprecated API\n");
    EXPECT_EQ(engine.remove_calls.load(), 1);
    EXPECT_EQ(engine.forced_removals(), 1);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(SandboxTest, NonZeroExitIsReturnedNotThrown) {
    engine.output = {"", "Traceback: ZeroDivisionError\n"};
    engine.exit_code = 1;

    JobResult result = run(python);

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.error, "Traceback: ZeroDivisionError\n");
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(SandboxTest, InputIsWrittenThenStdinClosed) {
    engine.output = {"5\n", ""};

    JobResult result = run(python, "5\n");

    std::string id = engine.created().at(0);
    EXPECT_EQ(engine.stdin_of(id), "5\n");
    EXPECT_TRUE(engine.stdin_closed(id));
    EXPECT_EQ(result.output, "5\n");
}

TEST_F(SandboxTest, StdinClosedEvenWithoutInput) {
    run(python);

    std::string id = engine.created().at(0);
    EXPECT_EQ(engine.stdin_of(id), "");
    EXPECT_TRUE(engine.stdin_closed(id)) << "a program reading stdin must see EOF";
}

TEST_F(SandboxTest, WaitUsesLanguageDeadline) {
    LanguageSpec node = *registry.lookup("javascript");

    run(node);

    EXPECT_LE(engine.last_wait_timeout(), 60000ms);
    EXPECT_GT(engine.last_wait_timeout(), 59000ms);
}

TEST_F(SandboxTest, SlowInputConsumptionCountsAgainstDeadline) {
    // Given: A 1s deadline; the program takes 600ms to read its input and
    // would exit 600ms after that
    LanguageSpec quick = python;
    quick.timeout = 1s;
    engine.write_delay = 600ms;
    engine.wait_delay = 600ms;

    // When: The job runs
    auto start = std::chrono::steady_clock::now();
    ExecutionPhase phase = run_failing(quick, "slow input");
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Then: The wait only gets what is left of the deadline
    EXPECT_EQ(phase, ExecutionPhase::TIMEOUT);
    EXPECT_EQ(last_error, "Execution timed out after 1 seconds");
    EXPECT_LE(engine.last_wait_timeout(), 400ms);
    EXPECT_LT(elapsed, 1500ms);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(SandboxTest, InputThatUsesWholeDeadlineTimesOut) {
    LanguageSpec quick = python;
    quick.timeout = 1s;
    engine.write_delay = 2s;

    EXPECT_EQ(run_failing(quick, "never read"), ExecutionPhase::TIMEOUT);
    EXPECT_EQ(engine.wait_calls.load(), 0);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(SandboxTest, LingeringStreamIsClosedAfterGracePeriod) {
    // Given: The container exited but the channel never reports EOF
    engine.output = {"done\n", ""};
    engine.hang_stream = true;

    // When: The job runs with a short grace period
    auto start = std::chrono::steady_clock::now();
    JobResult result = run(python);

    // Then: Output produced before exit is kept and the call returns
    EXPECT_EQ(result.output, "done\n");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(SandboxTest, InvalidUtf8OutputIsReplaced) {
    // Given: A program printing bytes that are not UTF-8
    engine.output = {"ok\xff\xfe\n", "caf\xc3\xa9 \xe4\xb8"};

    JobResult result = run(python);

    // Then: Bad sequences become U+FFFD and valid text is untouched
    EXPECT_EQ(result.output, "ok\xef\xbf\xbd\xef\xbf\xbd\n");
    EXPECT_EQ(result.error, "caf\xc3\xa9 \xef\xbf\xbd");
}

TEST_F(SandboxTest, OutputIsCappedPerStream) {
    config.max_output_bytes = 8;
    engine.output = {"0123456789abcdef", "short"};

    JobResult result = run(python);

    EXPECT_EQ(result.output, "01234567");
    EXPECT_EQ(result.error, "short");
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(SandboxTest, RemovalFailureDoesNotMaskResult) {
    engine.output = {"ok\n", ""};
    engine.fail_remove = true;

    JobResult result = run(python);

    EXPECT_EQ(result.output, "ok\n");
    EXPECT_EQ(engine.remove_calls.load(), 1);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(SandboxTest, TimeoutCapturesDiagnosticsAndRemovesContainer) {
    // Given: A program that never exits
    engine.timeout_wait = true;
    engine.hang_stream = true;

    // When: The wait deadline passes
    ExecutionPhase phase = run_failing(python);

    // Then: Timeout is reported with the language deadline, state is logged, container is gone
    EXPECT_EQ(phase, ExecutionPhase::TIMEOUT);
    EXPECT_EQ(last_error, "Execution timed out after 15 seconds");
    EXPECT_EQ(engine.inspect_calls.load(), 1);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(SandboxTest, DiagnosticsFailureDoesNotMaskTimeout) {
    engine.timeout_wait = true;
    engine.fail_diagnostics = true;

    EXPECT_EQ(run_failing(python), ExecutionPhase::TIMEOUT);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(SandboxTest, CreateFailureLeavesNothingToRemove) {
    engine.fail_create = true;

    EXPECT_EQ(run_failing(python), ExecutionPhase::CREATE);
    EXPECT_NE(last_error.find("No such image"), std::string::npos);
    EXPECT_EQ(engine.remove_calls.load(), 0);
    EXPECT_EQ(engine.start_calls.load(), 0);
}

TEST_F(SandboxTest, StartFailureRemovesContainer) {
    engine.fail_start = true;

    EXPECT_EQ(run_failing(python), ExecutionPhase::START);
    EXPECT_EQ(engine.live_containers(), 0u);
    EXPECT_EQ(engine.attach_calls.load(), 0);
}

TEST_F(SandboxTest, AttachFailureRemovesContainer) {
    engine.fail_attach = true;

    EXPECT_EQ(run_failing(python), ExecutionPhase::ATTACH);
    EXPECT_EQ(engine.live_containers(), 0u);
    EXPECT_EQ(engine.wait_calls.load(), 0);
}

TEST_F(SandboxTest, InputFailureRemovesContainer) {
    engine.fail_input = true;

    EXPECT_EQ(run_failing(python, "data"), ExecutionPhase::INPUT);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST_F(SandboxTest, WaitFailureRemovesContainer) {
    engine.fail_wait = true;

    EXPECT_EQ(run_failing(python), ExecutionPhase::WAIT);
    EXPECT_EQ(engine.logs_calls.load(), 1);
    EXPECT_EQ(engine.live_containers(), 0u);
}

TEST(ExecutionPhaseTest, Names) {
    EXPECT_STREQ(phase_to_string(ExecutionPhase::ENGINE_UNAVAILABLE), "engine-unavailable");
    EXPECT_STREQ(phase_to_string(ExecutionPhase::TIMEOUT), "timeout");
    EXPECT_STREQ(phase_to_string(ExecutionPhase::CREATE), "create");
    EXPECT_STREQ(phase_to_string(ExecutionPhase::WAIT), "wait");
}

} // namespace
} // namespace runbox
