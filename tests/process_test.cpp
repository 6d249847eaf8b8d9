#include <cargo_loader/process/process.h>

#include "test_util.h"

#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <format>
#include <fstream>
#include <thread>

#include <signal.h>

using namespace std::chrono_literals;

static process::command_t sh(const std::string& script) {
    process::command_t command { .program = "sh" };
    command.arg("-c").arg(script);
    return command;
}

// Gone, or a zombie left for init to reap
static bool wait_until_dead(pid_t pid, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (::kill(pid, 0) == -1 && errno == ESRCH) {
            return true;
        }

        std::ifstream stat(std::format("/proc/{}/stat", pid));
        std::string line;
        if (std::getline(stat, line)) {
            const auto close_paren = line.rfind(')');
            if (close_paren != std::string::npos && close_paren + 2 < line.size() && line[close_paren + 2] == 'Z') {
                return true;
            }
        }

        std::this_thread::sleep_for(10ms);
    }

    return false;
}

TEST(ProcessTest, CapturesStdoutBytes) {
    const auto output = process::run(sh("printf 'a\\nb\\n'; printf 'c'"));
    EXPECT_TRUE(output.success());
    EXPECT_EQ(output.stdout_bytes, "a\nb\nc");
    EXPECT_TRUE(output.stderr_bytes.empty());
}

TEST(ProcessTest, CapturesLargeOutput) {
    const auto output = process::run(sh("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"));
    EXPECT_TRUE(output.success());
    EXPECT_EQ(output.stdout_bytes.size(), 20000u * 11u);
}

TEST(ProcessTest, ReportsExitCode) {
    const auto output = process::run(sh("echo partial; exit 3"));
    EXPECT_FALSE(output.success());
    EXPECT_EQ(output.exit_code, 3);
    EXPECT_EQ(output.stdout_bytes, "partial\n");
}

TEST(ProcessTest, ReportsTerminatingSignalAsNegative) {
    const auto output = process::run(sh("kill -TERM $$"));
    EXPECT_FALSE(output.success());
    EXPECT_EQ(output.exit_code, -SIGTERM);
}

TEST(ProcessTest, CapturesStderrSeparately) {
    auto command = sh("echo out; echo err 1>&2");
    command.stderr_mode = process::stderr_mode_t::CAPTURE;

    const auto output = process::run(command);
    EXPECT_EQ(output.stdout_bytes, "out\n");
    EXPECT_EQ(output.stderr_bytes, "err\n");
}

TEST(ProcessTest, DiscardsStderr) {
    auto command = sh("echo err 1>&2; echo out");
    command.stderr_mode = process::stderr_mode_t::DISCARD;

    const auto output = process::run(command);
    EXPECT_EQ(output.stdout_bytes, "out\n");
    EXPECT_TRUE(output.stderr_bytes.empty());
}

TEST(ProcessTest, StdinIsEmpty) {
    const auto output = process::run(sh("cat; echo done"));
    EXPECT_EQ(output.stdout_bytes, "done\n");
}

TEST(ProcessTest, AppliesEnvironmentOverrides) {
    test_util::scoped_env_t inherited("CARGO_LOADER_TEST_INHERITED", "parent");
    test_util::scoped_env_t overridden("CARGO_LOADER_TEST_OVERRIDDEN", "parent");

    auto command = sh("echo \"$CARGO_LOADER_TEST_INHERITED $CARGO_LOADER_TEST_OVERRIDDEN $CARGO_LOADER_TEST_NEW\"");
    command.set_env("CARGO_LOADER_TEST_OVERRIDDEN", "first");
    command.set_env("CARGO_LOADER_TEST_OVERRIDDEN", "child");
    command.set_env("CARGO_LOADER_TEST_NEW", "new");

    const auto output = process::run(command);
    EXPECT_EQ(output.stdout_bytes, "parent child new\n");
}

TEST(ProcessTest, RejectsInvalidEnvironmentName) {
    auto command = sh("true");
    command.set_env("A=B", "c");

    EXPECT_THROW(process::run(command), std::runtime_error);
}

TEST(ProcessTest, RunsInWorkingDirectory) {
    test_util::temp_dir_t dir;

    auto command = sh("pwd -P");
    command.working_dir = filesystem::path_t(dir.path());

    const auto output = process::run(command);
    EXPECT_EQ(output.stdout_bytes, dir.path().string() + "\n");
}

TEST(ProcessTest, PassesPathArguments) {
    test_util::temp_dir_t dir;
    const auto file = test_util::write_file(dir.path() / "input.txt", "content");

    process::command_t command { .program = "cat" };
    command.arg(filesystem::path_t(file));

    EXPECT_EQ(process::run(command).stdout_bytes, "content");
}

TEST(ProcessTest, MissingProgramOnPathIsLaunchError) {
    process::command_t command { .program = "cargo-loader-test-no-such-program" };
    EXPECT_THROW(process::run(command), process::launch_error_t);
}

TEST(ProcessTest, MissingProgramPathIsLaunchError) {
    process::command_t command { .program = "/nonexistent/cargo-loader-test/cargo" };
    EXPECT_THROW(process::run(command), process::launch_error_t);
}

TEST(ProcessTest, NonExecutableProgramIsLaunchError) {
    test_util::temp_dir_t dir;
    const auto file = test_util::write_file(dir.path() / "not_executable", "#!/bin/sh\nexit 0\n");

    process::command_t command { .program = file.string() };
    EXPECT_THROW(process::run(command), process::launch_error_t);
}

TEST(ProcessTest, MissingWorkingDirectoryIsLaunchError) {
    test_util::temp_dir_t dir;

    auto command = sh("true");
    command.working_dir = filesystem::path_t(dir.path() / "missing");

    try {
        process::run(command);
        FAIL() << "expected launch_error_t";
    } catch (const process::launch_error_t& e) {
        EXPECT_NE(std::string(e.what()).find("working directory"), std::string::npos) << e.what();
    }
}

TEST(ProcessTest, FindsProgramOnOverriddenPath) {
    test_util::temp_dir_t dir;
    test_util::write_script(dir.path() / "cargo-loader-test-tool", "echo found\n");

    process::command_t command { .program = "cargo-loader-test-tool" };
    command.set_env("PATH", dir.path().string() + ":/usr/bin:/bin");

    EXPECT_EQ(process::run(command).stdout_bytes, "found\n");
}

TEST(ProcessTest, TimeoutKillsChild) {
    auto command = sh("echo started; sleep 10");
    command.timeout = 200ms;

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(process::run(command), process::timeout_error_t);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(ProcessTest, TimeoutKillsGrandchildren) {
    test_util::temp_dir_t dir;
    const auto pid_file = dir.path() / "grandchild.pid";

    auto command = sh(std::format("sleep 30 & echo $! > '{}'; wait", pid_file.string()));
    command.timeout = 300ms;

    EXPECT_THROW(process::run(command), process::timeout_error_t);

    const auto pid_text = test_util::read_file(pid_file);
    ASSERT_FALSE(pid_text.empty());
    const auto grandchild = static_cast<pid_t>(std::stol(pid_text));
    EXPECT_TRUE(wait_until_dead(grandchild, 5s));
}

TEST(ProcessTest, TimeoutAppliesAfterStdoutIsClosed) {
    auto command = sh("exec >&-; sleep 10");
    command.timeout = 200ms;

    EXPECT_THROW(process::run(command), process::timeout_error_t);
}

TEST(ProcessTest, HugeTimeoutStillWaitsForChild) {
    for (const auto timeout : { std::chrono::milliseconds(std::chrono::hours(24 * 30)), std::chrono::milliseconds::max() }) {
        auto command = sh("sleep 0.2; echo late");
        command.timeout = timeout;

        const auto output = process::run(command);
        EXPECT_TRUE(output.success());
        EXPECT_EQ(output.stdout_bytes, "late\n");
    }
}

TEST(ProcessTest, FinishesWithinTimeout) {
    auto command = sh("echo quick");
    command.timeout = 5s;

    const auto output = process::run(command);
    EXPECT_TRUE(output.success());
    EXPECT_EQ(output.stdout_bytes, "quick\n");
}

TEST(ProcessTest, ToStringRendersCommandLine) {
    auto command = sh("true");
    command.set_env("KEY", "value");

    EXPECT_EQ(process::to_string(command), "KEY=value sh -c true");
}
