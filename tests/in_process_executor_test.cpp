#include "vmexec/execution/embedded_interpreter.h"
#include "vmexec/execution/in_process_executor.h"

#include <gtest/gtest.h>

using namespace vmexec;

namespace {

ExecutionResult run_ok(InProcessExecutor& executor, const std::string& code) {
    auto result = executor.run(code);
    EXPECT_TRUE(result.has_value()) << (result ? "" : result.error().to_string());
    return result ? *result : ExecutionResult::failure("unavailable");
}

} // namespace

class InProcessExecutorTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        auto ready = EmbeddedInterpreter::instance().ensure_initialized();
        ASSERT_TRUE(ready.has_value()) << ready.error().to_string();
    }

    InProcessExecutor executor_{true};
};

TEST_F(InProcessExecutorTest, CapturesStdout) {
    auto result = run_ok(executor_, "print('hello')");
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.success);
}

TEST_F(InProcessExecutorTest, CapturesStderrSeparately) {
    auto result = run_ok(executor_, "import sys\nprint('out')\nprint('err', file=sys.stderr)");
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_TRUE(result.success);
}

TEST_F(InProcessExecutorTest, EmptyCodeSucceeds) {
    auto result = run_ok(executor_, "");
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_TRUE(result.success);
}

TEST_F(InProcessExecutorTest, ExceptionKeepsOutputSoFar) {
    auto result = run_ok(executor_, "print('before')\n1/0\nprint('after')");
    EXPECT_EQ(result.stdout_text, "before\n");
    EXPECT_EQ(result.stderr_text, "\nExecution error: ZeroDivisionError: division by zero");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.success);
}

TEST_F(InProcessExecutorTest, SyntaxErrorIsUserFailure) {
    auto result = run_ok(executor_, "def broken(:\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.stderr_text.find("Execution error: SyntaxError"), std::string::npos);
}

TEST_F(InProcessExecutorTest, NamespaceDoesNotLeakBetweenRuns) {
    run_ok(executor_, "leaked_value = 42");
    auto result = run_ok(executor_, "print(leaked_value)");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.stderr_text.find("NameError"), std::string::npos);
}

TEST_F(InProcessExecutorTest, RunsAsMainModule) {
    auto result = run_ok(executor_,
                         "def double(x):\n"
                         "    return factor * x\n"
                         "factor = 2\n"
                         "if __name__ == '__main__':\n"
                         "    print(double(21))\n");
    EXPECT_EQ(result.stdout_text, "42\n");
}

TEST_F(InProcessExecutorTest, SystemExitCodes) {
    auto clean = run_ok(executor_, "import sys\nprint('bye')\nsys.exit()");
    EXPECT_EQ(clean.stdout_text, "bye\n");
    EXPECT_EQ(clean.exit_code, 0);
    EXPECT_TRUE(clean.success);

    auto numbered = run_ok(executor_, "raise SystemExit(3)");
    EXPECT_EQ(numbered.exit_code, 3);
    EXPECT_FALSE(numbered.success);

    auto message = run_ok(executor_, "import sys\nsys.exit('fatal problem')");
    EXPECT_EQ(message.exit_code, 1);
    EXPECT_EQ(message.stderr_text, "fatal problem\n");
}

TEST_F(InProcessExecutorTest, SystemExitCodeIsTruncatedLikeProcessStatus) {
    auto wrapped = run_ok(executor_, "import sys\nsys.exit(256)");
    EXPECT_EQ(wrapped.exit_code, 0);
    EXPECT_TRUE(wrapped.success);

    auto negative = run_ok(executor_, "import sys\nsys.exit(-1)");
    EXPECT_EQ(negative.exit_code, 255);
    EXPECT_FALSE(negative.success);

    auto large = run_ok(executor_, "raise SystemExit(258)");
    EXPECT_EQ(large.exit_code, 2);
}

TEST_F(InProcessExecutorTest, BuiltinsChangesAreUndone) {
    run_ok(executor_,
           "import builtins\n"
           "builtins.len = lambda x: 99\n"
           "builtins.injected_helper = 'left behind'\n"
           "del builtins.abs\n");

    auto result = run_ok(executor_,
                         "import builtins\n"
                         "print(len('ab'), abs(-3), hasattr(builtins, 'injected_helper'))");
    EXPECT_EQ(result.stdout_text, "2 3 False\n");
    EXPECT_FALSE(EmbeddedInterpreter::instance().tainted());
}

TEST_F(InProcessExecutorTest, JoinedThreadsKeepInterpreterUsable) {
    auto result = run_ok(executor_,
                         "import threading\n"
                         "worker = threading.Thread(target=print, args=('from worker',))\n"
                         "worker.start()\n"
                         "worker.join()\n");
    EXPECT_EQ(result.stdout_text, "from worker\n");
    EXPECT_FALSE(EmbeddedInterpreter::instance().tainted());

    auto next = run_ok(executor_, "print('next')");
    EXPECT_EQ(next.stdout_text, "next\n");
}

TEST_F(InProcessExecutorTest, ThreadFinishingRightAfterTheCodeIsTolerated) {
    auto result = run_ok(executor_,
                         "import threading\n"
                         "threading.Thread(target=print, args=('late',)).start()\n");
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(EmbeddedInterpreter::instance().tainted());
}

TEST_F(InProcessExecutorTest, StdinIsEmpty) {
    auto result = run_ok(executor_, "input()");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.stderr_text.find("EOFError"), std::string::npos);
}

TEST_F(InProcessExecutorTest, UserStreamReplacementIsUndone) {
    run_ok(executor_, "import sys, io\nsys.stdout = io.StringIO()\nprint('swallowed')");
    auto result = run_ok(executor_, "print('visible')");
    EXPECT_EQ(result.stdout_text, "visible\n");
}

TEST_F(InProcessExecutorTest, NullBytesAreRejected) {
    auto result = run_ok(executor_, std::string("print(1)\0print(2)", 17));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.stderr_text.find("null bytes"), std::string::npos);
}

TEST(InProcessExecutorDisabledTest, ReportsUnavailable) {
    InProcessExecutor executor(false);
    auto result = executor.run("print('never')");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ExecutionError::Kind::UNAVAILABLE);
    EXPECT_EQ(executor.name(), "in_process");
}
