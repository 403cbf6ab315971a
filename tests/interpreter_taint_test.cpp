// Tainting is permanent for the process, so these checks live in their own executable
#include "vmexec/execution/embedded_interpreter.h"
#include "vmexec/execution/execution_engine.h"
#include "vmexec/execution/in_process_executor.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include <unistd.h>

using namespace vmexec;
using namespace std::chrono_literals;

namespace {

// Prints from a daemon thread every 50 ms for about a second
constexpr const char* CHATTY_THREAD =
    "import threading, time\n"
    "def chatter():\n"
    "    for _ in range(20):\n"
    "        print('from request A')\n"
    "        time.sleep(0.05)\n"
    "threading.Thread(target=chatter, daemon=True).start()\n";

} // namespace

TEST(InterpreterTaintTest, LeftoverThreadMovesLaterRequestsToChildProcess) {
    ASSERT_TRUE(EmbeddedInterpreter::instance().ensure_initialized().has_value());

    auto scratch = std::filesystem::temp_directory_path() / ("vmexec_taint_" + std::to_string(::getpid()));
    ExecutionConfig config;
    config.scratch_dir = scratch;
    config.timeout = 10s;
    auto engine = ExecutionEngine::create(config);

    auto first = engine->execute(CHATTY_THREAD);
    EXPECT_TRUE(first.success);
    EXPECT_NE(first.stdout_text.find("from request A"), std::string::npos);
    EXPECT_TRUE(EmbeddedInterpreter::instance().tainted());

    auto second = engine->execute("import time\ntime.sleep(0.3)\nprint('B')");
    EXPECT_EQ(second.stdout_text, "B\n");
    EXPECT_EQ(second.stderr_text, "");
    EXPECT_TRUE(second.success);
    EXPECT_EQ(engine->get_metrics().fallbacks, 1u);

    InProcessExecutor executor(true);
    auto refused = executor.run("print('never')");
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().kind, ExecutionError::Kind::UNAVAILABLE);

    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
}
