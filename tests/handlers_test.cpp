#include "handlers/handlers.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>

using namespace vmexec;
using namespace std::chrono_literals;

namespace {

// Echoes the code back as stdout; "fail" produces a user-code failure
class EchoExecutor : public ICodeExecutor {
public:
    std::expected<ExecutionResult, ExecutionError> run(const std::string& code) override {
        ++calls;
        if (code == "fail") {
            return ExecutionResult("", "\nExecution error: RuntimeError: fail", 1);
        }
        return ExecutionResult(code, "", 0);
    }
    std::string_view name() const override { return "echo"; }

    std::atomic<int> calls{0};
};

class HandlersTest : public ::testing::Test {
protected:
    HandlersTest()
        : executor_(std::make_shared<EchoExecutor>())
        , engine_(nullptr, executor_)
        , lifecycle_(10ms, [counter = terminations_] { ++*counter; }) {
        handlers::register_routes(router_, engine_, lifecycle_);
    }

    Response post(const std::string& path, const std::string& body) {
        return router_.dispatch(Request("POST", path, "", {{"Content-Type", "application/json"}}, body));
    }

    Response get(const std::string& path) {
        return router_.dispatch(Request("GET", path, "", {}, ""));
    }

    static nlohmann::json body_of(const Response& response) {
        return nlohmann::json::parse(response.body());
    }

    std::shared_ptr<EchoExecutor> executor_;
    ExecutionEngine engine_;
    // Shared with the detached termination timer, which may outlive the fixture
    std::shared_ptr<std::atomic<int>> terminations_ = std::make_shared<std::atomic<int>>(0);
    LifecycleController lifecycle_;
    Router router_;
};

} // namespace

TEST_F(HandlersTest, ExecuteReturnsResult) {
    auto response = post("/execute", R"json({"code": "print('hello')"})json");
    EXPECT_EQ(response.status_code(), 200);
    EXPECT_EQ(response.header("Content-Type"), "application/json");
    EXPECT_EQ(body_of(response), (nlohmann::json{
        {"stdout", "print('hello')"}, {"stderr", ""}, {"exit_code", 0}, {"success", true}}));
}

TEST_F(HandlersTest, UserFailureIsStill200) {
    auto response = post("/execute", R"({"code": "fail"})");
    EXPECT_EQ(response.status_code(), 200);
    auto body = body_of(response);
    EXPECT_EQ(body["exit_code"], 1);
    EXPECT_EQ(body["success"], false);
}

TEST_F(HandlersTest, EmptyCodeIsAccepted) {
    auto response = post("/execute", R"({"code": ""})");
    EXPECT_EQ(response.status_code(), 200);
    EXPECT_EQ(executor_->calls.load(), 1);
}

TEST_F(HandlersTest, ExtraFieldsAreIgnored) {
    auto response = post("/execute", R"({"code": "x", "language": "python"})");
    EXPECT_EQ(response.status_code(), 200);
}

TEST_F(HandlersTest, InvalidJsonIs400) {
    auto response = post("/execute", "{not json");
    EXPECT_EQ(response.status_code(), 400);
    EXPECT_EQ(body_of(response), (nlohmann::json{{"error", "Invalid JSON"}}));

    EXPECT_EQ(post("/execute", "").status_code(), 400);
    EXPECT_EQ(executor_->calls.load(), 0);
}

TEST_F(HandlersTest, MissingCodeIs400) {
    for (const char* body : {R"({})", R"json({"source": "print(1)"})json", R"([1, 2])", R"("code")"}) {
        auto response = post("/execute", body);
        EXPECT_EQ(response.status_code(), 400) << body;
        EXPECT_EQ(body_of(response)["error"], "Missing 'code' field") << body;
    }
    EXPECT_EQ(executor_->calls.load(), 0);
}

TEST_F(HandlersTest, NonStringCodeIs400) {
    for (const char* body : {R"({"code": 42})", R"({"code": null})", R"json({"code": ["print(1)"]})json"}) {
        EXPECT_EQ(post("/execute", body).status_code(), 400) << body;
    }
    EXPECT_EQ(executor_->calls.load(), 0);
}

TEST_F(HandlersTest, HealthReportsHealthy) {
    auto response = get("/health");
    EXPECT_EQ(response.status_code(), 200);
    EXPECT_EQ(body_of(response)["status"], "healthy");
    EXPECT_EQ(body_of(response)["message"], "VM API server is running");
}

TEST_F(HandlersTest, ShutdownArmsTerminationOnlyAfterSend) {
    auto response = post("/shutdown", "");
    EXPECT_EQ(response.status_code(), 200);
    EXPECT_EQ(body_of(response), (nlohmann::json{{"status", "shutting_down"}, {"message", "VM is shutting down"}}));

    EXPECT_FALSE(lifecycle_.termination_scheduled());
    ASSERT_EQ(response.sent_hooks().size(), 1u);

    response.notify_sent();
    EXPECT_TRUE(lifecycle_.termination_scheduled());
}

TEST_F(HandlersTest, WrongMethodsAre404) {
    EXPECT_EQ(get("/execute").status_code(), 404);
    EXPECT_EQ(post("/health", "").status_code(), 404);
    EXPECT_EQ(get("/shutdown").status_code(), 404);
    EXPECT_EQ(get("/").status_code(), 404);
}
