#include <chrono>
#include <csignal>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "protocol/codec.hpp"
#include "protocol/worker_contract.hpp"
#include "server/evaluator_supervisor.hpp"
#include "transport/process.hpp"

namespace {

using crucible::core::errors::get_error;
using crucible::core::errors::get_value;
using crucible::core::errors::is_error;
using crucible::core::errors::take_value;
using crucible::protocol::ParentContext;
using crucible::protocol::ResultKind;
using crucible::protocol::WorkerJob;
using crucible::protocol::WorkerOutput;
using crucible::protocol::WorkerResult;
using crucible::server::EvaluatorSupervisor;
using crucible::server::WorkerHandle;
using crucible::server::WorkerOptions;
using nlohmann::json;

constexpr auto kReplyTimeout = std::chrono::milliseconds(5000);

class EvaluatorSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto started = supervisor_.start_worker(WorkerOptions{"main"});
        ASSERT_FALSE(is_error(started)) << get_error(started).message;
        worker_ = take_value(started);
    }

    void TearDown() override {
        static_cast<void>(supervisor_.terminate_worker(worker_));
    }

    void run(const std::string& evaluation, const std::string& code,
             std::vector<ParentContext> parents = {}) {
        WorkerJob job{evaluation, code, evaluation, std::move(parents)};
        auto sent = worker_.channel->send(
            crucible::protocol::encode(crucible::protocol::kWorkerRun, job));
        ASSERT_FALSE(is_error(sent));
    }

    // Collects output until the result for `evaluation` arrives.
    WorkerResult await_result(const std::string& evaluation, std::vector<std::string>* output = nullptr) {
        while (true) {
            auto message = worker_.channel->receive(kReplyTimeout);
            if (is_error(message)) {
                ADD_FAILURE() << get_error(message).message;
                return WorkerResult{};
            }
            const json& body = get_value(message);
            const std::string type = crucible::transport::message_type(body);
            if (type == crucible::protocol::kWorkerOutput && output != nullptr) {
                output->push_back(body.get<WorkerOutput>().text);
            } else if (type == crucible::protocol::kWorkerResult) {
                WorkerResult result = body.get<WorkerResult>();
                if (result.evaluation == evaluation) {
                    return result;
                }
            }
        }
    }

    EvaluatorSupervisor supervisor_;
    WorkerHandle worker_;
};

TEST_F(EvaluatorSupervisorTest, RunsJobAndStreamsOutput) {
    EXPECT_GT(worker_.pid, 0);
    EXPECT_EQ(supervisor_.started_count(), 1u);

    std::vector<std::string> output;
    run("e1", "print(\"hello\")\nx = 40 + 2");
    const WorkerResult result = await_result("e1", &output);

    EXPECT_EQ(result.result.kind, ResultKind::Text);
    EXPECT_EQ(result.result.text, "42");
    EXPECT_EQ(result.bindings["x"], 42);
    EXPECT_GE(result.evaluation_time_ms, 0.0);
    ASSERT_EQ(output.size(), 1u);
    EXPECT_EQ(output[0], "hello\n");
}

TEST_F(EvaluatorSupervisorTest, FoldsLocalAndCopiedParentsNearestFirst) {
    run("e1", "x = 1; y = 1");
    await_result("e1");
    run("e2", "x = 2");
    await_result("e2");

    ParentContext copied;
    copied.local = false;
    copied.bindings = json{{"x", 100}, {"z", 3}};
    run("e3", "str(x) + str(y) + str(z)",
        {ParentContext{true, "e2", json::object()}, ParentContext{true, "e1", json::object()},
         copied});
    const WorkerResult result = await_result("e3");
    EXPECT_EQ(result.result.text, "\"213\"");
}

TEST_F(EvaluatorSupervisorTest, ForgottenEvaluationNoLongerResolves) {
    run("e1", "x = 1");
    await_result("e1");

    auto forgot = worker_.channel->send(crucible::protocol::encode(
        crucible::protocol::kWorkerForget, crucible::protocol::WorkerForget{"e1"}));
    ASSERT_FALSE(is_error(forgot));

    run("e2", "x", {ParentContext{true, "e1", json::object()}});
    const WorkerResult result = await_result("e2");
    EXPECT_EQ(result.result.kind, ResultKind::Error);
    EXPECT_EQ(result.result.text, "e2:1: undefined name 'x'");
}

TEST_F(EvaluatorSupervisorTest, ReportsVoluntaryExit) {
    run("e1", "exit(3)");
    auto message = worker_.channel->receive(kReplyTimeout);
    ASSERT_TRUE(is_error(message));
    EXPECT_EQ(get_error(message).code, "channel_closed");
    EXPECT_EQ(supervisor_.collect_exit(worker_), "exited with status 3");
    EXPECT_EQ(worker_.pid, -1);
}

TEST_F(EvaluatorSupervisorTest, ReportsKill) {
    ASSERT_EQ(::kill(worker_.pid, SIGKILL), 0);
    auto message = worker_.channel->receive(kReplyTimeout);
    ASSERT_TRUE(is_error(message));
    EXPECT_EQ(supervisor_.collect_exit(worker_), "killed by signal 9 (Killed)");
}

TEST_F(EvaluatorSupervisorTest, TerminateIsIdempotent) {
    const pid_t pid = worker_.pid;
    EXPECT_FALSE(is_error(supervisor_.terminate_worker(worker_)));
    EXPECT_FALSE(crucible::transport::is_process_alive(pid));
    EXPECT_FALSE(is_error(supervisor_.terminate_worker(worker_)));
    EXPECT_FALSE(worker_.channel->is_open());
}

TEST_F(EvaluatorSupervisorTest, WorkersAreIndependent) {
    auto second = supervisor_.start_worker(WorkerOptions{"other"});
    ASSERT_FALSE(is_error(second));
    WorkerHandle other = take_value(second);
    EXPECT_NE(other.pid, worker_.pid);

    static_cast<void>(supervisor_.terminate_worker(other));

    run("e1", "1 + 1");
    EXPECT_EQ(await_result("e1").result.text, "2");
    EXPECT_EQ(supervisor_.started_count(), 2u);
}

}  // namespace
