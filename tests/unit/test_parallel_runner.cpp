/**
 * @file test_parallel_runner.cpp
 * @brief Unit tests for run_parallel against the mock provider.
 */

#include "recording_observer.hpp"
#include "runner/parallel_runner.hpp"
#include "runner/result_aggregator.hpp"
#include "sandbox/mock_provider.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace sandbox_runner;
using sandbox_runner::test_support::make_tasks;
using sandbox_runner::test_support::RecordingObserver;

class ParallelRunnerTest : public ::testing::Test {
protected:
    MockProvider provider_;
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Debug};
    RecordingObserver observer_;
    RunOptions options_;

    void SetUp() override {
        options_.parallel = true;
    }
};

TEST(EffectiveParallelismTest, Limits) {
    EXPECT_EQ(effective_parallelism(0, 5), 5u);
    EXPECT_EQ(effective_parallelism(-3, 5), 5u);
    EXPECT_EQ(effective_parallelism(2, 5), 2u);
    EXPECT_EQ(effective_parallelism(5, 5), 5u);
    EXPECT_EQ(effective_parallelism(10, 5), 5u);
    EXPECT_EQ(effective_parallelism(1, 0), 0u);
}

TEST_F(ParallelRunnerTest, OneResultPerTaskForEveryLimit) {
    const uint32_t n = 6;
    for (int limit : {0, 1, static_cast<int>(n), static_cast<int>(2 * n)}) {
        MockProvider provider;
        RunOptions options = options_;
        options.max_parallel = limit;

        std::vector<ExecutionTask> tasks = make_tasks(n);
        for (auto& task : tasks) task.code = "code-" + std::to_string(task.id);

        auto results = run_parallel(tasks, options, provider, logger_, nullptr, {});

        ASSERT_EQ(results.size(), tasks.size()) << "limit " << limit;
        for (size_t i = 0; i < tasks.size(); ++i) {
            EXPECT_EQ(results[i].task.id, tasks[i].id) << "limit " << limit;
        }
        EXPECT_EQ(provider.create_calls(), n);
        EXPECT_EQ(provider.destroyed().size(), n);
    }
}

TEST_F(ParallelRunnerTest, OneCreationFailureIsIsolated) {
    options_.max_parallel = 2;
    provider_.set_create_delay(std::chrono::milliseconds(5));
    provider_.set_run_delay(std::chrono::milliseconds(5));
    provider_.fail_create_call(2);

    auto results = run_parallel(make_tasks(4), options_, provider_, logger_, &observer_, {});

    auto summary = summarize(results);
    EXPECT_EQ(summary.total, 4u);
    EXPECT_EQ(summary.succeeded, 3u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(exit_code(summary), 1);
    EXPECT_LE(provider_.peak_in_flight(), 2u);

    auto failed = std::find_if(results.begin(), results.end(), [](const TaskResult& r) { return r.failed(); });
    ASSERT_NE(failed, results.end());
    EXPECT_EQ(failed->outcome.error().message.rfind("failed to create sandbox: ", 0), 0u);

    // Only the three sandboxes that exist are cleaned up.
    EXPECT_EQ(provider_.destroyed().size(), 3u);
}

TEST_F(ParallelRunnerTest, AllCreationsFail) {
    provider_.fail_all_creates();

    auto results = run_parallel(make_tasks(3), options_, provider_, logger_, &observer_, {});

    EXPECT_EQ(exit_code(summarize(results)), 2);
    EXPECT_TRUE(provider_.created().empty());
    EXPECT_TRUE(provider_.destroyed().empty());
    EXPECT_EQ(provider_.run_calls(), 0u);
}

TEST_F(ParallelRunnerTest, CompletionChannelReportsEachTaskOnce) {
    provider_.set_run_delay(std::chrono::milliseconds(2));

    auto results = run_parallel(make_tasks(8), options_, provider_, logger_, &observer_, {});

    ASSERT_EQ(observer_.finished.size(), 8u);
    std::set<TaskId> unique(observer_.finished.begin(), observer_.finished.end());
    EXPECT_EQ(unique.size(), 8u);
}

TEST_F(ParallelRunnerTest, NoChannelForJsonOrStreaming) {
    options_.format = OutputFormat::Json;
    run_parallel(make_tasks(3), options_, provider_, logger_, &observer_, {});
    EXPECT_TRUE(observer_.finished.empty());

    RecordingObserver streaming;
    RunOptions options = options_;
    options.format = OutputFormat::Text;
    options.stream = true;
    run_parallel(make_tasks(3), options, provider_, logger_, &streaming, {});
    EXPECT_TRUE(streaming.finished.empty());
    EXPECT_EQ(streaming.stdout_lines.size(), 3u);
}

TEST_F(ParallelRunnerTest, KeepAliveReportsAllIdsTogether) {
    options_.keep_alive = true;

    run_parallel(make_tasks(3), options_, provider_, logger_, &observer_, {});

    EXPECT_TRUE(provider_.destroyed().empty());
    ASSERT_EQ(observer_.info.size(), 1u);
    EXPECT_EQ(observer_.info[0].rfind("Created 3 instances (kept alive): ", 0), 0u);
    for (const auto& id : provider_.created()) {
        EXPECT_NE(observer_.info[0].find(id), std::string::npos);
    }
}

TEST_F(ParallelRunnerTest, StopBeforeStartCreatesNothing) {
    std::stop_source stop;
    stop.request_stop();

    auto results = run_parallel(make_tasks(4), options_, provider_, logger_, &observer_, stop.get_token());

    ASSERT_EQ(results.size(), 4u);
    for (const auto& result : results) {
        EXPECT_TRUE(result.cancelled());
    }
    EXPECT_EQ(provider_.create_calls(), 0u);
    // Cancelled tasks are still reported once each.
    EXPECT_EQ(observer_.finished.size(), 4u);
}

TEST_F(ParallelRunnerTest, EachTaskGetsItsOwnSandbox) {
    auto results = run_parallel(make_tasks(5), options_, provider_, logger_, nullptr, {});

    auto created = provider_.created();
    std::set<InstanceId> unique(created.begin(), created.end());
    EXPECT_EQ(unique.size(), 5u);
    for (const auto& result : results) {
        EXPECT_GE(result.total_duration, result.execution_duration);
    }
}
