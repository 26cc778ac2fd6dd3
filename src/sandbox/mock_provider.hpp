/**
 * @file mock_provider.hpp
 * @brief Scripted in-memory sandbox provider for testing and dry runs.
 *
 * Responses are keyed by the exact code (or command) string; anything without
 * a script gets the default response. Creation failures and delays are
 * configurable, and the provider records what was created and destroyed plus
 * the peak number of overlapping provider calls.
 */

#pragma once

#include "sandbox/sandbox.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sandbox_runner {

struct MockResponse {
    std::vector<std::string> stdout_chunks;
    std::vector<std::string> stderr_chunks;
    std::optional<ExecutionError> error;
    std::vector<RichResult> results;
    int exit_code{0};
    std::optional<std::string> transport_error;   ///< run_* fails outright
};

class MockProvider;

class MockSandbox : public ISandbox {
public:
    MockSandbox(InstanceId id, MockProvider& provider);

    [[nodiscard]] const InstanceId& id() const noexcept override { return id_; }

    Result<ExecutionResult> run_code(const std::string& code,
                                     const RunCodeOptions& options,
                                     const OutputCallbacks* callbacks,
                                     std::stop_token stop) override;

    Result<CommandResult> run_command(const std::string& command,
                                      const CommandOptions& options,
                                      const OutputCallbacks* callbacks,
                                      std::stop_token stop) override;

    [[nodiscard]] uint32_t run_count() const noexcept { return run_count_.load(); }

private:
    InstanceId id_;
    MockProvider& provider_;
    std::atomic<uint32_t> run_count_{0};
};

class MockProvider : public ISandboxProvider {
public:
    MockProvider();

    // ISandboxProvider interface
    Result<SandboxPtr> create(const std::string& tool, const CreateOptions& options) override;
    Result<SandboxPtr> connect(const InstanceId& instance_id) override;
    Result<void> destroy(const InstanceId& instance_id) override;
    Result<std::vector<InstanceInfo>> list() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    // Scripting
    void set_response(const std::string& code, MockResponse response);
    void set_default_response(MockResponse response);
    void fail_create_call(uint32_t call_index);          ///< 0-based create() call
    void fail_all_creates(bool fail = true);
    void set_create_delay(std::chrono::milliseconds delay);
    void set_run_delay(std::chrono::milliseconds delay);
    void add_existing(const InstanceId& instance_id);

    // Observations
    [[nodiscard]] uint32_t create_calls() const noexcept { return create_calls_.load(); }
    [[nodiscard]] uint32_t run_calls() const noexcept { return run_calls_.load(); }
    [[nodiscard]] uint32_t peak_in_flight() const noexcept { return peak_in_flight_.load(); }
    [[nodiscard]] std::vector<InstanceId> created() const;
    [[nodiscard]] std::vector<InstanceId> destroyed() const;
    [[nodiscard]] std::vector<std::string> executed_code() const;

private:
    friend class MockSandbox;

    /// RAII counter for overlapping provider calls.
    class InFlight {
    public:
        explicit InFlight(MockProvider& provider);
        ~InFlight();
        InFlight(const InFlight&) = delete;
        InFlight& operator=(const InFlight&) = delete;
    private:
        MockProvider& provider_;
    };

    MockResponse response_for(const std::string& code);

    mutable std::mutex mutex_;
    std::map<std::string, MockResponse> responses_;
    MockResponse default_response_;
    std::set<uint32_t> failing_creates_;
    bool fail_all_{false};
    std::chrono::milliseconds create_delay_{0};
    std::chrono::milliseconds run_delay_{0};

    std::set<InstanceId> live_;
    std::vector<InstanceId> created_;
    std::vector<InstanceId> destroyed_;
    std::vector<std::string> executed_;

    std::atomic<uint32_t> create_calls_{0};
    std::atomic<uint32_t> run_calls_{0};
    std::atomic<uint32_t> in_flight_{0};
    std::atomic<uint32_t> peak_in_flight_{0};
};

}  // namespace sandbox_runner
