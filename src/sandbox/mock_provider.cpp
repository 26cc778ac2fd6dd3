/**
 * @file mock_provider.cpp
 * @brief MockProvider implementation.
 */

#include "sandbox/mock_provider.hpp"

#include <thread>

namespace sandbox_runner {

// ── MockProvider::InFlight ───────────────────

MockProvider::InFlight::InFlight(MockProvider& provider) : provider_(provider) {
    auto now = ++provider_.in_flight_;
    auto peak = provider_.peak_in_flight_.load();
    while (now > peak && !provider_.peak_in_flight_.compare_exchange_weak(peak, now)) {
    }
}

MockProvider::InFlight::~InFlight() {
    --provider_.in_flight_;
}

// ── MockSandbox ──────────────────────────────

MockSandbox::MockSandbox(InstanceId id, MockProvider& provider)
    : id_(std::move(id)), provider_(provider) {}

Result<ExecutionResult> MockSandbox::run_code(const std::string& code,
                                              const RunCodeOptions& /*options*/,
                                              const OutputCallbacks* callbacks,
                                              std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorKind::Cancelled, "cancelled before start"};
    }

    MockProvider::InFlight guard(provider_);
    ++provider_.run_calls_;
    ++run_count_;
    {
        std::lock_guard lock(provider_.mutex_);
        provider_.executed_.push_back(code);
    }

    auto response = provider_.response_for(code);
    std::chrono::milliseconds delay;
    {
        std::lock_guard lock(provider_.mutex_);
        delay = provider_.run_delay_;
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);

    if (response.transport_error) {
        return Error{ErrorKind::Execution, *response.transport_error};
    }

    if (callbacks) {
        for (const auto& chunk : response.stdout_chunks) {
            if (callbacks->on_stdout) callbacks->on_stdout(chunk);
        }
        for (const auto& chunk : response.stderr_chunks) {
            if (callbacks->on_stderr) callbacks->on_stderr(chunk);
        }
    }

    ExecutionResult result;
    result.stdout_chunks = std::move(response.stdout_chunks);
    result.stderr_chunks = std::move(response.stderr_chunks);
    result.error = std::move(response.error);
    result.results = std::move(response.results);
    result.exit_code = response.exit_code;
    return result;
}

Result<CommandResult> MockSandbox::run_command(const std::string& command,
                                               const CommandOptions& /*options*/,
                                               const OutputCallbacks* callbacks,
                                               std::stop_token stop) {
    RunCodeOptions code_options;
    auto executed = run_code(command, code_options, callbacks, stop);
    if (!executed) return executed.error();

    CommandResult result;
    for (const auto& c : executed->stdout_chunks) result.stdout_text += c;
    for (const auto& c : executed->stderr_chunks) result.stderr_text += c;
    result.exit_code = executed->exit_code;
    if (executed->error) {
        result.error = executed->error->name + ": " + executed->error->value;
    }
    return result;
}

// ── MockProvider ─────────────────────────────

MockProvider::MockProvider() {
    default_response_.stdout_chunks = {"ok\n"};
}

Result<SandboxPtr> MockProvider::create(const std::string& /*tool*/,
                                        const CreateOptions& /*options*/) {
    InFlight guard(*this);
    uint32_t call = create_calls_++;

    std::chrono::milliseconds delay;
    bool fail;
    {
        std::lock_guard lock(mutex_);
        delay = create_delay_;
        fail = fail_all_ || failing_creates_.count(call) > 0;
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);

    if (fail) {
        return Error{ErrorKind::Sandbox, "mock create failure (call " + std::to_string(call) + ")"};
    }

    InstanceId id = "mock-" + std::to_string(call + 1);
    {
        std::lock_guard lock(mutex_);
        live_.insert(id);
        created_.push_back(id);
    }
    return SandboxPtr{std::make_shared<MockSandbox>(id, *this)};
}

Result<SandboxPtr> MockProvider::connect(const InstanceId& instance_id) {
    std::lock_guard lock(mutex_);
    if (live_.count(instance_id) == 0) {
        return Error{ErrorKind::Sandbox, "instance " + instance_id + " not found"};
    }
    return SandboxPtr{std::make_shared<MockSandbox>(instance_id, *this)};
}

Result<void> MockProvider::destroy(const InstanceId& instance_id) {
    std::lock_guard lock(mutex_);
    if (live_.erase(instance_id) == 0) {
        return Error{ErrorKind::Sandbox, "instance " + instance_id + " not found"};
    }
    destroyed_.push_back(instance_id);
    return {};
}

Result<std::vector<InstanceInfo>> MockProvider::list() {
    std::lock_guard lock(mutex_);
    std::vector<InstanceInfo> out;
    for (const auto& id : live_) {
        out.push_back(InstanceInfo{id, std::string{kDefaultTool}, "", true});
    }
    return out;
}

void MockProvider::set_response(const std::string& code, MockResponse response) {
    std::lock_guard lock(mutex_);
    responses_[code] = std::move(response);
}

void MockProvider::set_default_response(MockResponse response) {
    std::lock_guard lock(mutex_);
    default_response_ = std::move(response);
}

void MockProvider::fail_create_call(uint32_t call_index) {
    std::lock_guard lock(mutex_);
    failing_creates_.insert(call_index);
}

void MockProvider::fail_all_creates(bool fail) {
    std::lock_guard lock(mutex_);
    fail_all_ = fail;
}

void MockProvider::set_create_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    create_delay_ = delay;
}

void MockProvider::set_run_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    run_delay_ = delay;
}

void MockProvider::add_existing(const InstanceId& instance_id) {
    std::lock_guard lock(mutex_);
    live_.insert(instance_id);
}

std::vector<InstanceId> MockProvider::created() const {
    std::lock_guard lock(mutex_);
    return created_;
}

std::vector<InstanceId> MockProvider::destroyed() const {
    std::lock_guard lock(mutex_);
    return destroyed_;
}

std::vector<std::string> MockProvider::executed_code() const {
    std::lock_guard lock(mutex_);
    return executed_;
}

MockResponse MockProvider::response_for(const std::string& code) {
    std::lock_guard lock(mutex_);
    auto it = responses_.find(code);
    return it != responses_.end() ? it->second : default_response_;
}

}  // namespace sandbox_runner
