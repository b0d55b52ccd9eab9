#pragma once
// Fakes shared by the doctest suites.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "orbcomm/command_executor.hpp"
#include "orbcomm/transport/transport_base.hpp"

namespace orbcomm::testing {

// Records every call; can be told to refuse, fail or throw.
class FakeExecutor : public CommandExecutor {
public:
    std::atomic<bool> fail_prepare{false};
    std::atomic<bool> fail_execute{false};
    std::atomic<bool> throw_on_execute{false};
    std::function<void(CommandKind)> on_execute;   // runs before the result is returned

    ExecResult prepare(CommandKind kind) override {
        std::lock_guard<std::mutex> lk(mu_);
        prepared_.push_back(kind);
        if (fail_prepare) return ExecResult::failure(std::string(token_of(kind)) + " refused");
        return ExecResult::success("");
    }

    ExecResult execute(CommandKind kind) override {
        if (on_execute) on_execute(kind);
        if (throw_on_execute) throw std::runtime_error("executor exploded");
        {
            std::lock_guard<std::mutex> lk(mu_);
            executed_.push_back(kind);
        }
        cv_.notify_all();
        if (fail_execute) return ExecResult::failure("gimbal fault");
        if (kind == CommandKind::RESET_GIMBAL)
            return ExecResult::success("Reset gimbal command executed successfully");
        return ExecResult::success("");
    }

    std::vector<CommandKind> prepared() const {
        std::lock_guard<std::mutex> lk(mu_);
        return prepared_;
    }

    std::vector<CommandKind> executed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return executed_;
    }

    bool wait_executed(std::size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, timeout, [&] { return executed_.size() >= n; });
    }

private:
    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    std::vector<CommandKind> prepared_;
    std::vector<CommandKind> executed_;
};

// Reply channel that keeps every payload it was handed.
class RecordingChannel : public transport::ReplyChannel {
public:
    std::function<void()> on_reply;

    bool reply(const std::string&, const std::string& payload) override {
        if (on_reply) on_reply();
        {
            std::lock_guard<std::mutex> lk(mu_);
            payloads_.push_back(payload);
        }
        cv_.notify_all();
        return true;
    }

    bool wait_for(std::size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, timeout, [&] { return payloads_.size() >= n; });
    }

    std::vector<std::string> payloads() const {
        std::lock_guard<std::mutex> lk(mu_);
        return payloads_;
    }

private:
    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    std::vector<std::string> payloads_;
};

// One-shot gate a fake can block on until the test opens it.
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            open_ = true;
        }
        cv_.notify_all();
    }

    bool wait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, timeout, [&] { return open_; });
    }

private:
    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    open_ = false;
};

inline long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

} // namespace orbcomm::testing
