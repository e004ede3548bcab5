#pragma once

#include "core/llm_backend.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace promptshield::testing {

/**
 * @brief Scripted LLM backend for analyzer and pipeline tests
 *
 * Returns a fixed reply after an optional delay. The delay is cut short when
 * the stop token fires, so timed-out calls do not linger.
 */
class MockLlmBackend : public ILlmBackend {
public:
    explicit MockLlmBackend(std::string reply = R"({"confidence": 0.1, "category": "benign", "reasoning": "ok"})")
        : reply_(std::move(reply)) {}

    [[nodiscard]] LlmResponse complete(const LlmRequest& request,
                                       std::chrono::milliseconds /*timeout*/,
                                       std::stop_token stop_token) override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(mutex_);
            last_request_ = request;
        }

        const auto deadline = std::chrono::steady_clock::now() + delay_;
        while (std::chrono::steady_clock::now() < deadline) {
            if (stop_token.stop_requested()) {
                stopped_.store(true, std::memory_order_relaxed);
                return {false, "", "stopped", "mock", {}};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        if (throw_) {
            throw std::runtime_error("mock backend exploded");
        }
        if (!succeed_) {
            return {false, "", "mock failure", "mock", {}};
        }
        return {true, reply_, "", "mock", {}};
    }

    void set_reply(std::string reply) { reply_ = std::move(reply); }
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
    void set_should_succeed(bool v) { succeed_ = v; }
    void set_should_throw(bool v) { throw_ = v; }

    [[nodiscard]] uint64_t call_count() const {
        return call_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool was_stopped() const {
        return stopped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] LlmRequest last_request() const {
        std::lock_guard lock(mutex_);
        return last_request_;
    }

private:
    std::string reply_;
    std::chrono::milliseconds delay_{0};
    bool succeed_ = true;
    bool throw_ = false;
    std::atomic<uint64_t> call_count_{0};
    std::atomic<bool> stopped_{false};
    mutable std::mutex mutex_;
    LlmRequest last_request_;
};

} // namespace promptshield::testing
