#pragma once

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>

namespace promptshield {

struct LlmRequest {
    std::string system_prompt;
    std::string prompt;
    std::string model;              // empty = backend default
    double temperature = 0.0;
    int max_tokens = 256;
};

struct LlmResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief External language-model capability
 *
 * complete() is a blocking call. Implementations must honor timeout as an
 * upper bound on their own I/O and should check stop_token between steps;
 * callers never rely on either for their own deadline.
 */
class ILlmBackend {
public:
    virtual ~ILlmBackend() = default;

    [[nodiscard]] virtual LlmResponse complete(const LlmRequest& request,
                                               std::chrono::milliseconds timeout,
                                               std::stop_token stop_token) = 0;
};

} // namespace promptshield
