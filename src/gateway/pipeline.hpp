/*
 * Copyright 2025 Tokengate Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Tokengate Pipeline - Header
// Middleware chain for request processing

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "../http/http.hpp"

namespace tokengate::gateway {

/// Request header carrying a correlation id assigned upstream
constexpr std::string_view CORRELATION_ID_HEADER = "X-Correlation-ID";

/// Request context (passed through middleware chain)
struct RequestContext {
    // Request/Response
    http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;

    // Connection info
    std::string client_ip;

    // Request environment (middleware to handler communication)
    tokengate::core::string_map<std::string> metadata;

    // Error handling
    bool has_error = false;
    std::string error_message;

    /// Helper: Set error
    void set_error(std::string message) {
        has_error = true;
        error_message = std::move(message);
    }

    /// Helper: Get metadata
    [[nodiscard]] std::string_view get_metadata(std::string_view key) const {
        auto it = metadata.find(key);
        return (it != metadata.end()) ? std::string_view(it->second) : std::string_view{};
    }

    /// Helper: Check metadata presence
    [[nodiscard]] bool has_metadata(std::string_view key) const {
        return metadata.contains(key);
    }

    /// Helper: Set metadata
    void set_metadata(std::string key, std::string value) {
        metadata[std::move(key)] = std::move(value);
    }
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution (response already written)
    Error      // Error occurred
};

/// Middleware function signature
using MiddlewareFunc = std::function<MiddlewareResult(RequestContext&)>;

/// Terminal request handler (runs after every middleware continued)
using Handler = std::function<void(RequestContext&)>;

/// Middleware base class
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Middleware pipeline
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Add middleware function to pipeline
    void use(MiddlewareFunc func, std::string_view name = "CustomMiddleware");

    /// Execute request phase, stopping at the first Stop or Error
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx);

    /// Execute request phase, then the handler if every middleware continued
    /// Assigns a correlation id when the context has none (inbound header if well-formed)
    MiddlewareResult handle(RequestContext& ctx, const Handler& handler);

    /// Get middleware count
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

    /// Clear all middleware
    void clear() { middleware_.clear(); }

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

/// Pipeline builder (fluent API)
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    PipelineBuilder& use(std::unique_ptr<Middleware> middleware) {
        pipeline_.use(std::move(middleware));
        return *this;
    }

    PipelineBuilder& use(MiddlewareFunc func, std::string_view name = "CustomMiddleware") {
        pipeline_.use(std::move(func), name);
        return *this;
    }

    Pipeline build() && { return std::move(pipeline_); }

private:
    Pipeline pipeline_;
};

/// Function middleware wrapper
class FunctionMiddleware : public Middleware {
public:
    explicit FunctionMiddleware(MiddlewareFunc func, std::string name)
        : func_(std::move(func)), name_(std::move(name)) {}

    MiddlewareResult process_request(RequestContext& ctx) override { return func_(ctx); }

    std::string_view name() const override { return name_; }

private:
    MiddlewareFunc func_;
    std::string name_;
};

}  // namespace tokengate::gateway
