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

// Tokengate Pipeline - Implementation

#include "pipeline.hpp"

#include "../core/logging.hpp"

namespace tokengate::gateway {

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

void Pipeline::use(MiddlewareFunc func, std::string_view name) {
    middleware_.push_back(std::make_unique<FunctionMiddleware>(std::move(func), std::string(name)));
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error || ctx.has_error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult Pipeline::handle(RequestContext& ctx, const Handler& handler) {
    if (ctx.correlation_id.empty()) {
        // Keep an upstream id only when it has our format
        auto inbound = ctx.request ? ctx.request->get_header(CORRELATION_ID_HEADER)
                                   : std::string_view{};
        ctx.correlation_id = logging::is_valid_correlation_id(inbound)
                                 ? std::string(inbound)
                                 : logging::generate_correlation_id();
    }

    MiddlewareResult result = execute_request(ctx);
    if (result != MiddlewareResult::Continue) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_DEBUG(logger, "Pipeline stopped before handler: error={}, correlation_id={}",
                      ctx.error_message, ctx.correlation_id);
        }
        return result;
    }

    if (handler) {
        handler(ctx);
    }

    return MiddlewareResult::Continue;
}

}  // namespace tokengate::gateway
