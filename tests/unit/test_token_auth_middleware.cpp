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

// Token Authentication Middleware Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/base64url.hpp"
#include "core/token.hpp"
#include "gateway/pipeline.hpp"
#include "gateway/token_auth_middleware.hpp"
#include "http/http.hpp"

using namespace tokengate;
using namespace tokengate::gateway;

namespace {

// Raw token bytes known to the test store, and the header that carries them
const std::string KNOWN_TOKEN = "known-token-bytes-0123456789abcd";

std::string known_header() {
    return "Token " + core::base64url_encode(KNOWN_TOKEN);
}

// Authenticator backed by a single hashed entry, the way a store keyed by hash works
Authenticator store_authenticator() {
    std::string key = core::hash_token(KNOWN_TOKEN);
    return [key](std::string_view token) -> std::string {
        return core::hash_token(token) == key ? "user-42" : "";
    };
}

std::unique_ptr<TokenAuthMiddleware> make_gate(TokenAuthMiddleware::Config config,
                                               Authorizer authorizer = nullptr) {
    std::error_code ec;
    auto gate = TokenAuthMiddleware::create(std::move(config), store_authenticator(),
                                            std::move(authorizer), ec);
    REQUIRE(gate);
    REQUIRE_FALSE(ec);
    return gate;
}

TokenAuthMiddleware::Config api_config() {
    TokenAuthMiddleware::Config config;
    config.realm = "api";
    return config;
}

// Request/response pair plus context wired to them
struct Exchange {
    http::Request request;
    http::Response response;
    RequestContext ctx;
    std::string header_value;

    Exchange() {
        request.method = http::Method::GET;
        request.path = "/resource";
        ctx.request = &request;
        ctx.response = &response;
        ctx.client_ip = "192.0.2.10";
    }

    void set_authorization(std::string value) {
        header_value = std::move(value);
        request.headers.push_back({"Authorization", header_value});
    }
};

void require_challenge(const Exchange& ex, std::string_view realm_header = "Token realm=\"api\"") {
    REQUIRE(ex.response.status == http::StatusCode::Unauthorized);
    REQUIRE(ex.response.get_header("WWW-Authenticate") == realm_header);
    REQUIRE(ex.response.get_header("Content-Type") == "application/json");
    REQUIRE(ex.response.body_view() == R"({"Error":"Not Authorized"})");
    REQUIRE_FALSE(ex.ctx.has_metadata(REMOTE_USER_KEY));
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("TokenAuthMiddleware create validates configuration", "[token_auth][config]") {
    std::error_code ec;

    SECTION("Empty realm") {
        auto gate = TokenAuthMiddleware::create({}, store_authenticator(), nullptr, ec);
        REQUIRE_FALSE(gate);
        REQUIRE(ec == core::TokenErrc::missing_realm);
    }

    SECTION("Missing authenticator") {
        auto gate = TokenAuthMiddleware::create(api_config(), nullptr, nullptr, ec);
        REQUIRE_FALSE(gate);
        REQUIRE(ec == core::TokenErrc::missing_authenticator);
    }

    SECTION("Zero entropy") {
        auto config = api_config();
        config.entropy_bytes = 0;
        auto gate = TokenAuthMiddleware::create(config, store_authenticator(), nullptr, ec);
        REQUIRE_FALSE(gate);
        REQUIRE(ec == core::TokenErrc::invalid_entropy);
    }

    SECTION("Entropy above the maximum") {
        auto config = api_config();
        config.entropy_bytes = core::MAX_TOKEN_ENTROPY + 1;
        auto gate = TokenAuthMiddleware::create(config, store_authenticator(), nullptr, ec);
        REQUIRE_FALSE(gate);
        REQUIRE(ec == core::TokenErrc::invalid_entropy);

        config.entropy_bytes = static_cast<uint32_t>(-1);
        gate = TokenAuthMiddleware::create(config, store_authenticator(), nullptr, ec);
        REQUIRE_FALSE(gate);
        REQUIRE(ec == core::TokenErrc::invalid_entropy);
    }

    SECTION("Maximum entropy is accepted") {
        auto config = api_config();
        config.entropy_bytes = core::MAX_TOKEN_ENTROPY;
        auto gate = TokenAuthMiddleware::create(config, store_authenticator(), nullptr, ec);
        REQUIRE(gate);
        REQUIRE(gate->generate(ec).has_value());
    }

    SECTION("Empty scheme") {
        auto config = api_config();
        config.scheme.clear();
        auto gate = TokenAuthMiddleware::create(config, store_authenticator(), nullptr, ec);
        REQUIRE_FALSE(gate);
        REQUIRE(ec == core::TokenErrc::malformed_header);
    }

    SECTION("Defaults") {
        auto gate = TokenAuthMiddleware::create(api_config(), store_authenticator(), nullptr, ec);
        REQUIRE(gate);
        REQUIRE_FALSE(ec);
        REQUIRE(gate->config().entropy_bytes == 32);
        REQUIRE(gate->config().header == "Authorization");
        REQUIRE(gate->config().scheme == "Token");
        REQUIRE(gate->config().query_param.empty());
        REQUIRE(gate->config().digest == core::TokenDigest::Sha256);
        REQUIRE(gate->name() == "TokenAuthMiddleware");
        REQUIRE(gate->challenge() == "Token realm=\"api\"");
    }
}

// ============================================================================
// Rejections
// ============================================================================

TEST_CASE("Request without credential is challenged", "[token_auth][reject]") {
    auto gate = make_gate(api_config());
    Exchange ex;

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
    require_challenge(ex);
    REQUIRE(ex.ctx.has_error);
}

TEST_CASE("Wrong scheme is challenged", "[token_auth][reject]") {
    auto gate = make_gate(api_config());
    Exchange ex;
    ex.set_authorization("Bearer abc");

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
    require_challenge(ex);
}

TEST_CASE("Invalid token encoding is challenged", "[token_auth][reject]") {
    auto gate = make_gate(api_config());
    Exchange ex;
    ex.set_authorization("Token not*base64");

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
    require_challenge(ex);
}

TEST_CASE("Unknown token is challenged", "[token_auth][reject]") {
    auto gate = make_gate(api_config());
    Exchange ex;
    ex.set_authorization("Token " + core::base64url_encode("some-other-token"));

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
    require_challenge(ex);
}

TEST_CASE("Authorizer denial is challenged and handler never runs", "[token_auth][reject]") {
    auto gate = make_gate(api_config(), [](const AuthContext&) { return false; });
    Exchange ex;
    ex.set_authorization(known_header());

    bool handler_ran = false;
    auto handler = gate->wrap([&](RequestContext&) { handler_ran = true; });
    handler(ex.ctx);

    REQUIRE_FALSE(handler_ran);
    require_challenge(ex);
}

TEST_CASE("Rejection responses are identical for every cause", "[token_auth][reject]") {
    auto gate = make_gate(api_config(), [](const AuthContext&) { return false; });

    std::vector<std::string> headers = {
        "", "Bearer abc", "Token", "Token ***", "Token " + core::base64url_encode("nope"),
        known_header()};

    for (const auto& value : headers) {
        Exchange ex;
        if (!value.empty()) {
            ex.set_authorization(value);
        }
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
        require_challenge(ex);
        REQUIRE(ex.response.headers.size() == 2);
    }
}

TEST_CASE("Rejection clears a stale identity", "[token_auth][reject]") {
    auto gate = make_gate(api_config());
    Exchange ex;
    ex.ctx.set_metadata("REMOTE_USER", "spoofed");

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
    require_challenge(ex);
}

TEST_CASE("Throwing callbacks fail closed", "[token_auth][reject]") {
    std::error_code ec;

    SECTION("Authenticator throws") {
        auto gate = TokenAuthMiddleware::create(
            api_config(),
            [](std::string_view) -> std::string { throw std::runtime_error("store down"); },
            nullptr, ec);
        REQUIRE(gate);

        Exchange ex;
        ex.set_authorization(known_header());
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
        require_challenge(ex);
    }

    SECTION("Authorizer throws") {
        auto gate = make_gate(api_config(), [](const AuthContext&) -> bool {
            throw std::runtime_error("policy error");
        });

        Exchange ex;
        ex.set_authorization(known_header());
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
        require_challenge(ex);
    }
}

TEST_CASE("Callbacks throwing non-standard types fail closed", "[token_auth][reject]") {
    std::error_code ec;

    SECTION("Authenticator throws an int") {
        auto gate = TokenAuthMiddleware::create(
            api_config(), [](std::string_view) -> std::string { throw 42; }, nullptr, ec);
        REQUIRE(gate);

        Exchange ex;
        ex.set_authorization(known_header());
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
        require_challenge(ex);
    }

    SECTION("Authorizer throws a string literal") {
        auto gate = make_gate(api_config(), [](const AuthContext&) -> bool { throw "denied"; });

        Exchange ex;
        ex.set_authorization(known_header());
        bool handler_ran = false;
        gate->wrap([&](RequestContext&) { handler_ran = true; })(ex.ctx);

        REQUIRE_FALSE(handler_ran);
        require_challenge(ex);
    }
}

TEST_CASE("Realm is rendered as a quoted-string", "[token_auth][reject]") {
    auto config = api_config();
    config.realm = R"(my "quoted" realm)";
    auto gate = make_gate(config);
    Exchange ex;

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
    require_challenge(ex, R"(Token realm="my \"quoted\" realm")");
}

TEST_CASE("Missing request or response is an error", "[token_auth]") {
    auto gate = make_gate(api_config());
    RequestContext ctx;
    REQUIRE(gate->process_request(ctx) == MiddlewareResult::Error);
}

// ============================================================================
// Forwarding
// ============================================================================

TEST_CASE("Known token is forwarded with REMOTE_USER", "[token_auth][forward]") {
    auto gate = make_gate(api_config());
    Exchange ex;
    ex.set_authorization(known_header());

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Continue);
    REQUIRE(ex.ctx.get_metadata(REMOTE_USER_KEY) == "user-42");
    REQUIRE_FALSE(ex.ctx.has_error);
    REQUIRE_FALSE(ex.response.has_header("WWW-Authenticate"));
}

TEST_CASE("Wrapped handler sees the identity", "[token_auth][forward]") {
    auto gate = make_gate(api_config());
    Exchange ex;
    ex.set_authorization(known_header());

    std::string seen;
    auto handler = gate->wrap([&](RequestContext& ctx) {
        seen = std::string(ctx.get_metadata(REMOTE_USER_KEY));
        ctx.response->status = http::StatusCode::OK;
        ctx.response->set_body("hello");
    });
    handler(ex.ctx);

    REQUIRE(seen == "user-42");
    REQUIRE(ex.response.status == http::StatusCode::OK);
    REQUIRE(ex.response.body_view() == "hello");
}

TEST_CASE("Authorizer receives request and identity", "[token_auth][forward]") {
    std::string seen_user;
    std::string seen_path;
    auto gate = make_gate(api_config(), [&](const AuthContext& auth) {
        seen_user = std::string(auth.user_id);
        seen_path = std::string(auth.request.request->path);
        return auth.request.request->path == "/resource";
    });

    Exchange ex;
    ex.set_authorization(known_header());

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Continue);
    REQUIRE(seen_user == "user-42");
    REQUIRE(seen_path == "/resource");
}

TEST_CASE("Authorizer can restrict by method", "[token_auth][forward]") {
    auto gate = make_gate(api_config(), [](const AuthContext& auth) {
        return auth.request.request->method == http::Method::GET;
    });

    Exchange read;
    read.set_authorization(known_header());
    REQUIRE(gate->process_request(read.ctx) == MiddlewareResult::Continue);

    Exchange write;
    write.request.method = http::Method::POST;
    write.set_authorization(known_header());
    REQUIRE(gate->process_request(write.ctx) == MiddlewareResult::Stop);
    require_challenge(write);
}

TEST_CASE("Authenticator receives decoded token bytes", "[token_auth][forward]") {
    std::string received;
    std::error_code ec;
    auto gate = TokenAuthMiddleware::create(
        api_config(),
        [&](std::string_view token) -> std::string {
            received = std::string(token);
            return "user-7";
        },
        nullptr, ec);
    REQUIRE(gate);

    Exchange ex;
    ex.set_authorization(known_header());
    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Continue);

    REQUIRE(received == KNOWN_TOKEN);
    REQUIRE(gate->hash(received) == core::hash_token(KNOWN_TOKEN));
}

TEST_CASE("Custom header name and scheme", "[token_auth][forward]") {
    auto config = api_config();
    config.header = "X-Api-Key";
    config.scheme = "ApiKey";
    auto gate = make_gate(config);

    SECTION("Configured header accepted") {
        Exchange ex;
        std::string value = "ApiKey " + core::base64url_encode(KNOWN_TOKEN);
        ex.request.headers.push_back({"x-api-key", value});
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Continue);
        REQUIRE(ex.ctx.get_metadata(REMOTE_USER_KEY) == "user-42");
    }

    SECTION("Default header ignored") {
        Exchange ex;
        ex.set_authorization(known_header());
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
        require_challenge(ex, "ApiKey realm=\"api\"");
    }
}

// ============================================================================
// Query parameter credentials
// ============================================================================

TEST_CASE("Query parameter credential", "[token_auth][query]") {
    auto config = api_config();
    config.query_param = "access_token";
    auto gate = make_gate(config);
    std::string wire = core::base64url_encode(KNOWN_TOKEN);

    SECTION("Query parameter alone") {
        Exchange ex;
        std::string query = "page=2&access_token=" + wire;
        ex.request.query = query;
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Continue);
        REQUIRE(ex.ctx.get_metadata(REMOTE_USER_KEY) == "user-42");
    }

    SECTION("Query parameter preferred over header") {
        Exchange ex;
        std::string query = "access_token=" + core::base64url_encode("wrong");
        ex.request.query = query;
        ex.set_authorization(known_header());
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
        require_challenge(ex);
    }

    SECTION("Empty query parameter falls back to header") {
        Exchange ex;
        ex.request.query = "access_token=";
        ex.set_authorization(known_header());
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Continue);
        REQUIRE(ex.ctx.get_metadata(REMOTE_USER_KEY) == "user-42");
    }

    SECTION("Invalid percent escape is rejected") {
        Exchange ex;
        ex.request.query = "access_token=%zz";
        ex.set_authorization(known_header());
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
        require_challenge(ex);
    }

    SECTION("Percent-encoded padding is accepted") {
        Exchange ex;
        std::string query = "access_token=" + wire + "%3D";
        ex.request.query = query;
        REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Continue);
    }
}

TEST_CASE("Query parameter ignored when not configured", "[token_auth][query]") {
    auto gate = make_gate(api_config());
    Exchange ex;
    std::string query = "access_token=" + core::base64url_encode(KNOWN_TOKEN);
    ex.request.query = query;

    REQUIRE(gate->process_request(ex.ctx) == MiddlewareResult::Stop);
    require_challenge(ex);
}

// ============================================================================
// Pipeline integration
// ============================================================================

TEST_CASE("Gate inside a pipeline", "[token_auth][pipeline]") {
    std::error_code ec;
    auto gate = TokenAuthMiddleware::create(api_config(), store_authenticator(), nullptr, ec);
    REQUIRE(gate);

    int after_gate = 0;
    auto pipeline = PipelineBuilder()
                        .use(std::move(gate))
                        .use(
                            [&](RequestContext&) {
                                ++after_gate;
                                return MiddlewareResult::Continue;
                            },
                            "Counter")
                        .build();

    int handled = 0;
    auto handler = [&](RequestContext&) { ++handled; };

    Exchange denied;
    REQUIRE(pipeline.handle(denied.ctx, handler) == MiddlewareResult::Stop);
    REQUIRE(after_gate == 0);
    REQUIRE(handled == 0);
    REQUIRE_FALSE(denied.ctx.correlation_id.empty());

    Exchange allowed;
    allowed.set_authorization(known_header());
    REQUIRE(pipeline.handle(allowed.ctx, handler) == MiddlewareResult::Continue);
    REQUIRE(after_gate == 1);
    REQUIRE(handled == 1);
}

// ============================================================================
// Credential helpers and concurrency
// ============================================================================

TEST_CASE("Gate helpers use configured entropy and digest", "[token_auth][helpers]") {
    auto config = api_config();
    config.entropy_bytes = 16;
    config.digest = core::TokenDigest::Md5;
    auto gate = make_gate(config);

    std::error_code ec;
    auto first = gate->generate(ec);
    auto second = gate->generate(ec);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first != *second);
    REQUIRE(core::base64url_decode(*first)->size() == 16);
    REQUIRE(core::base64url_decode(*second)->size() == 16);

    REQUIRE(TokenAuthMiddleware::equal(*first, *first));
    REQUIRE_FALSE(TokenAuthMiddleware::equal(*first, *second));

    REQUIRE(gate->hash("abc") == core::hash_token("abc", core::TokenDigest::Md5));

    auto issuer = gate->issuer();
    REQUIRE(issuer.entropy_bytes() == 16);
    REQUIRE(issuer.digest() == core::TokenDigest::Md5);
}

TEST_CASE("Concurrent requests share one gate", "[token_auth][concurrency]") {
    auto gate = make_gate(api_config());

    constexpr int THREADS = 8;
    constexpr int ITERATIONS = 200;
    std::atomic<int> forwarded{0};
    std::atomic<int> rejected{0};
    std::atomic<int> wrong{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < ITERATIONS; ++i) {
                Exchange ex;
                bool expect_ok = ((t + i) % 2) == 0;
                ex.set_authorization(expect_ok ? known_header() : "Token " +
                                                                      core::base64url_encode("x"));
                auto result = gate->process_request(ex.ctx);
                if (result == MiddlewareResult::Continue) {
                    ++forwarded;
                    if (!expect_ok || ex.ctx.get_metadata(REMOTE_USER_KEY) != "user-42") {
                        ++wrong;
                    }
                } else {
                    ++rejected;
                    if (expect_ok) {
                        ++wrong;
                    }
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(wrong.load() == 0);
    REQUIRE(forwarded.load() + rejected.load() == THREADS * ITERATIONS);
    REQUIRE(forwarded.load() == THREADS * ITERATIONS / 2);
}
