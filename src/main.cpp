#include "compact_log.hpp"
#include "easy.hpp"
#include "multi.hpp"
#include "websocket.hpp"
#include <openssl/evp.h>
#include <iostream>
#include <format>
#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <future>
#include <stdexcept>

using namespace curlmux;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd, impersonate;
    std::vector<std::string> args;
    std::vector<std::string> headers;
    long timeout_sec = 0;
    long max_host_connections = 6;
    bool sha256 = false;
    bool insecure = false;
    int exit_code = 0;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    std::string result_message;
};

void print_usage(const char* program_name) {
    std::cout << "Concurrent libcurl transfers (C++23)\n\n"
              << "Usage: " << program_name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  get <url>...                 Fetch URLs concurrently\n"
              << "  ws <url> [message...]        Send text messages over a WebSocket\n"
              << "  version                      Show libcurl version\n\n"
              << "Options:\n"
              << "  --sha256                     Print SHA-256 of each body\n"
              << "  --timeout <seconds>          Per-transfer timeout\n"
              << "  --impersonate <target>       Browser fingerprint (curl-impersonate)\n"
              << "  --header <'Name: value'>     Extra request header, repeatable\n"
              << "  --max-host-connections <n>   Parallel connections per host (default 6)\n"
              << "  --insecure                   Skip TLS verification\n";
}

// One transfer of the get command. Owns its handle, body and digest.
struct Download {
    std::string url;
    std::unique_ptr<Easy> easy;
    std::string body;
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> sha{nullptr, &EVP_MD_CTX_free};
    std::future<TransferOutcome> outcome;
};

std::string hex_digest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) return {};
    std::string out;
    for (unsigned int i = 0; i < hash_len; ++i) out += std::format("{:02x}", hash[i]);
    return out;
}

std::expected<void, CurlErrorInfo> configure(Download& d, const FSMContext& ctx) {
    auto& easy = *d.easy;
    if (auto ok = easy.set_option(CURLOPT_URL, d.url); !ok) return ok;
    if (auto ok = easy.set_option(CURLOPT_FOLLOWLOCATION, 1L); !ok) return ok;
    if (auto ok = easy.set_headers(ctx.headers); !ok) return ok;
    if (ctx.timeout_sec > 0) {
        if (auto ok = easy.set_option(CURLOPT_TIMEOUT, ctx.timeout_sec); !ok) return ok;
    }
    if (ctx.insecure) {
        if (auto ok = easy.set_option(CURLOPT_SSL_VERIFYPEER, 0L); !ok) return ok;
        if (auto ok = easy.set_option(CURLOPT_SSL_VERIFYHOST, 0L); !ok) return ok;
    }
    if (!ctx.impersonate.empty()) {
        if (auto ok = easy.impersonate(ctx.impersonate); !ok) return ok;
    }
    if (ctx.sha256) {
        d.sha.reset(EVP_MD_CTX_new());
        if (!d.sha || EVP_DigestInit_ex(d.sha.get(), EVP_sha256(), nullptr) != 1) {
            return std::unexpected(configuration_error("EVP_DigestInit_ex failed"));
        }
    }
    return easy.set_write_function([&d](std::string chunk) -> std::optional<size_t> {
        if (d.sha && EVP_DigestUpdate(d.sha.get(), chunk.data(), chunk.size()) != 1) return 0;
        d.body += chunk;
        return std::nullopt;
    });
}

int cmd_get(const FSMContext& ctx) {
    MultiConfig config;
    config.max_host_connections = ctx.max_host_connections;
    config.pipelining = true;
    // Declared first so the scheduler is closed before any handle is freed.
    std::vector<std::unique_ptr<Download>> downloads;
    auto multi = Multi::create(config);
    if (!multi) { std::cerr << "Error: " << multi.error().message << "\n"; return 1; }

    for (const auto& url : ctx.args) {
        auto d = std::make_unique<Download>();
        d->url = url;
        auto easy = Easy::create();
        if (!easy) { std::cerr << "Error: " << easy.error().message << "\n"; return 1; }
        d->easy = std::move(*easy);
        if (auto ok = configure(*d, ctx); !ok) {
            std::cerr << std::format("Error: {}: {}\n", url, ok.error().message);
            return 1;
        }
        d->outcome = (*multi)->submit(*d->easy);
        downloads.push_back(std::move(d));
    }

    int failures = 0;
    for (auto& d : downloads) {
        auto outcome = d->outcome.get();
        if (!outcome) {
            ++failures;
            std::cerr << std::format("{}: {} ({})\n", d->url, outcome.error().message, to_string(outcome.error().category));
            continue;
        }
        long status = d->easy->response_code().value_or(0);
        double seconds = d->easy->total_time().value_or(0.0);
        std::cout << std::format("{} {} {} bytes {:.3f}s", status, d->easy->effective_url().value_or(d->url), d->body.size(), seconds);
        if (d->sha) std::cout << " sha256=" << hex_digest(d->sha.get());
        std::cout << "\n";
    }
    (*multi)->close();
    return failures == 0 ? 0 : 1;
}

int cmd_ws(const FSMContext& ctx) {
    WebSocketConfig config;
    config.headers = ctx.headers;
    config.timeout_sec = ctx.timeout_sec;
    config.verify = !ctx.insecure;
    config.impersonate = ctx.impersonate;
    auto ws = WebSocket::connect(ctx.args[0], config);
    if (!ws) { std::cerr << "Error: " << ws.error().message << "\n"; return 1; }

    auto wait = std::chrono::seconds(ctx.timeout_sec > 0 ? ctx.timeout_sec : 10);
    for (size_t i = 1; i < ctx.args.size(); ++i) {
        if (auto ok = (*ws)->send_text(ctx.args[i]); !ok) {
            std::cerr << "Error: " << ok.error().message << "\n";
            return 1;
        }
        auto reply = (*ws)->receive(wait);
        if (!reply) {
            std::cerr << "Error: " << reply.error().message << "\n";
            return 1;
        }
        std::cout << std::format("< {}\n", reply->data);
    }
    (*ws)->close(1000, "bye");
    return 0;
}

int cmd_version() {
    std::cout << Easy::version() << "\n";
    std::cout << "impersonate: " << (default_engine().has_impersonate_support() ? "yes" : "no") << "\n";
    return 0;
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = 1;
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                for (int i = 2; i < ctx.argc; ++i) {
                    std::string a = ctx.argv[i];
                    try {
                        if (a == "--sha256") ctx.sha256 = true;
                        else if (a == "--insecure") ctx.insecure = true;
                        else if (a == "--timeout" && i + 1 < ctx.argc) ctx.timeout_sec = std::stol(ctx.argv[++i]);
                        else if (a == "--impersonate" && i + 1 < ctx.argc) ctx.impersonate = ctx.argv[++i];
                        else if (a == "--header" && i + 1 < ctx.argc) ctx.headers.push_back(ctx.argv[++i]);
                        else if (a == "--max-host-connections" && i + 1 < ctx.argc) ctx.max_host_connections = std::stol(ctx.argv[++i]);
                        else ctx.args.push_back(a);
                    } catch (const std::exception&) {
                        ctx.error_message = "Invalid number for " + a;
                        break;
                    }
                }
                if (!ctx.error_message.empty()) {
                    ctx.exit_code = 1;
                    state = FSMState::Error;
                    break;
                }
                state = FSMState::PreCommand;
                break;
            }
            case FSMState::PreCommand:
                compact::Writer::debug(std::format("[FSM] PreCommand: {} ({} args)\n", ctx.cmd, ctx.args.size()));
                if (ctx.cmd == "get") {
                    if (ctx.args.empty()) {
                        ctx.exit_code = 1;
                        ctx.error_message = "get requires at least one <url> argument.";
                        state = FSMState::Error;
                        break;
                    }
                } else if (ctx.cmd == "ws") {
                    if (ctx.args.empty()) {
                        ctx.exit_code = 1;
                        ctx.error_message = "ws requires <url> argument.";
                        state = FSMState::Error;
                        break;
                    }
                } else if (ctx.cmd != "version") {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    state = FSMState::Error;
                    break;
                }
                state = FSMState::RunCommand;
                break;
            case FSMState::RunCommand:
                if (ctx.cmd == "get") {
                    ctx.exit_code = cmd_get(ctx);
                    ctx.result_message = "get";
                } else if (ctx.cmd == "ws") {
                    ctx.exit_code = cmd_ws(ctx);
                    ctx.result_message = "ws";
                } else {
                    ctx.exit_code = cmd_version();
                    ctx.result_message = "version";
                }
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand:
                ctx.end_time = std::chrono::steady_clock::now();
                {
                    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ctx.end_time - ctx.start_time).count();
                    compact::Writer::debug(std::format("[FSM] {} finished with {} in {} ms\n", ctx.result_message, ctx.exit_code, ms));
                }
                state = FSMState::Done;
                break;
            case FSMState::Error:
                if (!ctx.error_message.empty()) std::cerr << "Error: " << ctx.error_message << "\n";
                print_usage(ctx.argv[0]);
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
