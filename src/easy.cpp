#include "easy.hpp"
#include "compact_log.hpp"
#include <format>

namespace curlmux {

Easy::Easy(Token, ICurlEngine& engine, CURL* handle)
    : engine_(&engine), handle_(handle) {}

Easy::~Easy() {
    release();
}

std::expected<std::unique_ptr<Easy>, CurlErrorInfo> Easy::create(ICurlEngine& engine) {
    CURL* handle = engine.easy_init();
    if (!handle) return std::unexpected(configuration_error("curl_easy_init failed"));
    return std::make_unique<Easy>(Token{}, engine, handle);
}

std::expected<void, CurlErrorInfo> Easy::require_handle() const {
    if (!handle_) return std::unexpected(configuration_error("Curl handle has been released"));
    return {};
}

std::expected<void, CurlErrorInfo> Easy::check(CURLcode rc, std::string_view what) const {
    if (rc == CURLE_OK) return {};
    return std::unexpected(configuration_error(
        std::format("{} rejected: {}", what, engine_->easy_strerror(rc)), rc));
}

std::expected<void, CurlErrorInfo> Easy::set_option(CURLoption option, long value) {
    if (auto ok = require_handle(); !ok) return ok;
    return check(engine_->setopt_long(handle_, option, value), std::format("option {}", static_cast<int>(option)));
}

std::expected<void, CurlErrorInfo> Easy::set_option(CURLoption option, std::string_view value) {
    if (auto ok = require_handle(); !ok) return ok;
    auto storage = std::make_shared<std::string>(value);
    auto rc = engine_->setopt_string(handle_, option, storage->c_str());
    if (rc == CURLE_OK) owned_.push_back(std::move(storage));
    return check(rc, std::format("option {}", static_cast<int>(option)));
}

std::expected<void, CurlErrorInfo> Easy::set_option_large(CURLoption option, curl_off_t value) {
    if (auto ok = require_handle(); !ok) return ok;
    return check(engine_->setopt_off_t(handle_, option, value), std::format("option {}", static_cast<int>(option)));
}

std::expected<void, CurlErrorInfo> Easy::set_body(std::string body) {
    if (auto ok = require_handle(); !ok) return ok;
    auto storage = std::make_shared<std::string>(std::move(body));
    auto size = static_cast<curl_off_t>(storage->size());
    if (auto ok = check(engine_->setopt_off_t(handle_, CURLOPT_POSTFIELDSIZE_LARGE, size), "request body size"); !ok) {
        return ok;
    }
    auto rc = engine_->setopt_pointer(handle_, CURLOPT_POSTFIELDS, storage->data());
    if (rc == CURLE_OK) owned_.push_back(std::move(storage));
    return check(rc, "request body");
}

std::expected<void, CurlErrorInfo> Easy::set_headers(const std::vector<std::string>& headers) {
    if (headers.empty()) return {};
    HeaderList list;
    for (const auto& h : headers) {
        if (!list.append(h)) return std::unexpected(configuration_error("curl_slist_append failed", CURLE_OUT_OF_MEMORY));
    }
    return set_header_list(CURLOPT_HTTPHEADER, std::move(list));
}

std::expected<void, CurlErrorInfo> Easy::set_header_list(CURLoption option, HeaderList list) {
    if (auto ok = require_handle(); !ok) return ok;
    auto storage = std::make_shared<HeaderList>(std::move(list));
    auto rc = engine_->setopt_pointer(handle_, option, storage->get());
    if (rc == CURLE_OK) owned_.push_back(std::move(storage));
    return check(rc, "header list");
}

std::expected<void, CurlErrorInfo> Easy::install_bridge(CURLoption function_option, CURLoption data_option, ChunkCallback callback) {
    if (auto ok = require_handle(); !ok) return ok;
    auto bridge = std::make_shared<ChunkBridge>(std::move(callback));
    if (auto ok = check(engine_->setopt_pointer(handle_, data_option, bridge.get()), "callback data"); !ok) {
        return ok;
    }
    auto rc = engine_->setopt_write_function(handle_, function_option, &ChunkBridge::trampoline);
    // The data pointer is already installed, so keep the bridge alive either way.
    owned_.push_back(std::move(bridge));
    return check(rc, "callback function");
}

std::expected<void, CurlErrorInfo> Easy::set_write_function(ChunkCallback callback) {
    return install_bridge(CURLOPT_WRITEFUNCTION, CURLOPT_WRITEDATA, std::move(callback));
}

std::expected<void, CurlErrorInfo> Easy::set_header_function(ChunkCallback callback) {
    return install_bridge(CURLOPT_HEADERFUNCTION, CURLOPT_HEADERDATA, std::move(callback));
}

std::expected<void, CurlErrorInfo> Easy::impersonate(std::string_view target, bool default_headers) {
    if (auto ok = require_handle(); !ok) return ok;
    if (!engine_->has_impersonate_support()) {
        return std::unexpected(configuration_error(
            "Browser impersonation needs libcurl-impersonate instead of standard libcurl", CURLE_NOT_BUILT_IN));
    }
    std::string name(target);
    return check(engine_->easy_impersonate(handle_, name.c_str(), default_headers),
                 std::format("impersonate target '{}'", name));
}

std::expected<void, CurlErrorInfo> Easy::perform() {
    if (auto ok = require_handle(); !ok) return ok;
    CURLcode rc = engine_->easy_perform(handle_);
    if (rc != CURLE_OK) return std::unexpected(transfer_error(rc, *engine_));
    return {};
}

std::expected<long, CurlErrorInfo> Easy::info_long(CURLINFO info) const {
    if (auto ok = require_handle(); !ok) return std::unexpected(ok.error());
    long value = 0;
    if (auto ok = check(engine_->getinfo_long(handle_, info, value), "getinfo"); !ok) return std::unexpected(ok.error());
    return value;
}

std::expected<double, CurlErrorInfo> Easy::info_double(CURLINFO info) const {
    if (auto ok = require_handle(); !ok) return std::unexpected(ok.error());
    double value = 0.0;
    if (auto ok = check(engine_->getinfo_double(handle_, info, value), "getinfo"); !ok) return std::unexpected(ok.error());
    return value;
}

std::expected<std::string, CurlErrorInfo> Easy::info_string(CURLINFO info) const {
    if (auto ok = require_handle(); !ok) return std::unexpected(ok.error());
    const char* value = nullptr;
    if (auto ok = check(engine_->getinfo_string(handle_, info, value), "getinfo"); !ok) return std::unexpected(ok.error());
    return value ? std::string(value) : std::string();
}

std::expected<curl_off_t, CurlErrorInfo> Easy::info_off_t(CURLINFO info) const {
    if (auto ok = require_handle(); !ok) return std::unexpected(ok.error());
    curl_off_t value = 0;
    if (auto ok = check(engine_->getinfo_off_t(handle_, info, value), "getinfo"); !ok) return std::unexpected(ok.error());
    return value;
}

std::expected<void, CurlErrorInfo> Easy::reset() {
    if (auto ok = require_handle(); !ok) return ok;
    engine_->easy_reset(handle_);
    owned_.clear();
    return {};
}

std::expected<std::unique_ptr<Easy>, CurlErrorInfo> Easy::duplicate() const {
    if (auto ok = require_handle(); !ok) return std::unexpected(ok.error());
    CURL* copy = engine_->easy_duphandle(handle_);
    if (!copy) return std::unexpected(configuration_error("curl_easy_duphandle failed"));
    auto clone = std::make_unique<Easy>(Token{}, *engine_, copy);
    clone->owned_ = owned_;
    return clone;
}

void Easy::release() noexcept {
    if (!handle_) return;
    CURL* handle = handle_;
    handle_ = nullptr;
    engine_->easy_cleanup(handle);
    // Buffers go after the handle: libcurl may still read them during cleanup.
    owned_.clear();
}

std::string Easy::version(ICurlEngine& engine) {
    const char* v = engine.version();
    return v ? std::string(v) : std::string("unknown");
}

} // namespace curlmux
