#pragma once

#include "callback_bridge.hpp"
#include "curl_engine.hpp"
#include "curl_error.hpp"
#include "header_list.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace curlmux {

// One native transfer handle plus everything libcurl keeps pointers into
// (header lists, request bodies, callback bridges). Single owner: never use
// one Easy from two threads at once. An Easy submitted to a Multi must not
// be moved, reset or released until its outcome has been delivered.
class Easy {
    struct Token {
        explicit Token() = default;
    };

public:
    static std::expected<std::unique_ptr<Easy>, CurlErrorInfo> create(ICurlEngine& engine = default_engine());

    Easy(Token, ICurlEngine& engine, CURL* handle);
    ~Easy();

    Easy(const Easy&) = delete;
    Easy& operator=(const Easy&) = delete;
    Easy(Easy&&) = delete;
    Easy& operator=(Easy&&) = delete;

    std::expected<void, CurlErrorInfo> set_option(CURLoption option, long value);
    std::expected<void, CurlErrorInfo> set_option(CURLoption option, std::string_view value);
    std::expected<void, CurlErrorInfo> set_option_large(CURLoption option, curl_off_t value);

    // Request body; the bytes are owned here and sent as-is.
    std::expected<void, CurlErrorInfo> set_body(std::string body);

    // "Name: value" lines for CURLOPT_HTTPHEADER. Empty input is a no-op.
    std::expected<void, CurlErrorInfo> set_headers(const std::vector<std::string>& headers);
    std::expected<void, CurlErrorInfo> set_header_list(CURLoption option, HeaderList list);

    std::expected<void, CurlErrorInfo> set_write_function(ChunkCallback callback);
    std::expected<void, CurlErrorInfo> set_header_function(ChunkCallback callback);

    // Browser TLS/HTTP2 fingerprint; needs a curl-impersonate build.
    std::expected<void, CurlErrorInfo> impersonate(std::string_view target, bool default_headers = true);

    // Runs the whole transfer on the calling thread.
    std::expected<void, CurlErrorInfo> perform();

    std::expected<long, CurlErrorInfo> info_long(CURLINFO info) const;
    std::expected<double, CurlErrorInfo> info_double(CURLINFO info) const;
    std::expected<std::string, CurlErrorInfo> info_string(CURLINFO info) const;
    std::expected<curl_off_t, CurlErrorInfo> info_off_t(CURLINFO info) const;

    std::expected<long, CurlErrorInfo> response_code() const { return info_long(CURLINFO_RESPONSE_CODE); }
    std::expected<std::string, CurlErrorInfo> effective_url() const { return info_string(CURLINFO_EFFECTIVE_URL); }
    std::expected<std::string, CurlErrorInfo> content_type() const { return info_string(CURLINFO_CONTENT_TYPE); }
    std::expected<double, CurlErrorInfo> total_time() const { return info_double(CURLINFO_TOTAL_TIME); }
    std::expected<std::string, CurlErrorInfo> primary_ip() const { return info_string(CURLINFO_PRIMARY_IP); }
    std::expected<long, CurlErrorInfo> primary_port() const { return info_long(CURLINFO_PRIMARY_PORT); }
    std::expected<std::string, CurlErrorInfo> local_ip() const { return info_string(CURLINFO_LOCAL_IP); }
    std::expected<long, CurlErrorInfo> local_port() const { return info_long(CURLINFO_LOCAL_PORT); }
    std::expected<long, CurlErrorInfo> redirect_count() const { return info_long(CURLINFO_REDIRECT_COUNT); }
    std::expected<std::string, CurlErrorInfo> redirect_url() const { return info_string(CURLINFO_REDIRECT_URL); }
    std::expected<long, CurlErrorInfo> http_version() const { return info_long(CURLINFO_HTTP_VERSION); }

    // Clears every option and owned buffer but keeps the native handle.
    std::expected<void, CurlErrorInfo> reset();

    // The clone shares this handle's owned buffers, since libcurl copies
    // the pointers into them.
    std::expected<std::unique_ptr<Easy>, CurlErrorInfo> duplicate() const;

    // Idempotent. Frees the native handle and all owned buffers.
    void release() noexcept;

    CURL* native() const { return handle_; }
    bool released() const { return handle_ == nullptr; }
    ICurlEngine& engine() const { return *engine_; }
    size_t owned_count() const { return owned_.size(); }

    static std::string version(ICurlEngine& engine = default_engine());

private:

    std::expected<void, CurlErrorInfo> check(CURLcode rc, std::string_view what) const;
    std::expected<void, CurlErrorInfo> require_handle() const;
    std::expected<void, CurlErrorInfo> install_bridge(CURLoption function_option, CURLoption data_option, ChunkCallback callback);

    ICurlEngine* engine_;
    CURL* handle_;
    std::vector<std::shared_ptr<void>> owned_;
};

} // namespace curlmux
