#pragma once

#include <curl/curl.h>
#include <optional>
#include <span>
#include <cstddef>

namespace curlmux {

struct MultiMessage {
    CURL* easy;
    CURLcode result;
};

struct WsRecvResult {
    CURLcode code = CURLE_OK;
    size_t received = 0;
    int flags = 0;
    curl_off_t bytes_left = 0;
};

struct WsSendResult {
    CURLcode code = CURLE_OK;
    size_t sent = 0;
};

// The native transfer engine. Everything the core asks of libcurl goes
// through this interface so a scripted engine can stand in under test.
class ICurlEngine {
public:
    virtual ~ICurlEngine() = default;

    virtual CURL* easy_init() = 0;
    virtual void easy_cleanup(CURL* easy) = 0;
    virtual CURL* easy_duphandle(CURL* easy) = 0;
    virtual void easy_reset(CURL* easy) = 0;

    virtual CURLcode setopt_long(CURL* easy, CURLoption option, long value) = 0;
    virtual CURLcode setopt_off_t(CURL* easy, CURLoption option, curl_off_t value) = 0;
    virtual CURLcode setopt_string(CURL* easy, CURLoption option, const char* value) = 0;
    virtual CURLcode setopt_pointer(CURL* easy, CURLoption option, void* value) = 0;
    virtual CURLcode setopt_write_function(CURL* easy, CURLoption option, curl_write_callback fn) = 0;

    virtual CURLcode getinfo_long(CURL* easy, CURLINFO info, long& out) = 0;
    virtual CURLcode getinfo_double(CURL* easy, CURLINFO info, double& out) = 0;
    virtual CURLcode getinfo_string(CURL* easy, CURLINFO info, const char*& out) = 0;
    virtual CURLcode getinfo_off_t(CURL* easy, CURLINFO info, curl_off_t& out) = 0;

    virtual CURLcode easy_perform(CURL* easy) = 0;
    virtual CURLcode easy_impersonate(CURL* easy, const char* target, bool default_headers) = 0;
    virtual const char* easy_strerror(CURLcode code) = 0;

    virtual CURLM* multi_init() = 0;
    virtual CURLMcode multi_cleanup(CURLM* multi) = 0;
    virtual CURLMcode multi_setopt_long(CURLM* multi, CURLMoption option, long value) = 0;
    virtual CURLMcode multi_add_handle(CURLM* multi, CURL* easy) = 0;
    virtual CURLMcode multi_remove_handle(CURLM* multi, CURL* easy) = 0;
    virtual CURLMcode multi_perform(CURLM* multi, int& running) = 0;
    virtual CURLMcode multi_poll(CURLM* multi, int timeout_ms) = 0;
    virtual CURLMcode multi_wakeup(CURLM* multi) = 0;
    virtual std::optional<MultiMessage> multi_info_read(CURLM* multi) = 0;
    virtual const char* multi_strerror(CURLMcode code) = 0;

    // CURLE_AGAIN means no frame is ready yet.
    virtual WsRecvResult ws_recv(CURL* easy, std::span<char> buffer) = 0;
    virtual WsSendResult ws_send(CURL* easy, std::span<const char> data, unsigned int flags) = 0;

    virtual const char* version() = 0;
    virtual bool has_impersonate_support() = 0;
};

class LibcurlEngine : public ICurlEngine {
public:
    LibcurlEngine();
    ~LibcurlEngine() override = default;

    LibcurlEngine(const LibcurlEngine&) = delete;
    LibcurlEngine& operator=(const LibcurlEngine&) = delete;

    CURL* easy_init() override;
    void easy_cleanup(CURL* easy) override;
    CURL* easy_duphandle(CURL* easy) override;
    void easy_reset(CURL* easy) override;

    CURLcode setopt_long(CURL* easy, CURLoption option, long value) override;
    CURLcode setopt_off_t(CURL* easy, CURLoption option, curl_off_t value) override;
    CURLcode setopt_string(CURL* easy, CURLoption option, const char* value) override;
    CURLcode setopt_pointer(CURL* easy, CURLoption option, void* value) override;
    CURLcode setopt_write_function(CURL* easy, CURLoption option, curl_write_callback fn) override;

    CURLcode getinfo_long(CURL* easy, CURLINFO info, long& out) override;
    CURLcode getinfo_double(CURL* easy, CURLINFO info, double& out) override;
    CURLcode getinfo_string(CURL* easy, CURLINFO info, const char*& out) override;
    CURLcode getinfo_off_t(CURL* easy, CURLINFO info, curl_off_t& out) override;

    CURLcode easy_perform(CURL* easy) override;
    CURLcode easy_impersonate(CURL* easy, const char* target, bool default_headers) override;
    const char* easy_strerror(CURLcode code) override;

    CURLM* multi_init() override;
    CURLMcode multi_cleanup(CURLM* multi) override;
    CURLMcode multi_setopt_long(CURLM* multi, CURLMoption option, long value) override;
    CURLMcode multi_add_handle(CURLM* multi, CURL* easy) override;
    CURLMcode multi_remove_handle(CURLM* multi, CURL* easy) override;
    CURLMcode multi_perform(CURLM* multi, int& running) override;
    CURLMcode multi_poll(CURLM* multi, int timeout_ms) override;
    CURLMcode multi_wakeup(CURLM* multi) override;
    std::optional<MultiMessage> multi_info_read(CURLM* multi) override;
    const char* multi_strerror(CURLMcode code) override;

    WsRecvResult ws_recv(CURL* easy, std::span<char> buffer) override;
    WsSendResult ws_send(CURL* easy, std::span<const char> data, unsigned int flags) override;

    const char* version() override;
    bool has_impersonate_support() override;

private:
    using ImpersonateFn = CURLcode (*)(CURL*, const char*, int);
    ImpersonateFn impersonate_ = nullptr;
};

// Process-wide libcurl engine; curl_global_init runs on first use.
ICurlEngine& default_engine();

} // namespace curlmux
