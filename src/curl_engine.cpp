#include "curl_engine.hpp"
#include "compact_log.hpp"
#include <dlfcn.h>
#include <mutex>

namespace curlmux {

namespace {

void global_init_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            compact::Writer::error("[engine] curl_global_init failed: ");
            compact::Writer::error(curl_easy_strerror(rc));
            compact::Writer::error("\n");
        }
    });
}

// The meta out-parameter of curl_ws_recv is const-qualified in newer releases.
template<typename Frame>
CURLcode recv_frame(CURLcode (*recv_fn)(CURL*, void*, size_t, size_t*, Frame**),
                    CURL* easy, std::span<char> buffer, WsRecvResult& result) {
    Frame* meta = nullptr;
    CURLcode rc = recv_fn(easy, buffer.data(), buffer.size(), &result.received, &meta);
    if (meta) {
        result.flags = meta->flags;
        result.bytes_left = meta->bytesleft;
    }
    return rc;
}

} // namespace

LibcurlEngine::LibcurlEngine() {
    global_init_once();
    // Only present in curl-impersonate builds of libcurl.
    impersonate_ = reinterpret_cast<ImpersonateFn>(dlsym(RTLD_DEFAULT, "curl_easy_impersonate"));
}

CURL* LibcurlEngine::easy_init() { return curl_easy_init(); }
void LibcurlEngine::easy_cleanup(CURL* easy) { curl_easy_cleanup(easy); }
CURL* LibcurlEngine::easy_duphandle(CURL* easy) { return curl_easy_duphandle(easy); }
void LibcurlEngine::easy_reset(CURL* easy) { curl_easy_reset(easy); }

CURLcode LibcurlEngine::setopt_long(CURL* easy, CURLoption option, long value) {
    return curl_easy_setopt(easy, option, value);
}

CURLcode LibcurlEngine::setopt_off_t(CURL* easy, CURLoption option, curl_off_t value) {
    return curl_easy_setopt(easy, option, value);
}

CURLcode LibcurlEngine::setopt_string(CURL* easy, CURLoption option, const char* value) {
    return curl_easy_setopt(easy, option, value);
}

CURLcode LibcurlEngine::setopt_pointer(CURL* easy, CURLoption option, void* value) {
    return curl_easy_setopt(easy, option, value);
}

CURLcode LibcurlEngine::setopt_write_function(CURL* easy, CURLoption option, curl_write_callback fn) {
    return curl_easy_setopt(easy, option, fn);
}

CURLcode LibcurlEngine::getinfo_long(CURL* easy, CURLINFO info, long& out) {
    return curl_easy_getinfo(easy, info, &out);
}

CURLcode LibcurlEngine::getinfo_double(CURL* easy, CURLINFO info, double& out) {
    return curl_easy_getinfo(easy, info, &out);
}

CURLcode LibcurlEngine::getinfo_string(CURL* easy, CURLINFO info, const char*& out) {
    char* value = nullptr;
    CURLcode rc = curl_easy_getinfo(easy, info, &value);
    out = value;
    return rc;
}

CURLcode LibcurlEngine::getinfo_off_t(CURL* easy, CURLINFO info, curl_off_t& out) {
    return curl_easy_getinfo(easy, info, &out);
}

CURLcode LibcurlEngine::easy_perform(CURL* easy) { return curl_easy_perform(easy); }

CURLcode LibcurlEngine::easy_impersonate(CURL* easy, const char* target, bool default_headers) {
    if (!impersonate_) return CURLE_NOT_BUILT_IN;
    return impersonate_(easy, target, default_headers ? 1 : 0);
}

const char* LibcurlEngine::easy_strerror(CURLcode code) { return curl_easy_strerror(code); }

CURLM* LibcurlEngine::multi_init() { return curl_multi_init(); }
CURLMcode LibcurlEngine::multi_cleanup(CURLM* multi) { return curl_multi_cleanup(multi); }

CURLMcode LibcurlEngine::multi_setopt_long(CURLM* multi, CURLMoption option, long value) {
    return curl_multi_setopt(multi, option, value);
}

CURLMcode LibcurlEngine::multi_add_handle(CURLM* multi, CURL* easy) { return curl_multi_add_handle(multi, easy); }
CURLMcode LibcurlEngine::multi_remove_handle(CURLM* multi, CURL* easy) { return curl_multi_remove_handle(multi, easy); }
CURLMcode LibcurlEngine::multi_perform(CURLM* multi, int& running) { return curl_multi_perform(multi, &running); }
CURLMcode LibcurlEngine::multi_poll(CURLM* multi, int timeout_ms) { return curl_multi_poll(multi, nullptr, 0, timeout_ms, nullptr); }
CURLMcode LibcurlEngine::multi_wakeup(CURLM* multi) { return curl_multi_wakeup(multi); }

std::optional<MultiMessage> LibcurlEngine::multi_info_read(CURLM* multi) {
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
        if (msg->msg == CURLMSG_DONE) return MultiMessage{msg->easy_handle, msg->data.result};
    }
    return std::nullopt;
}

const char* LibcurlEngine::multi_strerror(CURLMcode code) { return curl_multi_strerror(code); }

WsRecvResult LibcurlEngine::ws_recv(CURL* easy, std::span<char> buffer) {
    WsRecvResult result;
    result.code = recv_frame(&curl_ws_recv, easy, buffer, result);
    return result;
}

WsSendResult LibcurlEngine::ws_send(CURL* easy, std::span<const char> data, unsigned int flags) {
    WsSendResult result;
    result.code = curl_ws_send(easy, data.data(), data.size(), &result.sent, 0, flags);
    return result;
}

const char* LibcurlEngine::version() { return curl_version(); }
bool LibcurlEngine::has_impersonate_support() { return impersonate_ != nullptr; }

ICurlEngine& default_engine() {
    static LibcurlEngine engine;
    return engine;
}

} // namespace curlmux
