#pragma once

#include <curl/curl.h>
#include <string>
#include <string_view>

namespace curlmux {

enum class CurlError {
    Configuration,
    Transfer,
    DuplicateHandle,
    AlreadyClosed,
    SchedulerClosed,
    Cancelled,
    EngineFault,      // the multi context itself failed; broadcast to every pending transfer
    WebSocket,
    WebSocketClosed,
    ReceiveTimeout
};

// Finer grouping of transfer failures by native code.
enum class ErrorCategory {
    None,
    Dns,
    Connection,
    Proxy,
    Ssl,
    CertificateVerify,
    Timeout,
    TooManyRedirects,
    InvalidUrl,
    Interface,
    Other
};

struct CurlErrorInfo {
    CurlError error;
    std::string message;
    int code = 0;  // CURLcode or CURLMcode, depending on error
    ErrorCategory category = ErrorCategory::None;
    int close_code = 0;
    std::string close_reason;
};

class ICurlEngine;

ErrorCategory classify(CURLcode code);

std::string_view to_string(CurlError error);
std::string_view to_string(ErrorCategory category);

CurlErrorInfo configuration_error(std::string message, CURLcode code = CURLE_OK);
CurlErrorInfo transfer_error(CURLcode code, ICurlEngine& engine);
CurlErrorInfo engine_fault(CURLMcode code, std::string_view operation, ICurlEngine& engine);
CurlErrorInfo websocket_error(std::string message, int code = 0);
CurlErrorInfo websocket_closed(int close_code, std::string close_reason);

} // namespace curlmux
