#include "curl_error.hpp"
#include "curl_engine.hpp"
#include <format>

namespace curlmux {

ErrorCategory classify(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return ErrorCategory::None;
        case CURLE_COULDNT_RESOLVE_HOST:
            return ErrorCategory::Dns;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_PROXY:
            return ErrorCategory::Proxy;
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return ErrorCategory::Connection;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCategory::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
            return ErrorCategory::Ssl;
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CACERT_BADFILE:
            return ErrorCategory::CertificateVerify;
        case CURLE_TOO_MANY_REDIRECTS:
            return ErrorCategory::TooManyRedirects;
        case CURLE_URL_MALFORMAT:
            return ErrorCategory::InvalidUrl;
        case CURLE_INTERFACE_FAILED:
            return ErrorCategory::Interface;
        default:
            return ErrorCategory::Other;
    }
}

std::string_view to_string(CurlError error) {
    switch (error) {
        case CurlError::Configuration: return "ConfigurationError";
        case CurlError::Transfer: return "TransferError";
        case CurlError::DuplicateHandle: return "DuplicateHandle";
        case CurlError::AlreadyClosed: return "AlreadyClosed";
        case CurlError::SchedulerClosed: return "SchedulerClosed";
        case CurlError::Cancelled: return "Cancelled";
        case CurlError::EngineFault: return "EngineFault";
        case CurlError::WebSocket: return "WebSocketError";
        case CurlError::WebSocketClosed: return "WebSocketClosed";
        case CurlError::ReceiveTimeout: return "ReceiveTimeout";
    }
    return "Unknown";
}

std::string_view to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::Dns: return "dns";
        case ErrorCategory::Connection: return "connection";
        case ErrorCategory::Proxy: return "proxy";
        case ErrorCategory::Ssl: return "ssl";
        case ErrorCategory::CertificateVerify: return "certificate";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::TooManyRedirects: return "redirects";
        case ErrorCategory::InvalidUrl: return "url";
        case ErrorCategory::Interface: return "interface";
        case ErrorCategory::Other: return "other";
    }
    return "unknown";
}

CurlErrorInfo configuration_error(std::string message, CURLcode code) {
    return CurlErrorInfo{CurlError::Configuration, std::move(message), static_cast<int>(code)};
}

CurlErrorInfo transfer_error(CURLcode code, ICurlEngine& engine) {
    return CurlErrorInfo{
        CurlError::Transfer,
        std::format("Transfer failed with code {}: {}", static_cast<int>(code), engine.easy_strerror(code)),
        static_cast<int>(code),
        classify(code)
    };
}

CurlErrorInfo engine_fault(CURLMcode code, std::string_view operation, ICurlEngine& engine) {
    return CurlErrorInfo{
        CurlError::EngineFault,
        std::format("{} failed: {}", operation, engine.multi_strerror(code)),
        static_cast<int>(code)
    };
}

CurlErrorInfo websocket_error(std::string message, int code) {
    return CurlErrorInfo{CurlError::WebSocket, std::move(message), code};
}

CurlErrorInfo websocket_closed(int close_code, std::string close_reason) {
    CurlErrorInfo info{CurlError::WebSocketClosed, std::format("WebSocket closed: {} {}", close_code, close_reason)};
    info.close_code = close_code;
    info.close_reason = std::move(close_reason);
    return info;
}

} // namespace curlmux
