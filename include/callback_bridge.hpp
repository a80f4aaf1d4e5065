#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace curlmux {

// Receives one body chunk or header line. Return the number of bytes
// consumed, or std::nullopt to consume the whole chunk. Returning less than
// the chunk size makes libcurl abort the transfer with CURLE_WRITE_ERROR.
using ChunkCallback = std::function<std::optional<size_t>(std::string chunk)>;

// Adapts a ChunkCallback to curl's write/header callback signature. The
// bridge is the userdata pointer, so it must not move while installed.
class ChunkBridge {
public:
    explicit ChunkBridge(ChunkCallback callback);

    ChunkBridge(const ChunkBridge&) = delete;
    ChunkBridge& operator=(const ChunkBridge&) = delete;

    // Copies size * nmemb bytes out of the native buffer, calls the callback
    // and reports the consumed count. Exceptions abort the transfer.
    static size_t trampoline(char* data, size_t size, size_t nmemb, void* userdata) noexcept;

    size_t deliver(const char* data, size_t length);

private:
    ChunkCallback callback_;
};

} // namespace curlmux
