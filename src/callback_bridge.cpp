#include "callback_bridge.hpp"
#include "compact_log.hpp"
#include <exception>
#include <format>

namespace curlmux {

ChunkBridge::ChunkBridge(ChunkCallback callback)
    : callback_(std::move(callback)) {}

size_t ChunkBridge::deliver(const char* data, size_t length) {
    if (length == 0) return 0;
    if (!callback_) return length;
    auto consumed = callback_(std::string(data, length));
    return consumed.value_or(length);
}

size_t ChunkBridge::trampoline(char* data, size_t size, size_t nmemb, void* userdata) noexcept {
    size_t length = size * nmemb;
    if (length == 0) return 0;
    auto* bridge = static_cast<ChunkBridge*>(userdata);
    if (!bridge) return 0;
    try {
        return bridge->deliver(data, length);
    } catch (const std::exception& e) {
        compact::Writer::error(std::format("[easy] chunk callback threw, aborting transfer: {}\n", e.what()));
        return 0;
    }
}

} // namespace curlmux
