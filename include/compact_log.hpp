#pragma once

#include <unistd.h>
#include <string_view>
#include <mutex>
#include <cstdlib>

namespace compact {

// Unbuffered stderr writer shared by the library and the CLI. Lines from different
// threads never interleave.
class Writer {
public:
    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    // Only emitted when CURLMUX_DEBUG is set (and not "0").
    static void debug(std::string_view s) {
        if (!debug_enabled()) return;
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    static bool debug_enabled() {
        static const bool enabled = [] {
            const char* v = std::getenv("CURLMUX_DEBUG");
            return v != nullptr && *v != '\0' && std::string_view(v) != "0";
        }();
        return enabled;
    }

private:
    static void write_all(int fd, std::string_view s) {
        while (!s.empty()) {
            ssize_t n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

} // namespace compact
