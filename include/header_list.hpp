#pragma once

#include <curl/curl.h>
#include <string>
#include <string_view>
#include <vector>

namespace curlmux {

// Owns a curl_slist. The list must stay alive for as long as any handle
// it was installed on can still run a transfer.
class HeaderList {
public:
    HeaderList() = default;
    explicit HeaderList(const std::vector<std::string>& lines);
    ~HeaderList();

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    HeaderList(HeaderList&& other) noexcept;
    HeaderList& operator=(HeaderList&& other) noexcept;

    // Returns false when libcurl could not allocate the new node.
    bool append(std::string_view line);
    void free();

    curl_slist* get() const { return list_; }
    size_t size() const { return size_; }
    bool empty() const { return list_ == nullptr; }

private:
    curl_slist* list_ = nullptr;
    size_t size_ = 0;
};

} // namespace curlmux
