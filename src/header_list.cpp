#include "header_list.hpp"
#include <utility>

namespace curlmux {

HeaderList::HeaderList(const std::vector<std::string>& lines) {
    for (const auto& line : lines) append(line);
}

HeaderList::~HeaderList() {
    free();
}

HeaderList::HeaderList(HeaderList&& other) noexcept
    : list_(std::exchange(other.list_, nullptr)),
      size_(std::exchange(other.size_, 0)) {}

HeaderList& HeaderList::operator=(HeaderList&& other) noexcept {
    if (this != &other) {
        free();
        list_ = std::exchange(other.list_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

bool HeaderList::append(std::string_view line) {
    std::string copy(line);
    curl_slist* next = curl_slist_append(list_, copy.c_str());
    if (!next) return false;
    list_ = next;
    ++size_;
    return true;
}

void HeaderList::free() {
    if (list_) {
        curl_slist_free_all(list_);
        list_ = nullptr;
        size_ = 0;
    }
}

} // namespace curlmux
