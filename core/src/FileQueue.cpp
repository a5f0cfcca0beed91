#include "ncmdump/FileQueue.hpp"
#include <algorithm>

namespace ncmdump {

bool FileQueue::add(const std::string& path) {
    if (!members_.insert(path).second)
        return false;
    items_.push_back(path);
    return true;
}

bool FileQueue::remove(const std::string& path) {
    if (members_.erase(path) == 0)
        return false;
    auto it = std::find(items_.begin(), items_.end(), path);
    if (it != items_.end())
        items_.erase(it);
    return true;
}

void FileQueue::clear() {
    items_.clear();
    members_.clear();
}

std::optional<std::size_t> FileQueue::indexOf(const std::string& path) const {
    if (!contains(path))
        return std::nullopt;
    auto it = std::find(items_.begin(), items_.end(), path);
    if (it == items_.end())
        return std::nullopt;
    return static_cast<std::size_t>(it - items_.begin());
}

} // namespace ncmdump
