// Ordered, duplicate-free list of pending input paths.
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace ncmdump {

// Insertion order decides dispatch order; membership is by exact string value.
// add() is the only place that can grow the queue, so it is the only place
// that has to check for duplicates.
class FileQueue {
public:
    // Appends path unless it is already queued. Returns true if appended.
    bool add(const std::string& path);
    // Removes path if present. Returns true if something was removed.
    bool remove(const std::string& path);
    void clear();

    bool contains(const std::string& path) const { return members_.count(path) > 0; }
    std::optional<std::size_t> indexOf(const std::string& path) const;

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<std::string>& items() const { return items_; }

    // Independent copy of the current contents, used as a batch work list.
    std::vector<std::string> snapshot() const { return items_; }

private:
    std::vector<std::string> items_;
    std::unordered_set<std::string> members_;
};

} // namespace ncmdump
