#pragma once
#include "PathEnumerator.hpp"
#include "NcmTypes.hpp"
#include <mutex>

namespace ncmdump {

// Expands a local file or directory into the .ncm files it contains.
// Directory entries are visited in name order.
class FilesystemPathEnumerator : public PathEnumerator {
public:
    FilesystemPathEnumerator() = default;
    explicit FilesystemPathEnumerator(const EnumerateOptions& opt) : opt_(opt) {}

    void setOptions(const EnumerateOptions& opt);
    EnumerateOptions options() const;

    bool enumerate(const std::string& path,
                   std::vector<std::string>& out,
                   std::string& err) override;

private:
    mutable std::mutex mtx_; // protects opt_ (read from worker threads)
    EnumerateOptions opt_;
};

} // namespace ncmdump
