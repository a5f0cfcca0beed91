// Abstract expansion of a dropped path into dump-eligible files. Concrete
// implementations are called from background threads and must be safe to
// call concurrently.
#pragma once
#include <string>
#include <vector>

namespace ncmdump {

class PathEnumerator {
public:
    virtual ~PathEnumerator() = default;

    // Fills out with the files represented by path, in the order they should
    // be queued. Returns false and sets err when path cannot be expanded.
    virtual bool enumerate(const std::string& path,
                           std::vector<std::string>& out,
                           std::string& err) = 0;
};

} // namespace ncmdump
