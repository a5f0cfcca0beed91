// Abstract decode/extract operation for a single queued file.
#pragma once
#include <string>

namespace ncmdump {

class Dumper {
public:
    virtual ~Dumper() = default;

    // Decodes file_path and writes the results into output_dir.
    // Returns false and sets err on failure; partial output may remain.
    virtual bool dump(const std::string& file_path,
                      const std::string& output_dir,
                      std::string& err) = 0;
};

} // namespace ncmdump
