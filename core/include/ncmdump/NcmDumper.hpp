// Decoder for NetEase Cloud Music .ncm containers.
#pragma once
#include "Dumper.hpp"
#include "NcmTypes.hpp"
#include <mutex>

namespace ncmdump {

class NcmDumper : public Dumper {
public:
    NcmDumper() = default;
    explicit NcmDumper(const DumpOptions& opt) : opt_(opt) {}

    void setOptions(const DumpOptions& opt);
    DumpOptions options() const;

    // Writes <stem>.<format> and, if enabled and present, the cover image
    // (<stem>.png or <stem>.jpg) into output_dir.
    bool dump(const std::string& file_path,
              const std::string& output_dir,
              std::string& err) override;

    // Parses the header blocks only. Returns true with an empty meta when the
    // container carries no metadata.
    static bool readMetadata(const std::string& file_path,
                             NcmMetadata& meta,
                             std::string& err);

private:
    mutable std::mutex mtx_;
    DumpOptions opt_;
};

} // namespace ncmdump
