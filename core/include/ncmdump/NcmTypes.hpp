// Plain option/metadata structs shared between the UI and the core.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ncmdump {

// Extension used both for the picker filter and for directory scans.
inline constexpr const char* kNcmExtension = "ncm";

struct EnumerateOptions {
    bool recursive = true;        // descend into sub-directories
    int maxDepth = 32;            // levels below the dropped directory
    bool followSymlinks = false;  // follow directory symlinks while walking
    std::string extension = kNcmExtension; // without dot, case-sensitive
};

struct DumpOptions {
    bool writeCover = true;         // write the embedded cover next to the audio
    bool overwriteExisting = true;  // false: an existing audio target fails the item
};

// Subset of the JSON metadata block carried by an .ncm container.
struct NcmMetadata {
    std::string title;
    std::string album;
    std::vector<std::string> artists;
    std::string format;         // "mp3", "flac", ... (may be empty)
    std::uint32_t bitrate = 0;  // bits per second
    std::uint64_t durationMs = 0;
};

} // namespace ncmdump
