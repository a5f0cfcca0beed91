// Local filesystem expansion of dropped paths into .ncm candidates.
#include "ncmdump/FilesystemPathEnumerator.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace ncmdump {

static bool hasExtension(const fs::path& p, const std::string& ext) {
    const std::string e = p.extension().string();
    // extension() keeps the leading dot
    return e.size() > 1 && e.compare(1, std::string::npos, ext) == 0;
}

static void walkDirectory(const fs::path& dir, int depth,
                          const EnumerateOptions& opt,
                          std::vector<std::string>& out) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    // An unreadable directory (or one that fails mid-listing) contributes
    // whatever was listed before the error.
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& e : entries) {
        std::error_code sec;
        const bool isLink = e.is_symlink(sec);
        if (e.is_directory(sec)) {
            if (isLink && !opt.followSymlinks)
                continue;
            if (opt.recursive && depth < opt.maxDepth)
                walkDirectory(e.path(), depth + 1, opt, out);
            continue;
        }
        if (e.is_regular_file(sec) && hasExtension(e.path(), opt.extension))
            out.push_back(e.path().string());
    }
}

void FilesystemPathEnumerator::setOptions(const EnumerateOptions& opt) {
    std::lock_guard<std::mutex> lk(mtx_);
    opt_ = opt;
}

EnumerateOptions FilesystemPathEnumerator::options() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return opt_;
}

bool FilesystemPathEnumerator::enumerate(const std::string& path,
                                         std::vector<std::string>& out,
                                         std::string& err) {
    const EnumerateOptions opt = options();
    out.clear();
    if (path.empty()) {
        err = "Empty path";
        return false;
    }

    const fs::path p(path);
    std::error_code ec;
    const fs::file_status st = fs::status(p, ec);
    if (ec || !fs::exists(st)) {
        err = "Path does not exist: " + path;
        return false;
    }

    if (fs::is_regular_file(st)) {
        if (hasExtension(p, opt.extension))
            out.push_back(path);
        return true;
    }
    if (fs::is_directory(st))
        walkDirectory(p, 0, opt, out);
    // Sockets, fifos and the like simply expand to nothing.
    return true;
}

} // namespace ncmdump
