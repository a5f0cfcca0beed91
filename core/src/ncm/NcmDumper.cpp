// .ncm container parsing and audio/cover extraction.
#include "ncmdump/NcmDumper.hpp"
#include "ncmdump/NcmCipher.hpp"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace ncmdump {

namespace {

using ncm::Bytes;

struct NcmHeader {
    ncm::KeyBox keyBox{};
    NcmMetadata meta;
    bool hasMeta = false;
    Bytes image;
};

// Input stream plus the number of bytes not consumed yet, so length fields
// can be validated before allocating.
struct InputFile {
    std::ifstream in;
    std::uint64_t remaining = 0;
};

bool openInput(const std::string& path, InputFile& f, std::string& err) {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(fs::path(path), ec);
    if (ec) {
        err = "Cannot read input file: " + path;
        return false;
    }
    f.in.open(fs::path(path), std::ios::binary);
    if (!f.in.is_open()) {
        err = "Cannot open input file: " + path;
        return false;
    }
    f.remaining = size;
    return true;
}

bool readExact(InputFile& f, void* dst, std::size_t n) {
    if (n > f.remaining)
        return false;
    f.in.read(static_cast<char*>(dst), static_cast<std::streamsize>(n));
    if (static_cast<std::size_t>(f.in.gcount()) != n)
        return false;
    f.remaining -= n;
    return true;
}

std::size_t readSome(InputFile& f, std::uint8_t* dst, std::size_t n) {
    if (f.remaining == 0)
        return 0;
    const std::size_t want =
        static_cast<std::size_t>(std::min<std::uint64_t>(n, f.remaining));
    f.in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(want));
    const std::size_t got = static_cast<std::size_t>(f.in.gcount());
    f.remaining -= got;
    return got;
}

bool skipBytes(InputFile& f, std::size_t n) {
    if (n > f.remaining)
        return false;
    f.in.seekg(static_cast<std::streamoff>(n), std::ios::cur);
    if (!f.in)
        return false;
    f.remaining -= n;
    return true;
}

bool readU32(InputFile& f, std::uint32_t& v) {
    std::uint8_t b[4];
    if (!readExact(f, b, sizeof(b)))
        return false;
    v = static_cast<std::uint32_t>(b[0]) |
        (static_cast<std::uint32_t>(b[1]) << 8) |
        (static_cast<std::uint32_t>(b[2]) << 16) |
        (static_cast<std::uint32_t>(b[3]) << 24);
    return true;
}

std::string jsonString(const QJsonObject& o, const char* key) {
    return o.value(QLatin1String(key)).toString().toStdString();
}

bool parseMetadataJson(const Bytes& json, NcmMetadata& meta, std::string& err) {
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(
        QByteArray(reinterpret_cast<const char*>(json.data()),
                   static_cast<int>(json.size())),
        &perr);
    if (perr.error != QJsonParseError::NoError) {
        err = "Invalid metadata JSON: " + perr.errorString().toStdString();
        return false;
    }
    if (!doc.isObject()) {
        err = "Invalid metadata JSON: not an object";
        return false;
    }
    const QJsonObject o = doc.object();
    meta.title = jsonString(o, "musicName");
    meta.album = jsonString(o, "album");
    meta.format = jsonString(o, "format");
    meta.bitrate = static_cast<std::uint32_t>(o.value(QLatin1String("bitrate")).toDouble());
    meta.durationMs =
        static_cast<std::uint64_t>(o.value(QLatin1String("duration")).toDouble());
    // "artist": [["name", id], ...]
    const QJsonArray artists = o.value(QLatin1String("artist")).toArray();
    for (const QJsonValue& a : artists) {
        const QJsonArray pair = a.toArray();
        if (!pair.isEmpty() && pair.at(0).isString())
            meta.artists.push_back(pair.at(0).toString().toStdString());
    }
    return true;
}

bool readMetadataBlock(InputFile& f, std::uint32_t metaLen, NcmMetadata& meta,
                       std::string& err) {
    Bytes raw(metaLen);
    if (!readExact(f, raw.data(), raw.size())) {
        err = "Truncated metadata block";
        return false;
    }
    for (auto& b : raw)
        b ^= ncm::kMetaXor;
    if (raw.size() <= ncm::kMetaPrefixLen) {
        err = "Metadata block too short";
        return false;
    }

    const QByteArray b64(reinterpret_cast<const char*>(raw.data() + ncm::kMetaPrefixLen),
                         static_cast<int>(raw.size() - ncm::kMetaPrefixLen));
    const auto decoded = QByteArray::fromBase64Encoding(
        b64, QByteArray::Base64Encoding | QByteArray::AbortOnBase64DecodingErrors);
    if (decoded.decodingStatus != QByteArray::Base64DecodingStatus::Ok) {
        err = "Metadata is not valid base64";
        return false;
    }
    const QByteArray& d = decoded.decoded;
    const Bytes cipher(reinterpret_cast<const std::uint8_t*>(d.constData()),
                       reinterpret_cast<const std::uint8_t*>(d.constData()) + d.size());

    Bytes plain;
    if (!ncm::aes128EcbDecrypt(ncm::kMetaKey, cipher, plain, err)) {
        err = "Metadata block: " + err;
        return false;
    }
    if (plain.size() <= ncm::kMetaJsonSkip) {
        err = "Metadata payload too short";
        return false;
    }
    const Bytes json(plain.begin() + static_cast<std::ptrdiff_t>(ncm::kMetaJsonSkip),
                     plain.end());
    return parseMetadataJson(json, meta, err);
}

bool readHeader(InputFile& f, NcmHeader& h, std::string& err) {
    std::array<std::uint8_t, 8> magic{};
    if (!readExact(f, magic.data(), magic.size()) || magic != ncm::kMagic) {
        err = "Invalid file header";
        return false;
    }
    if (!skipBytes(f, 2)) {
        err = "Truncated header";
        return false;
    }

    std::uint32_t keyLen = 0;
    if (!readU32(f, keyLen) || keyLen == 0 || keyLen > f.remaining) {
        err = "Invalid key length";
        return false;
    }
    Bytes key(keyLen);
    if (!readExact(f, key.data(), key.size())) {
        err = "Truncated key block";
        return false;
    }
    for (auto& b : key)
        b ^= ncm::kKeyXor;
    Bytes plainKey;
    if (!ncm::aes128EcbDecrypt(ncm::kCoreKey, key, plainKey, err)) {
        err = "Key block: " + err;
        return false;
    }
    if (plainKey.size() <= ncm::kKeyPrefixLen) {
        err = "Key block too short";
        return false;
    }
    plainKey.erase(plainKey.begin(),
                   plainKey.begin() + static_cast<std::ptrdiff_t>(ncm::kKeyPrefixLen));
    h.keyBox = ncm::buildKeyBox(plainKey);

    std::uint32_t metaLen = 0;
    if (!readU32(f, metaLen) || metaLen > f.remaining) {
        err = "Invalid metadata length";
        return false;
    }
    if (metaLen > 0) {
        if (!readMetadataBlock(f, metaLen, h.meta, err))
            return false;
        h.hasMeta = true;
    }

    std::uint32_t crc = 0; // not verified
    if (!readU32(f, crc) || !skipBytes(f, 5)) {
        err = "Truncated header";
        return false;
    }
    std::uint32_t imageSize = 0;
    if (!readU32(f, imageSize) || imageSize > f.remaining) {
        err = "Invalid image length";
        return false;
    }
    h.image.resize(imageSize);
    if (imageSize > 0 && !readExact(f, h.image.data(), h.image.size())) {
        err = "Truncated image block";
        return false;
    }
    return true;
}

// Metadata format ends up in a file name; only short alphanumeric values
// are accepted.
std::string sanitizeFormat(const std::string& raw) {
    if (raw.empty() || raw.size() > 8)
        return {};
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc))
            return {};
        out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out;
}

std::string formatFromMagic(const std::uint8_t* data, std::size_t n) {
    if (n >= 4 && data[0] == 'f' && data[1] == 'L' && data[2] == 'a' && data[3] == 'C')
        return "flac";
    return "mp3";
}

std::string imageExtension(const Bytes& img) {
    if (img.size() >= 3 && img[0] == 0xFF && img[1] == 0xD8 && img[2] == 0xFF)
        return "jpg";
    return "png";
}

bool writeFile(const fs::path& path, const Bytes& data, std::string& err) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        err = "Cannot create output file: " + path.string();
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        err = "Failed writing " + path.string();
        return false;
    }
    return true;
}

} // namespace

void NcmDumper::setOptions(const DumpOptions& opt) {
    std::lock_guard<std::mutex> lk(mtx_);
    opt_ = opt;
}

DumpOptions NcmDumper::options() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return opt_;
}

bool NcmDumper::readMetadata(const std::string& file_path, NcmMetadata& meta,
                             std::string& err) {
    InputFile f;
    if (!openInput(file_path, f, err))
        return false;
    NcmHeader h;
    if (!readHeader(f, h, err))
        return false;
    meta = h.meta;
    return true;
}

bool NcmDumper::dump(const std::string& file_path,
                     const std::string& output_dir,
                     std::string& err) {
    const DumpOptions opt = options();
    const fs::path outDir(output_dir);
    std::error_code ec;
    if (!fs::is_directory(outDir, ec)) {
        err = "Output directory does not exist: " + output_dir;
        return false;
    }

    InputFile f;
    if (!openInput(file_path, f, err))
        return false;
    NcmHeader h;
    if (!readHeader(f, h, err))
        return false;

    // First chunk is decrypted up front so the format can be sniffed when
    // the metadata does not name it.
    Bytes chunk(ncm::kAudioChunk);
    std::uint64_t offset = 0;
    std::size_t got = readSome(f, chunk.data(), chunk.size());
    ncm::applyKeyStream(h.keyBox, chunk.data(), got, offset);

    std::string format = sanitizeFormat(h.meta.format);
    if (format.empty())
        format = formatFromMagic(chunk.data(), got);

    const std::string stem = fs::path(file_path).stem().string();
    const fs::path audioPath = outDir / (stem + "." + format);
    if (!opt.overwriteExisting && fs::exists(audioPath, ec)) {
        err = "Output already exists: " + audioPath.string();
        return false;
    }

    std::ofstream out(audioPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        err = "Cannot create output file: " + audioPath.string();
        return false;
    }
    while (got > 0) {
        out.write(reinterpret_cast<const char*>(chunk.data()),
                  static_cast<std::streamsize>(got));
        if (!out) {
            err = "Failed writing " + audioPath.string();
            return false;
        }
        offset += got;
        got = readSome(f, chunk.data(), chunk.size());
        ncm::applyKeyStream(h.keyBox, chunk.data(), got, offset);
    }
    if (f.in.bad() || f.remaining != 0) {
        err = "Read error in audio payload of " + file_path;
        return false;
    }
    out.close();
    if (!out) {
        err = "Failed writing " + audioPath.string();
        return false;
    }

    if (opt.writeCover && !h.image.empty()) {
        const fs::path coverPath = outDir / (stem + "." + imageExtension(h.image));
        if (opt.overwriteExisting || !fs::exists(coverPath, ec)) {
            if (!writeFile(coverPath, h.image, err))
                return false;
        }
    }
    return true;
}

} // namespace ncmdump
