// Cryptographic building blocks of the .ncm container format.
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ncmdump {
namespace ncm {

using Bytes = std::vector<std::uint8_t>;
using KeyBox = std::array<std::uint8_t, 256>;

// File magic "CTENFDAM".
extern const std::array<std::uint8_t, 8> kMagic;
// AES-128 keys protecting the audio key and the metadata block.
extern const std::array<std::uint8_t, 16> kCoreKey;
extern const std::array<std::uint8_t, 16> kMetaKey;

constexpr std::uint8_t kKeyXor = 0x64;
constexpr std::uint8_t kMetaXor = 0x63;
constexpr std::size_t kKeyPrefixLen = 17;  // "neteasecloudmusic"
constexpr std::size_t kMetaPrefixLen = 22; // "163 key(Don't modify):"
constexpr std::size_t kMetaJsonSkip = 6;   // "music:"
constexpr std::size_t kAudioChunk = 0x8000;

// AES-128-ECB with PKCS#7 padding. Return false and set err on failure
// (bad padding usually means the wrong key or corrupted input).
bool aes128EcbDecrypt(const std::array<std::uint8_t, 16>& key, const Bytes& in,
                      Bytes& out, std::string& err);
bool aes128EcbEncrypt(const std::array<std::uint8_t, 16>& key, const Bytes& in,
                      Bytes& out, std::string& err);

// RC4-style key schedule over the decrypted audio key. key must not be empty.
KeyBox buildKeyBox(const Bytes& key);

// XORs data in place with the audio key stream. offset is the position of
// data[0] within the audio payload. The stream is symmetric, so the same call
// encrypts and decrypts.
void applyKeyStream(const KeyBox& box, std::uint8_t* data, std::size_t size,
                    std::uint64_t offset = 0);

} // namespace ncm
} // namespace ncmdump
