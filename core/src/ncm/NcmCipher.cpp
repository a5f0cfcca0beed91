#include "ncmdump/NcmCipher.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <memory>

namespace ncmdump {
namespace ncm {

const std::array<std::uint8_t, 8> kMagic = {'C', 'T', 'E', 'N', 'F', 'D', 'A', 'M'};

// "hzHRAmso5kInbaxW"
const std::array<std::uint8_t, 16> kCoreKey = {
    0x68, 0x7A, 0x48, 0x52, 0x41, 0x6D, 0x73, 0x6F,
    0x35, 0x6B, 0x49, 0x6E, 0x62, 0x61, 0x78, 0x57};

// "#14ljk_!\]&0U<'("
const std::array<std::uint8_t, 16> kMetaKey = {
    0x23, 0x31, 0x34, 0x6C, 0x6A, 0x6B, 0x5F, 0x21,
    0x5C, 0x5D, 0x26, 0x30, 0x55, 0x3C, 0x27, 0x28};

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string opensslError(const char* what) {
    std::string msg(what);
    const unsigned long code = ERR_get_error();
    if (code != 0) {
        char buf[256] = {0};
        ERR_error_string_n(code, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    ERR_clear_error();
    return msg;
}

bool aes128Ecb(bool encrypt, const std::array<std::uint8_t, 16>& key,
               const Bytes& in, Bytes& out, std::string& err) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        err = opensslError("EVP_CIPHER_CTX_new failed");
        return false;
    }
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr, key.data(),
                          nullptr, encrypt ? 1 : 0) != 1) {
        err = opensslError("AES init failed");
        return false;
    }
    // PKCS#7 padding is enabled by default.
    Bytes buf(in.size() + 16);
    int updLen = 0;
    if (EVP_CipherUpdate(ctx.get(), buf.data(), &updLen, in.data(),
                         static_cast<int>(in.size())) != 1) {
        err = opensslError("AES update failed");
        return false;
    }
    int finLen = 0;
    if (EVP_CipherFinal_ex(ctx.get(), buf.data() + updLen, &finLen) != 1) {
        err = opensslError(encrypt ? "AES finalize failed"
                                   : "AES decrypt failed (bad padding)");
        return false;
    }
    buf.resize(static_cast<std::size_t>(updLen + finLen));
    out.swap(buf);
    return true;
}

} // namespace

bool aes128EcbDecrypt(const std::array<std::uint8_t, 16>& key, const Bytes& in,
                      Bytes& out, std::string& err) {
    return aes128Ecb(false, key, in, out, err);
}

bool aes128EcbEncrypt(const std::array<std::uint8_t, 16>& key, const Bytes& in,
                      Bytes& out, std::string& err) {
    return aes128Ecb(true, key, in, out, err);
}

KeyBox buildKeyBox(const Bytes& key) {
    KeyBox box;
    for (std::size_t i = 0; i < box.size(); ++i)
        box[i] = static_cast<std::uint8_t>(i);

    std::uint8_t last = 0;
    std::size_t keyOffset = 0;
    for (std::size_t i = 0; i < box.size(); ++i) {
        const std::uint8_t swap = box[i];
        const std::uint8_t c =
            static_cast<std::uint8_t>((swap + last + key[keyOffset]) & 0xFF);
        if (++keyOffset >= key.size())
            keyOffset = 0;
        box[i] = box[c];
        box[c] = swap;
        last = c;
    }
    return box;
}

void applyKeyStream(const KeyBox& box, std::uint8_t* data, std::size_t size,
                    std::uint64_t offset) {
    for (std::size_t i = 0; i < size; ++i) {
        const std::size_t j = static_cast<std::size_t>((offset + i + 1) & 0xFF);
        const std::size_t k = (box[j] + box[(box[j] + j) & 0xFF]) & 0xFF;
        data[i] ^= box[k];
    }
}

} // namespace ncm
} // namespace ncmdump
