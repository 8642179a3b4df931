#include "northstar/crypto.h"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/sha.h>

#include "northstar/error.h"
#include "northstar/filesystem.h"

namespace {

constexpr size_t ED25519_KEY_SIZE = 32;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

PublicKey::PublicKey(EVP_PKEY* key) : key_(key, EVP_PKEY_free) {}

PublicKey PublicKey::from_raw(const std::vector<unsigned char>& raw) {
    if (raw.size() != ED25519_KEY_SIZE) {
        throw NorthstarError(ErrorCode::ConfigError, "Ed25519 public key must be 32 bytes");
    }
    EVP_PKEY* key = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, raw.data(), raw.size());
    if (!key) {
        throw NorthstarError(ErrorCode::ConfigError, "invalid Ed25519 public key: " + openssl_error_string());
    }
    return PublicKey(key);
}

PublicKey PublicKey::load(const std::string& path) {
    std::string contents;
    if (!read_file(path, contents)) {
        throw NorthstarError(ErrorCode::ConfigError, "cannot read public key: " + path);
    }
    if (contents.size() == ED25519_KEY_SIZE) {
        return from_raw(std::vector<unsigned char>(contents.begin(), contents.end()));
    }
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(contents.data(), static_cast<int>(contents.size())));
    if (!bio) {
        throw NorthstarError(ErrorCode::ConfigError, "BIO_new_mem_buf failed: " + openssl_error_string());
    }
    EVP_PKEY* key = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (!key) {
        throw NorthstarError(ErrorCode::ConfigError, "cannot parse public key " + path + ": " + openssl_error_string());
    }
    if (EVP_PKEY_id(key) != EVP_PKEY_ED25519) {
        EVP_PKEY_free(key);
        throw NorthstarError(ErrorCode::ConfigError, "public key is not Ed25519: " + path);
    }
    return PublicKey(key);
}

bool PublicKey::verify(const std::string& message, const std::vector<unsigned char>& signature) const {
    if (!key_) {
        return false;
    }
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        ERR_clear_error();
        return false;
    }
    int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                              reinterpret_cast<const unsigned char*>(message.data()), message.size());
    if (rc != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int size = 0;
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &size) != 1) {
        throw NorthstarError(ErrorCode::Io, "sha256 failed: " + openssl_error_string());
    }
    return hex_encode(digest, size);
}

std::string hex_encode(const unsigned char* data, size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

bool hex_decode(const std::string& hex, std::vector<unsigned char>& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        out.push_back(static_cast<unsigned char>((high << 4) | low));
    }
    return true;
}

std::string openssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}
