#pragma once

#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

// Ed25519 verification key. Copies share the underlying EVP_PKEY.
class PublicKey {
public:
    PublicKey() = default;

    // Accepts a raw 32 byte Ed25519 key or a PEM SubjectPublicKeyInfo file.
    static PublicKey load(const std::string& path);
    static PublicKey from_raw(const std::vector<unsigned char>& raw);

    bool valid() const { return key_ != nullptr; }
    bool verify(const std::string& message, const std::vector<unsigned char>& signature) const;

private:
    explicit PublicKey(EVP_PKEY* key);

    std::shared_ptr<EVP_PKEY> key_;
};

std::string sha256_hex(const std::string& data);
std::string hex_encode(const unsigned char* data, size_t size);
bool hex_decode(const std::string& hex, std::vector<unsigned char>& out);
std::string openssl_error_string();
