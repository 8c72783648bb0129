#include "io/content_hash.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace tabfetch {

Md5Hasher::Md5Hasher()
    : ctx_(EVP_MD_CTX_new()), finished_(false)
{
    if (!ctx_) {
        throw TabfetchError("Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw TabfetchError("Failed to initialise MD5 digest");
    }
}

Md5Hasher::~Md5Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Md5Hasher::update(const char* data, std::size_t size) {
    if (finished_) {
        throw StateError("Digest already finalised");
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw TabfetchError("MD5 digest update failed");
    }
}

std::string Md5Hasher::hex_digest() {
    if (finished_) {
        throw StateError("Digest already finalised");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &length) != 1) {
        throw TabfetchError("MD5 digest finalisation failed");
    }
    finished_ = true;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string md5_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw TabfetchError("Cannot open file for hashing: " + path);
    }

    Md5Hasher hasher;
    std::array<char, 10240> chunk;
    while (file.read(chunk.data(), chunk.size()) || file.gcount() > 0) {
        hasher.update(chunk.data(), static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw TabfetchError("Error reading file for hashing: " + path);
    }
    return hasher.hex_digest();
}

} // namespace tabfetch
