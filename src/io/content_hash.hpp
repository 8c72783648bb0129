#ifndef TABFETCH_IO_CONTENT_HASH_HPP
#define TABFETCH_IO_CONTENT_HASH_HPP

#include <cstddef>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace tabfetch {

/**
 * @brief Incremental MD5 digest over OpenSSL EVP
 */
class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;

    void update(const char* data, std::size_t size);
    void update(const std::string& data) { update(data.data(), data.size()); }

    /**
     * @brief Lowercase hex digest; the hasher cannot be updated afterwards
     */
    std::string hex_digest();

private:
    EVP_MD_CTX* ctx_;
    bool finished_;
};

/**
 * @brief MD5 hex digest of a file, read in 10240 byte chunks
 *
 * @throws TabfetchError if the file cannot be read
 */
std::string md5_file(const std::string& path);

} // namespace tabfetch

#endif // TABFETCH_IO_CONTENT_HASH_HPP
