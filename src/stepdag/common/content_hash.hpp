/**
 * @file content_hash.hpp
 * @brief MD5 content hashing for source code identity.
 */
#pragma once
#include "stepdag/common/common.hpp"

namespace stepdag
{

/**
 * @brief Incremental MD5 digest producing a lowercase hex string.
 *
 * @details
 * Wraps an OpenSSL EVP digest context. A hasher is single-use: after
 * `hexdigest()` no further updates are accepted.
 */
class Md5Hasher
{
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;

    /**
     * @brief Feed bytes into the digest.
     * @throws std::logic_error if the digest was already finalized.
     */
    void update(const std::string& data);

    /**
     * @brief Finalize and return the 32 character hex digest.
     */
    std::string hexdigest();

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief MD5 hex digest of a source text.
 */
std::string hash_source_code(const std::string& source_code);

} // namespace stepdag
