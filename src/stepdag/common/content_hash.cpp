/**
 * @file content_hash.cpp
 */
#include "stepdag/common/content_hash.hpp"

#include <openssl/evp.h>

namespace stepdag
{

struct Md5Hasher::Impl
{
    EVP_MD_CTX* ctx{nullptr};
    bool finalized{false};
};

Md5Hasher::Md5Hasher()
    : m_impl(std::make_unique<Impl>())
{
    m_impl->ctx = EVP_MD_CTX_new();
    if (m_impl->ctx == nullptr)
    {
        throw std::runtime_error("Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(m_impl->ctx, EVP_md5(), nullptr) != 1)
    {
        EVP_MD_CTX_free(m_impl->ctx);
        throw std::runtime_error("Failed to initialize MD5 digest");
    }
}

Md5Hasher::~Md5Hasher()
{
    EVP_MD_CTX_free(m_impl->ctx);
}

void Md5Hasher::update(const std::string& data)
{
    if (m_impl->finalized)
    {
        throw std::logic_error("Md5Hasher::update called after hexdigest");
    }
    if (EVP_DigestUpdate(m_impl->ctx, data.data(), data.size()) != 1)
    {
        throw std::runtime_error("MD5 digest update failed");
    }
}

std::string Md5Hasher::hexdigest()
{
    if (m_impl->finalized)
    {
        throw std::logic_error("Md5Hasher::hexdigest called twice");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(m_impl->ctx, digest, &length) != 1)
    {
        throw std::runtime_error("MD5 digest finalization failed");
    }
    m_impl->finalized = true;

    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
    {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0x0f]);
    }
    return result;
}

std::string hash_source_code(const std::string& source_code)
{
    Md5Hasher hasher;
    hasher.update(source_code);
    return hasher.hexdigest();
}

} // namespace stepdag
