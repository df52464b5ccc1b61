#pragma once
#include <string>
#include <string_view>
#include <openssl/evp.h>
#include <certkit/crypto/pointers.hpp>
#include <certkit/crypto/exception.hpp>

namespace certkit::crypto
{

class HashTraits
{
public:
    static inline bool isAlgorithm(const Hash* hash, std::string_view alg)
    {
        std::string name(alg);
        return EVP_MD_is_a(hash, name.c_str());
    }

    static inline const char* getName(const Hash* hash) noexcept
    {
        return EVP_MD_get0_name(hash);
    }

    static inline HashCtxPtr createContext()
    {
        auto ctx = HashCtxPtr{EVP_MD_CTX_new()};
        ThrowIfTrue(ctx == nullptr, "bad alloc");
        return ctx;
    }
};

} // namespace certkit::crypto
