#pragma once
#include <certkit/crypto/typedefs.hpp>
#include <certkit/crypto/exception.hpp>
#include <openssl/evp.h>

namespace certkit::crypto
{

class Signature
{
public:
    /// @brief Prepares @p ctx for signing. @p hash is nullptr for one-shot algorithms.
    static inline void signInit(HashCtx* ctx, const Hash* hash, Key* privateKey, KeyCtx** keyCtx = nullptr)
    {
        ThrowIfFalse(0 < EVP_DigestSignInit(ctx, keyCtx, hash, nullptr, privateKey));
    }
};

} // namespace certkit::crypto
