#include <string>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/dsa.h>
#include <openssl/core_names.h>

#include <certkit/crypto/asymm_keygen.hpp>
#include <certkit/crypto/crypto_manager.hpp>
#include <certkit/crypto/exception.hpp>

using namespace certkit;

namespace
{

crypto::KeyPtr generateFromContext(crypto::KeyCtx* ctx)
{
    EVP_PKEY* pkey{nullptr};
    crypto::ThrowIfFalse(0 < EVP_PKEY_generate(ctx, &pkey));
    return crypto::KeyPtr{pkey};
}

} // namespace

namespace certkit::crypto::akey
{

namespace rsa
{

KeyPtr generate(size_t bits)
{
    auto ctx = CryptoManager::getInstance().createKeyContext("RSA");
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, static_cast<int>(bits)));
    return ::generateFromContext(ctx);
}

} // namespace rsa

namespace dsa
{

KeyPtr generate(size_t bits)
{
    auto paramCtx = CryptoManager::getInstance().createKeyContext("DSA");
    crypto::ThrowIfFalse(0 < EVP_PKEY_paramgen_init(paramCtx));
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_dsa_paramgen_bits(paramCtx, static_cast<int>(bits)));
    // FIPS 186-4 pairs: (1024, 160), (2048, 256), (3072, 256).
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_dsa_paramgen_q_bits(paramCtx, bits <= 1024 ? 160 : 256));

    EVP_PKEY* rawParams{nullptr};
    crypto::ThrowIfFalse(0 < EVP_PKEY_paramgen(paramCtx, &rawParams));
    KeyPtr params{rawParams};

    auto keyCtx = CryptoManager::getInstance().createKeyContext(params);
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(keyCtx));
    return ::generateFromContext(keyCtx);
}

} // namespace dsa

namespace ec
{

KeyPtr generate(std::string_view groupName)
{
    std::string group(groupName);
    OSSL_PARAM params[] = {OSSL_PARAM_END, OSSL_PARAM_END};
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group.data(), 0);

    auto ctx = CryptoManager::getInstance().createKeyContext("EC");
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_params(ctx, params));
    return ::generateFromContext(ctx);
}

} // namespace ec

namespace ed25519
{

KeyPtr generate()
{
    auto ctx = CryptoManager::getInstance().createKeyContext("ED25519");
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    return ::generateFromContext(ctx);
}

} // namespace ed25519

} // namespace certkit::crypto::akey
