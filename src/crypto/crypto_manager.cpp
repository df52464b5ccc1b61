#include <string>
#include <openssl/err.h>
#include <certkit/crypto/crypto_manager.hpp>
#include <certkit/crypto/exception.hpp>

namespace certkit::crypto
{

struct CryptoManager::Impl final
{
public:
    Impl()
        : libctx(nullptr)
    {
    }

    ~Impl() noexcept
    {
    }

    OSSL_LIB_CTX* libctx;
};

CryptoManager::CryptoManager()
    : impl_(std::make_unique<Impl>())
{
}

CryptoManager& CryptoManager::getInstance()
{
    static CryptoManager instance;
    return instance;
}

CryptoManager::~CryptoManager() noexcept
{
}

HashPtr CryptoManager::tryFetchDigest(std::string_view algorithm)
{
    std::string name(algorithm);
    auto digest = HashPtr(EVP_MD_fetch(impl_->libctx, name.c_str(), nullptr));
    if (!digest)
    {
        ERR_clear_error();
    }
    return digest;
}

HashPtr CryptoManager::fetchDigest(std::string_view algorithm)
{
    std::string name(algorithm);
    auto digest = HashPtr(EVP_MD_fetch(impl_->libctx, name.c_str(), nullptr));
    ThrowIfTrue(digest == nullptr, "unable to fetch digest '" + name + "'");
    return digest;
}

KeyCtxPtr CryptoManager::createKeyContext(std::string_view algorithm)
{
    std::string name(algorithm);
    auto ctx = KeyCtxPtr(EVP_PKEY_CTX_new_from_name(impl_->libctx, name.c_str(), nullptr));
    ThrowIfTrue(ctx == nullptr);
    return ctx;
}

KeyCtxPtr CryptoManager::createKeyContext(Key* key)
{
    auto ctx = KeyCtxPtr(EVP_PKEY_CTX_new_from_pkey(impl_->libctx, key, nullptr));
    ThrowIfTrue(ctx == nullptr);
    return ctx;
}

} // namespace certkit::crypto
