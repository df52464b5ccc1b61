#pragma once
#include <memory>
#include <string_view>
#include <certkit/crypto/pointers.hpp>
#include <casket/utils/singleton.hpp>

namespace certkit::crypto
{

/// @brief Fetches algorithms from the library context used by certkit.
class CryptoManager final : casket::Singleton<CryptoManager>
{
private:
    CryptoManager();

public:
    static CryptoManager& getInstance();

    ~CryptoManager() noexcept;

    /// @brief Fetches digest by name, returns nullptr when it's unknown.
    HashPtr tryFetchDigest(std::string_view algorithm);

    HashPtr fetchDigest(std::string_view algorithm);

    KeyCtxPtr createKeyContext(std::string_view algorithm);

    KeyCtxPtr createKeyContext(Key* key);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace certkit::crypto
