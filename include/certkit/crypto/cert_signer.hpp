#pragma once
#include <string>
#include <string_view>
#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto
{

/// @brief Signs certificates under the digest policy and verifies their signatures.
class CertSigner final
{
public:
    /// @brief Selects the digest for signing with @p key.
    ///
    /// An empty @p digest selects the key default. Returns nullptr for
    /// algorithms that sign without a separate digest (Ed25519, Ed448).
    ///
    /// @throw CryptoException with Errc::UnknownDigest or Errc::DigestNotAllowed.
    static HashPtr resolveDigest(Key* key, std::string_view digest);

    static void sign(X509Cert* cert, Key* privateKey, std::string_view digest = {});

    /// @brief Signs with a digest already returned by resolveDigest().
    static void sign(X509Cert* cert, Key* privateKey, const Hash* md);

    /// @brief Checks the signature of @p cert with @p publicKey.
    ///
    /// @return false when the key doesn't match the signature algorithm family,
    /// when the key is wrong or when the certificate was changed after signing.
    static bool verify(X509Cert* cert, Key* publicKey);

    static bool checkPrivateKey(const X509Cert* cert, const Key* privateKey);

    /// @brief Long name of the signature algorithm, e.g. "sha256WithRSAEncryption".
    static std::string signatureAlgorithm(const X509Cert* cert);
};

} // namespace certkit::crypto
