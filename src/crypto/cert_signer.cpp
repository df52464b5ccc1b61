#include <array>
#include <cstring>
#include <initializer_list>

#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/x509.h>

#include <casket/log/log_manager.hpp>
#include <casket/utils/exception.hpp>

#include <certkit/crypto/cert_signer.hpp>
#include <certkit/crypto/asymm_key.hpp>
#include <certkit/crypto/crypto_manager.hpp>
#include <certkit/crypto/hash_traits.hpp>
#include <certkit/crypto/signature.hpp>
#include <certkit/crypto/exception.hpp>

using namespace certkit::crypto;

namespace
{

const std::initializer_list<const char*> kSha2Family = {"SHA2-224", "SHA2-256", "SHA2-384",
                                                        "SHA2-512", "SHA2-512/224", "SHA2-512/256"};

const std::initializer_list<const char*> kSha3Family = {"SHA3-224", "SHA3-256", "SHA3-384", "SHA3-512"};

const std::initializer_list<const char*> kDsaDigests = {"SHA1", "SHA2-224", "SHA2-256", "SHA2-384", "SHA2-512"};

bool IsOneOf(const Hash* md, std::initializer_list<const char*> names)
{
    for (auto name : names)
    {
        if (HashTraits::isAlgorithm(md, name))
        {
            return true;
        }
    }
    return false;
}

bool IsAllowed(Key* key, const Hash* md)
{
    if (AsymmKey::isAlgorithm(key, "RSA") || AsymmKey::isAlgorithm(key, "RSA-PSS"))
    {
        return HashTraits::isAlgorithm(md, "MD5") || HashTraits::isAlgorithm(md, "SHA1") ||
               IsOneOf(md, kSha2Family) || IsOneOf(md, kSha3Family);
    }
    if (AsymmKey::isAlgorithm(key, "DSA"))
    {
        return IsOneOf(md, kDsaDigests);
    }
    if (AsymmKey::isAlgorithm(key, "EC"))
    {
        return HashTraits::isAlgorithm(md, "SHA1") || IsOneOf(md, kSha2Family) || IsOneOf(md, kSha3Family);
    }
    // Other algorithms are left to the provider.
    return true;
}

bool IsOneShot(const Key* key)
{
    return AsymmKey::isAlgorithm(key, "ED25519") || AsymmKey::isAlgorithm(key, "ED448");
}

bool IsSameFamily(int signatureKeyNid, int keyId)
{
    if (signatureKeyNid == keyId)
    {
        return true;
    }
    if (signatureKeyNid == NID_rsassaPss || signatureKeyNid == NID_rsaEncryption)
    {
        return keyId == EVP_PKEY_RSA || keyId == EVP_PKEY_RSA_PSS;
    }
    return false;
}

} // namespace

namespace certkit::crypto
{

HashPtr CertSigner::resolveDigest(Key* key, std::string_view digest)
{
    casket::ThrowIfTrue(key == nullptr, "signing key not specified");

    if (IsOneShot(key))
    {
        ThrowIfTrue(!digest.empty(), Errc::DigestNotAllowed,
                    "digest '" + std::string(digest) + "' can't be used with one-shot signature algorithm");
        return nullptr;
    }

    if (digest.empty())
    {
        std::array<char, 80> name{};
        int ret = EVP_PKEY_get_default_digest_name(key, name.data(), name.size());
        if (ret <= 0 || name[0] == '\0' || std::strcmp(name.data(), "UNDEF") == 0)
        {
            ERR_clear_error();
            return nullptr;
        }
        return CryptoManager::getInstance().fetchDigest(name.data());
    }

    auto md = CryptoManager::getInstance().tryFetchDigest(digest);
    ThrowIfTrue(md == nullptr, Errc::UnknownDigest, "unknown digest '" + std::string(digest) + "'");
    ThrowIfTrue(!IsAllowed(key, md), Errc::DigestNotAllowed,
                "digest '" + std::string(digest) + "' isn't allowed for the signing key");
    return md;
}

void CertSigner::sign(X509Cert* cert, Key* privateKey, std::string_view digest)
{
    auto md = resolveDigest(privateKey, digest);
    sign(cert, privateKey, md);
}

void CertSigner::sign(X509Cert* cert, Key* privateKey, const Hash* md)
{
    casket::ThrowIfTrue(privateKey == nullptr, "signing key not specified");

    casket::debug("signing certificate with {}", md ? HashTraits::getName(md) : "one-shot algorithm");

    auto ctx = HashTraits::createContext();
    Signature::signInit(ctx, md, privateKey);
    ThrowIfFalse(0 < X509_sign_ctx(cert, ctx), "unable to sign certificate");
}

bool CertSigner::verify(X509Cert* cert, Key* publicKey)
{
    casket::ThrowIfTrue(publicKey == nullptr, "public key not specified");

    int mdNid{NID_undef};
    int pkeyNid{NID_undef};
    ThrowIfTrue(!OBJ_find_sigid_algs(X509_get_signature_nid(cert), &mdNid, &pkeyNid), Errc::DecodeError,
                "unknown signature algorithm");

    if (!IsSameFamily(pkeyNid, AsymmKey::algorithmId(publicKey)))
    {
        return false;
    }

    int ret = X509_verify(cert, publicKey);
    ThrowIfTrue(ret < 0, "unable to verify certificate signature");
    if (ret == 0)
    {
        ERR_clear_error();
        return false;
    }
    return true;
}

bool CertSigner::checkPrivateKey(const X509Cert* cert, const Key* privateKey)
{
    if (0 < X509_check_private_key(cert, privateKey))
    {
        return true;
    }
    ERR_clear_error();
    return false;
}

std::string CertSigner::signatureAlgorithm(const X509Cert* cert)
{
    const int nid = X509_get_signature_nid(cert);
    const char* name = OBJ_nid2ln(nid);
    ThrowIfTrue(name == nullptr, Errc::DecodeError, "unknown signature algorithm");
    return name;
}

} // namespace certkit::crypto
