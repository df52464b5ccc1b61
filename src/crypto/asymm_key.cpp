#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/err.h>

#include <certkit/crypto/asymm_key.hpp>
#include <certkit/crypto/bio.hpp>

#include <certkit/crypto/exception.hpp>
#include <certkit/crypto/error_code.hpp>

namespace certkit::crypto
{

KeyPtr AsymmKey::shallowCopy(Key* key)
{
    if (key)
    {
        crypto::ThrowIfFalse(0 < EVP_PKEY_up_ref(key));
        return KeyPtr{key};
    }
    return nullptr;
}

bool AsymmKey::isAlgorithm(const Key* key, std::string_view alg)
{
    std::string name(alg);
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    return EVP_PKEY_is_a(key, name.c_str());
#else  // (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    const auto nid = OBJ_sn2nid(name.c_str());
    return EVP_PKEY_base_id(key) == nid;
#endif // !(OPENSSL_VERSION_NUMBER >= 0x30000000L)
}

int AsymmKey::algorithmId(const Key* key)
{
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    return EVP_PKEY_get_base_id(key);
#else  // (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    return EVP_PKEY_base_id(key);
#endif // !(OPENSSL_VERSION_NUMBER >= 0x30000000L)
}

bool AsymmKey::isEqual(const Key* a, const Key* b)
{
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    return 0 < EVP_PKEY_eq(a, b);
#else  // (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    return 0 < EVP_PKEY_cmp(a, b);
#endif //!(OPENSSL_VERSION_NUMBER >= 0x30000000L)
}

KeyPtr AsymmKey::fromFile(KeyType keyType, const std::filesystem::path& path)
{
    auto file = BioTraits::openFile(path, "rb");
    auto content = BioTraits::readAllData(file);
    ThrowIfTrue(content.empty(), Errc::EmptyInput, "key file '" + path.string() + "' is empty");

    auto reader = BioTraits::createMemoryReader(content.data(), content.size());
    const bool isPem = content.front() == '-';
    return fromBio(keyType, reader, isPem ? Encoding::PEM : Encoding::DER);
}

KeyPtr AsymmKey::fromBio(KeyType keyType, Bio* in, Encoding inEncoding)
{
    KeyPtr result;

    switch (inEncoding)
    {
    case Encoding::DER:
    {
        if (keyType == KeyType::Public)
        {
            result.reset(d2i_PUBKEY_bio(in, nullptr));
        }
        else
        {
            result.reset(d2i_PrivateKey_bio(in, nullptr));
        }
    }
    break;

    case Encoding::PEM:
    {
        if (keyType == KeyType::Public)
        {
            result.reset(PEM_read_bio_PUBKEY(in, nullptr, nullptr, nullptr));
        }
        else
        {
            result.reset(PEM_read_bio_PrivateKey(in, nullptr, nullptr, nullptr));
        }
    }
    break;

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported encoding");
    }
    break;
    }

    if (!result)
    {
        throw CryptoException(GetLastError(), "Failed to parse key");
    }

    return result;
}

void AsymmKey::toBio(KeyType keyType, Key* key, Bio* bio, Encoding encoding)
{
    int ret{0};

    switch (encoding)
    {
    case Encoding::DER:
    {
        if (keyType == KeyType::Public)
        {
            ret = i2d_PUBKEY_bio(bio, key);
        }
        else
        {
            ret = i2d_PrivateKey_bio(bio, key);
        }
    }
    break;

    case Encoding::PEM:
    {
        if (keyType == KeyType::Public)
        {
            ret = PEM_write_bio_PUBKEY(bio, key);
        }
        else
        {
            ret = PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr);
        }
    }
    break;

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported encoding");
    }
    break;
    }

    if (!ret)
    {
        throw CryptoException(GetLastError(), "Failed to save key");
    }
}

std::string AsymmKey::toPem(KeyType keyType, Key* key)
{
    auto bio = BioTraits::createMemoryBuffer();
    toBio(keyType, key, bio, Encoding::PEM);
    return BioTraits::getMemoryDataAsString(bio);
}

} // namespace certkit::crypto
