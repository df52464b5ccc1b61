#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto
{

class AsymmKey
{
public:
    static KeyPtr shallowCopy(Key* key);

    static bool isAlgorithm(const Key* key, std::string_view alg);

    /// @brief Algorithm identifier of the key (EVP_PKEY_RSA, EVP_PKEY_DSA, ...).
    static int algorithmId(const Key* key);

    static bool isEqual(const Key* a, const Key* b);

    /// @brief Loads a key from PEM or DER file.
    static KeyPtr fromFile(KeyType keyType, const std::filesystem::path& path);

    static KeyPtr fromBio(KeyType keyType, Bio* in, Encoding inEncoding);

    static void toBio(KeyType keyType, Key* key, Bio* bio, Encoding encoding = Encoding::PEM);

    static std::string toPem(KeyType keyType, Key* key);
};

} // namespace certkit::crypto
