#pragma once
#include <ctime>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <certkit/crypto/pointers.hpp>
#include <casket/nonstd/span.hpp>

namespace certkit::crypto
{

class Cert final
{
public:
    static X509CertPtr shallowCopy(X509Cert* cert);

    static X509CertPtr deepCopy(X509Cert* cert);

    /// @brief Structural equality over the signed fields and the signature.
    static bool isEqual(const X509Cert* op1, const X509Cert* op2);

    static CertVersion version(X509Cert* cert);

    static X509NamePtr subjectName(X509Cert* cert);

    static X509NamePtr issuerName(X509Cert* cert);

    static BigNumPtr serialNumber(X509Cert* cert);

    static KeyPtr publicKey(X509Cert* cert);

    static std::time_t notBefore(X509Cert* cert);

    static std::time_t notAfter(X509Cert* cert);

    /// @name Mutators.
    /// Any change made after signing invalidates the signature.
    /// @{

    static void setSerialNumber(X509Cert* cert, const BigNum* serialNumber);

    static void setSubjectName(X509Cert* cert, OSSL_CONST_COMPAT X509Name* name);

    static void setIssuerName(X509Cert* cert, OSSL_CONST_COMPAT X509Name* name);

    static void setNotBefore(X509Cert* cert, std::time_t time);

    static void setNotAfter(X509Cert* cert, std::time_t time);

    /// @}

    /// @brief Loads the first certificate of @p path, PEM or DER.
    static X509CertPtr fromFile(const std::filesystem::path& path);

    /// @brief Loads all certificates from @p path in file order.
    ///
    /// A file holding a single DER certificate gives one certificate,
    /// otherwise the file is read as a sequence of PEM blocks.
    static std::vector<X509CertPtr> loadFile(const std::filesystem::path& path);

    static X509CertPtr fromBio(Bio* bio, Encoding encoding = Encoding::PEM);

    static void toBio(X509Cert* cert, Bio* bio, Encoding encoding = Encoding::PEM);

    static X509CertPtr fromDer(nonstd::span<const uint8_t> input);

    static std::vector<uint8_t> toDer(OSSL_CONST_COMPAT X509Cert* cert);

    static X509CertPtr fromPem(std::string_view input);

    static std::string toPem(X509Cert* cert);

    /// @brief Parses DER first, then PEM.
    static X509CertPtr decode(nonstd::span<const uint8_t> input);

    static std::vector<uint8_t> serialize(OSSL_CONST_COMPAT X509Cert* cert);

    static X509CertPtr deserialize(nonstd::span<const uint8_t> input);

    /// @brief DER of TBSCertificate, encoded again from the current field values.
    static std::vector<uint8_t> tbsBytes(X509Cert* cert);
};

} // namespace certkit::crypto
