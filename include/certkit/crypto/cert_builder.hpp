#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

#include <casket/nonstd/chrono.hpp>
#include <casket/utils/noncopyable.hpp>

#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto
{

/// @brief Fluent builder of signed certificates.
///
/// Fields left unset get defaults in build(): version 3, random 64-bit serial,
/// issuer name taken from the issuer certificate (or the own subject when
/// self-signed) and a validity of one day starting now. Extensions are
/// encoded in build() in the order they were added, after all other fields
/// are in place.
class CertBuilder final : casket::NonCopyable
{
public:
    CertBuilder();

    ~CertBuilder() noexcept;

    void reset();

    CertBuilder& setVersion(CertVersion version);

    CertBuilder& setSubjectName(OSSL_CONST_COMPAT X509Name* name);

    CertBuilder& setSubjectName(const std::string& name);

    CertBuilder& setIssuerName(OSSL_CONST_COMPAT X509Name* name);

    CertBuilder& setIssuerName(const std::string& name);

    CertBuilder& setPublicKey(Key* publicKey);

    CertBuilder& setSerialNumber(const Asn1Integer* serialNumber);

    CertBuilder& setSerialNumber(const BigNum* serialNumber);

    CertBuilder& setSerialNumber(uint64_t serialNumber);

    CertBuilder& setNotBefore(const Asn1Time* time);

    CertBuilder& setNotBefore(std::time_t time);

    /// @brief Sets not-before to now shifted by @p offsetSec.
    CertBuilder& setNotBefore(std::chrono::seconds offsetSec);

    CertBuilder& setNotBefore(nonstd::chrono_years offsetYears);

    CertBuilder& setNotAfter(const Asn1Time* time);

    CertBuilder& setNotAfter(std::time_t time);

    CertBuilder& setNotAfter(std::chrono::seconds offsetSec);

    CertBuilder& setNotAfter(nonstd::chrono_years offsetYears);

    /// @brief Loads OpenSSL configuration used to resolve "@section" references.
    CertBuilder& setConfig(std::string_view text);

    CertBuilder& loadConfig(const std::filesystem::path& path);

    /// @brief Digest name, empty string selects the signing key default.
    CertBuilder& setDigest(std::string_view digest);

    CertBuilder& addExtension(X509Ext* ext);

    CertBuilder& addExtension(int extNid, std::string_view value, bool critical = false);

    CertBuilder& addExtension(std::string_view name, std::string_view value, bool critical = false);

    /// @brief Adds all extensions of configuration @p section in section order.
    CertBuilder& addExtensions(std::string_view section);

    CertBuilder& signedBy(Key* issuerPrivateKey, X509Cert* issuerCert);

    CertBuilder& selfSigned(Key* subjectPrivateKey);

    X509CertPtr build();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace certkit::crypto
