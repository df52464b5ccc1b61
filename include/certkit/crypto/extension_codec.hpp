#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto
{

/// @brief Encodes extensions from their text form and decodes the typed values certkit relies on.
///
/// Text forms are the ones understood by OpenSSL's v3 configuration
/// ("CA:TRUE", "keyid:always", "URI:http://host/ca.crl", "@section" ...).
/// Decoders return std::nullopt when the extension is absent and throw
/// CryptoException with Errc::DecodeError when it's present but malformed.
class ExtensionCodec final
{
public:
    /// @brief Encodes extension @p name. @p conf may be nullptr when @p value has no section references.
    static X509ExtPtr encode(X509V3Ctx* ctx, Conf* conf, std::string_view name, std::string_view value,
                             bool critical = false);

    static X509ExtPtr encode(X509V3Ctx* ctx, Conf* conf, int nid, std::string_view value, bool critical = false);

    /// @brief Appends every extension of config @p section to @p cert in section order.
    static void encodeSection(X509V3Ctx* ctx, Conf* conf, std::string_view section, X509Cert* cert);

    static std::optional<std::vector<uint8_t>> subjectKeyIdentifier(const X509Cert* cert);

    /// @brief keyIdentifier field of authorityKeyIdentifier, std::nullopt when the field is absent.
    static std::optional<std::vector<uint8_t>> authorityKeyIdentifier(const X509Cert* cert);

    /// @brief URIs of all distribution points in order. Other general name types are skipped.
    static std::optional<std::vector<std::string>> crlUris(const X509Cert* cert);

    static std::optional<std::vector<std::string>> caIssuerUris(const X509Cert* cert);

    static std::optional<std::vector<std::string>> ocspUris(const X509Cert* cert);
};

} // namespace certkit::crypto
