#include <openssl/x509v3.h>
#include <openssl/objects.h>

#include <certkit/crypto/extension_codec.hpp>
#include <certkit/crypto/extension.hpp>
#include <certkit/crypto/exception.hpp>

using namespace certkit::crypto;

namespace
{

template <typename T>
T* DecodeExtension(X509Ext* ext)
{
    auto value = static_cast<T*>(X509V3_EXT_d2i(ext));
    ThrowIfTrue(value == nullptr, Errc::DecodeError, "malformed " + X509Extension::name(ext) + " extension");
    return value;
}

std::vector<uint8_t> ToBytes(const ASN1_STRING* str)
{
    auto data = ASN1_STRING_get0_data(str);
    return std::vector<uint8_t>(data, data + ASN1_STRING_length(str));
}

void AppendUris(const GENERAL_NAMES* names, std::vector<std::string>& uris)
{
    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i)
    {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(names, i);
        if (name->type != GEN_URI)
        {
            continue;
        }

        const ASN1_IA5STRING* uri = name->d.uniformResourceIdentifier;
        uris.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(uri)), ASN1_STRING_length(uri));
    }
}

std::optional<std::vector<std::string>> AccessUris(const X509Cert* cert, int methodNid)
{
    auto ext = X509Extension::find(cert, NID_info_access);
    if (!ext)
    {
        return std::nullopt;
    }

    AuthInfoAccessPtr aia(DecodeExtension<AuthInfoAccess>(ext));

    std::vector<std::string> uris;
    for (int i = 0; i < sk_ACCESS_DESCRIPTION_num(aia); ++i)
    {
        ACCESS_DESCRIPTION* ad = sk_ACCESS_DESCRIPTION_value(aia, i);
        if (OBJ_obj2nid(ad->method) != methodNid || ad->location->type != GEN_URI)
        {
            continue;
        }

        const ASN1_IA5STRING* uri = ad->location->d.uniformResourceIdentifier;
        uris.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(uri)), ASN1_STRING_length(uri));
    }

    if (uris.empty())
    {
        return std::nullopt;
    }
    return uris;
}

} // namespace

namespace certkit::crypto
{

X509ExtPtr ExtensionCodec::encode(X509V3Ctx* ctx, Conf* conf, std::string_view name, std::string_view value,
                                  bool critical)
{
    std::string extName(name);
    std::string extValue(value);

    X509ExtPtr ext(X509V3_EXT_nconf(conf, ctx, extName.c_str(), extValue.c_str()));
    ThrowIfTrue(ext == nullptr, "unable to encode extension '" + extName + "' from '" + extValue + "'");

    if (critical)
    {
        ThrowIfFalse(X509_EXTENSION_set_critical(ext, 1));
    }
    return ext;
}

X509ExtPtr ExtensionCodec::encode(X509V3Ctx* ctx, Conf* conf, int nid, std::string_view value, bool critical)
{
    std::string extValue(value);

    X509ExtPtr ext(X509V3_EXT_nconf_nid(conf, ctx, nid, extValue.c_str()));
    ThrowIfTrue(ext == nullptr, "unable to encode extension '" + std::string(OBJ_nid2sn(nid)) + "' from '" +
                                    extValue + "'");

    if (critical)
    {
        ThrowIfFalse(X509_EXTENSION_set_critical(ext, 1));
    }
    return ext;
}

void ExtensionCodec::encodeSection(X509V3Ctx* ctx, Conf* conf, std::string_view section, X509Cert* cert)
{
    std::string name(section);
    ThrowIfTrue(conf == nullptr, Errc::EmptyInput, "no configuration loaded for section '" + name + "'");
    ThrowIfFalse(X509V3_EXT_add_nconf(conf, ctx, name.c_str(), cert),
                 "unable to encode extensions from section '" + name + "'");
}

std::optional<std::vector<uint8_t>> ExtensionCodec::subjectKeyIdentifier(const X509Cert* cert)
{
    auto ext = X509Extension::find(cert, NID_subject_key_identifier);
    if (!ext)
    {
        return std::nullopt;
    }

    Asn1OctetStringPtr keyId(DecodeExtension<Asn1OctetString>(ext));
    return ToBytes(keyId);
}

std::optional<std::vector<uint8_t>> ExtensionCodec::authorityKeyIdentifier(const X509Cert* cert)
{
    auto ext = X509Extension::find(cert, NID_authority_key_identifier);
    if (!ext)
    {
        return std::nullopt;
    }

    AuthorityKeyIdPtr akid(DecodeExtension<AuthorityKeyId>(ext));
    if (akid->keyid == nullptr)
    {
        return std::nullopt;
    }
    return ToBytes(akid->keyid);
}

std::optional<std::vector<std::string>> ExtensionCodec::crlUris(const X509Cert* cert)
{
    auto ext = X509Extension::find(cert, NID_crl_distribution_points);
    if (!ext)
    {
        return std::nullopt;
    }

    CrlDistPointsPtr crldp(DecodeExtension<CrlDistPoints>(ext));

    std::vector<std::string> uris;
    for (int i = 0; i < sk_DIST_POINT_num(crldp); ++i)
    {
        DIST_POINT* dp = sk_DIST_POINT_value(crldp, i);
        // Only fullName form carries general names.
        if (!dp->distpoint || dp->distpoint->type != 0)
        {
            continue;
        }
        AppendUris(dp->distpoint->name.fullname, uris);
    }

    if (uris.empty())
    {
        return std::nullopt;
    }
    return uris;
}

std::optional<std::vector<std::string>> ExtensionCodec::caIssuerUris(const X509Cert* cert)
{
    return AccessUris(cert, NID_ad_ca_issuers);
}

std::optional<std::vector<std::string>> ExtensionCodec::ocspUris(const X509Cert* cert)
{
    return AccessUris(cert, NID_ad_OCSP);
}

} // namespace certkit::crypto
