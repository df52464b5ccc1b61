#include <ctime>
#include <exception>
#include <vector>

#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/conf.h>

#include <casket/utils/exception.hpp>

#include <certkit/crypto/exception.hpp>
#include <certkit/crypto/error_code.hpp>

#include <certkit/crypto/asymm_key.hpp>
#include <certkit/crypto/bignum.hpp>
#include <certkit/crypto/bio.hpp>
#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/cert_builder.hpp>
#include <certkit/crypto/cert_name_builder.hpp>
#include <certkit/crypto/cert_signer.hpp>
#include <certkit/crypto/extension_codec.hpp>

namespace certkit::crypto
{

struct CertBuilder::Impl
{
    /// Extension waiting for build(), either encoded already or kept as text.
    struct PendingExtension
    {
        X509ExtPtr ready;
        int nid{NID_undef};
        std::string name;
        std::string value;
        bool critical{false};
        bool section{false};
    };

    X509CertPtr cert;
    X509V3Ctx ctx;
    KeyPtr signingKey;
    X509CertPtr issuerCert;
    ConfPtr conf;
    std::string digest;
    std::vector<PendingExtension> extensions;
    bool versionSet{false};
    bool issuerNameSet{false};
    bool notBeforeSet{false};
    bool notAfterSet{false};

    Impl()
    {
        reset();
    }

    void reset()
    {
        cert.reset(X509_new());
        crypto::ThrowIfTrue(cert == nullptr);

        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, nullptr, nullptr, nullptr, nullptr, X509V3_CTX_REPLACE);

        signingKey.reset();
        issuerCert.reset();
        conf.reset();
        digest.clear();
        extensions.clear();

        versionSet = false;
        issuerNameSet = false;
        notBeforeSet = false;
        notAfterSet = false;
    }

    void applyDefaults()
    {
        if (!versionSet)
        {
            crypto::ThrowIfFalse(X509_set_version(cert, static_cast<long>(CertVersion::V3)));
        }

        auto serial = Cert::serialNumber(cert);
        if (BigNumTraits::isZero(serial))
        {
            auto n = BigNumTraits::random(64);
            crypto::ThrowIfFalse(BN_to_ASN1_INTEGER(n, X509_get_serialNumber(cert)));
        }

        if (!issuerNameSet)
        {
            auto name = X509_get_subject_name(issuerCert ? issuerCert.get() : cert.get());
            crypto::ThrowIfFalse(X509_set_issuer_name(cert, name));
        }

        std::time_t now = std::time(nullptr);

        if (!notBeforeSet)
        {
            crypto::ThrowIfTrue(nullptr == X509_time_adj_ex(X509_getm_notBefore(cert), 0, 0, &now));
        }

        if (!notAfterSet)
        {
            crypto::ThrowIfTrue(nullptr == X509_time_adj_ex(X509_getm_notAfter(cert), 1, 0, &now));
        }
    }

    void encodeExtensions()
    {
        X509V3_set_ctx(&ctx, issuerCert ? issuerCert.get() : cert.get(), cert, nullptr, nullptr, 0);
        if (conf)
        {
            X509V3_set_nconf(&ctx, conf);
        }
        crypto::ThrowIfFalse(X509V3_set_issuer_pkey(&ctx, signingKey));

        for (auto& pending : extensions)
        {
            if (pending.section)
            {
                ExtensionCodec::encodeSection(&ctx, conf, pending.name, cert);
                continue;
            }

            if (!pending.ready)
            {
                pending.ready = pending.nid != NID_undef
                                    ? ExtensionCodec::encode(&ctx, conf, pending.nid, pending.value, pending.critical)
                                    : ExtensionCodec::encode(&ctx, conf, pending.name, pending.value, pending.critical);
            }
            crypto::ThrowIfFalse(X509_add_ext(cert, pending.ready, -1));
        }
    }
};

CertBuilder::CertBuilder()
    : impl_(std::make_unique<CertBuilder::Impl>())
{
}

CertBuilder::~CertBuilder() noexcept
{
}

void CertBuilder::reset()
{
    impl_->reset();
}

CertBuilder& CertBuilder::setVersion(CertVersion version)
{
    crypto::ThrowIfFalse(X509_set_version(impl_->cert, static_cast<long>(version)));
    impl_->versionSet = true;
    return *this;
}

CertBuilder& CertBuilder::setSubjectName(OSSL_CONST_COMPAT X509Name* name)
{
    crypto::ThrowIfFalse(X509_set_subject_name(impl_->cert, name));
    return *this;
}

CertBuilder& CertBuilder::setSubjectName(const std::string& name)
{
    auto decodedName = CertNameBuilder::fromString(name);
    return setSubjectName(decodedName);
}

CertBuilder& CertBuilder::setIssuerName(OSSL_CONST_COMPAT X509Name* name)
{
    crypto::ThrowIfFalse(X509_set_issuer_name(impl_->cert, name));
    impl_->issuerNameSet = true;
    return *this;
}

CertBuilder& CertBuilder::setIssuerName(const std::string& name)
{
    auto decodedName = CertNameBuilder::fromString(name);
    return setIssuerName(decodedName);
}

CertBuilder& CertBuilder::setPublicKey(Key* subjectPublicKey)
{
    crypto::ThrowIfFalse(X509_set_pubkey(impl_->cert, subjectPublicKey));
    return *this;
}

CertBuilder& CertBuilder::setSerialNumber(const Asn1Integer* serialNumber)
{
    crypto::ThrowIfFalse(X509_set_serialNumber(impl_->cert, const_cast<Asn1Integer*>(serialNumber)));
    return *this;
}

CertBuilder& CertBuilder::setSerialNumber(const BigNum* serialNumber)
{
    crypto::ThrowIfFalse(BN_to_ASN1_INTEGER(serialNumber, X509_get_serialNumber(impl_->cert)));
    return *this;
}

CertBuilder& CertBuilder::setSerialNumber(uint64_t serialNumber)
{
    auto value = BigNumTraits::fromWord(serialNumber);
    return setSerialNumber(static_cast<const BigNum*>(value));
}

CertBuilder& CertBuilder::setNotBefore(const Asn1Time* time)
{
    crypto::ThrowIfFalse(X509_set1_notBefore(impl_->cert, time));
    impl_->notBeforeSet = true;
    return *this;
}

CertBuilder& CertBuilder::setNotBefore(std::time_t time)
{
    crypto::ThrowIfTrue(nullptr == ASN1_TIME_set(X509_getm_notBefore(impl_->cert), time));
    impl_->notBeforeSet = true;
    return *this;
}

CertBuilder& CertBuilder::setNotBefore(std::chrono::seconds offsetSec)
{
    crypto::ThrowIfFalse(X509_time_adj(X509_getm_notBefore(impl_->cert), offsetSec.count(), nullptr));
    impl_->notBeforeSet = true;
    return *this;
}

CertBuilder& CertBuilder::setNotBefore(nonstd::chrono_years offsetYears)
{
    return setNotBefore(std::chrono::duration_cast<std::chrono::seconds>(offsetYears));
}

CertBuilder& CertBuilder::setNotAfter(const Asn1Time* time)
{
    crypto::ThrowIfFalse(X509_set1_notAfter(impl_->cert, time));
    impl_->notAfterSet = true;
    return *this;
}

CertBuilder& CertBuilder::setNotAfter(std::time_t time)
{
    crypto::ThrowIfTrue(nullptr == ASN1_TIME_set(X509_getm_notAfter(impl_->cert), time));
    impl_->notAfterSet = true;
    return *this;
}

CertBuilder& CertBuilder::setNotAfter(std::chrono::seconds offsetSec)
{
    crypto::ThrowIfFalse(X509_time_adj(X509_getm_notAfter(impl_->cert), offsetSec.count(), nullptr));
    impl_->notAfterSet = true;
    return *this;
}

CertBuilder& CertBuilder::setNotAfter(nonstd::chrono_years offsetYears)
{
    return setNotAfter(std::chrono::duration_cast<std::chrono::seconds>(offsetYears));
}

CertBuilder& CertBuilder::setConfig(std::string_view text)
{
    ConfPtr conf(NCONF_new(nullptr));
    crypto::ThrowIfTrue(conf == nullptr);

    auto bio = BioTraits::createMemoryReader(reinterpret_cast<const uint8_t*>(text.data()), text.size());

    long errorLine{-1};
    crypto::ThrowIfFalse(0 < NCONF_load_bio(conf, bio, &errorLine),
                         "unable to parse configuration at line " + std::to_string(errorLine));

    impl_->conf = std::move(conf);
    return *this;
}

CertBuilder& CertBuilder::loadConfig(const std::filesystem::path& path)
{
    auto file = BioTraits::openFile(path, "rb");
    auto content = BioTraits::readAllData(file);
    return setConfig(std::string_view(reinterpret_cast<const char*>(content.data()), content.size()));
}

CertBuilder& CertBuilder::setDigest(std::string_view digest)
{
    impl_->digest = digest;
    return *this;
}

CertBuilder& CertBuilder::addExtension(X509Ext* ext)
{
    Impl::PendingExtension pending;
    pending.ready.reset(X509_EXTENSION_dup(ext));
    crypto::ThrowIfTrue(pending.ready == nullptr);

    impl_->extensions.emplace_back(std::move(pending));
    return *this;
}

CertBuilder& CertBuilder::addExtension(int extNid, std::string_view value, bool critical)
{
    Impl::PendingExtension pending;
    pending.nid = extNid;
    pending.value = value;
    pending.critical = critical;

    impl_->extensions.emplace_back(std::move(pending));
    return *this;
}

CertBuilder& CertBuilder::addExtension(std::string_view name, std::string_view value, bool critical)
{
    Impl::PendingExtension pending;
    pending.name = name;
    pending.value = value;
    pending.critical = critical;

    impl_->extensions.emplace_back(std::move(pending));
    return *this;
}

CertBuilder& CertBuilder::addExtensions(std::string_view section)
{
    Impl::PendingExtension pending;
    pending.name = section;
    pending.section = true;

    impl_->extensions.emplace_back(std::move(pending));
    return *this;
}

CertBuilder& CertBuilder::signedBy(Key* issuerPrivateKey, X509Cert* issuerCert)
{
    casket::ThrowIfTrue(issuerPrivateKey == nullptr, "issuer key not specified");
    casket::ThrowIfTrue(issuerCert == nullptr, "issuer certificate not specified");
    crypto::ThrowIfTrue(!CertSigner::checkPrivateKey(issuerCert, issuerPrivateKey), Errc::KeyMismatch,
                        "issuer key doesn't match issuer certificate");

    impl_->signingKey = AsymmKey::shallowCopy(issuerPrivateKey);
    impl_->issuerCert = Cert::shallowCopy(issuerCert);
    return *this;
}

CertBuilder& CertBuilder::selfSigned(Key* subjectPrivateKey)
{
    casket::ThrowIfTrue(subjectPrivateKey == nullptr, "signing key not specified");

    impl_->signingKey = AsymmKey::shallowCopy(subjectPrivateKey);
    impl_->issuerCert.reset();
    return *this;
}

X509CertPtr CertBuilder::build()
{
    casket::ThrowIfTrue(impl_->signingKey == nullptr, "signing key not specified");

    // Digest policy errors leave the builder as it was.
    auto md = CertSigner::resolveDigest(impl_->signingKey, impl_->digest);

    try
    {
        impl_->applyDefaults();
        impl_->encodeExtensions();
        CertSigner::sign(impl_->cert, impl_->signingKey, md);
    }
    catch (const std::exception&)
    {
        // Certificate holds encoded extensions now.
        reset();
        throw;
    }

    auto result = std::move(impl_->cert);
    reset();

    return result;
}

} // namespace certkit::crypto
