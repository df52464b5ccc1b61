#include <casket/utils/exception.hpp>

#include <certkit/crypto/cert_issuer.hpp>
#include <certkit/crypto/cert_builder.hpp>

namespace certkit::crypto
{

X509CertPtr IssueCert(const IssueOptions& options)
{
    casket::ThrowIfTrue(options.subject == nullptr, "subject name not specified");
    casket::ThrowIfTrue(options.publicKey == nullptr, "public key not specified");
    casket::ThrowIfTrue(options.issuerKey == nullptr, "issuer key not specified");

    CertBuilder certBuilder;

    if (!options.config.empty())
    {
        certBuilder.setConfig(options.config);
    }

    const std::time_t notBefore = options.notBefore.value_or(std::time(nullptr));
    const std::time_t notAfter = options.notAfter.value_or(notBefore + options.validity.count());

    certBuilder.setNotBefore(notBefore);
    certBuilder.setNotAfter(notAfter);

    if (options.serial)
    {
        certBuilder.setSerialNumber(options.serial);
    }

    certBuilder.setSubjectName(options.subject);
    certBuilder.setPublicKey(options.publicKey);
    certBuilder.setDigest(options.digest);

    if (options.issuerCert)
    {
        certBuilder.signedBy(options.issuerKey, options.issuerCert);
    }
    else
    {
        certBuilder.selfSigned(options.issuerKey);
    }

    if (!options.extensionSection.empty())
    {
        certBuilder.addExtensions(options.extensionSection);
    }

    for (const auto& ext : options.extensions)
    {
        certBuilder.addExtension(ext.name, ext.value, ext.critical);
    }

    return certBuilder.build();
}

} // namespace certkit::crypto
