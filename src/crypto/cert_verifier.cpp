#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <certkit/crypto/cert_verifier.hpp>
#include <certkit/crypto/cert_manager.hpp>

#include <certkit/crypto/error_code.hpp>
#include <certkit/crypto/exception.hpp>

#include <casket/utils/exception.hpp>

namespace certkit::crypto
{

CertVerifier::CertVerifier(CertManager& manager)
    : store_(manager.certStore())
    , ctx_(X509_STORE_CTX_new())
    , flags_(0)
{
    casket::ThrowIfTrue(ctx_ == nullptr, "memory allocation error");

    setFlag(VerifyFlag::StrictCheck);
    setFlag(VerifyFlag::CheckSelfSigned);
    setFlag(VerifyFlag::SearchTrustedFirst);
}

CertVerifier::~CertVerifier() noexcept
{
}

CertVerifier& CertVerifier::setFlag(VerifyFlag flag)
{
    flags_ |= static_cast<unsigned long>(flag);
    return *this;
}

CertVerifier& CertVerifier::clearFlag(VerifyFlag flag)
{
    flags_ &= ~static_cast<unsigned long>(flag);
    return *this;
}

std::error_code CertVerifier::verify(X509Cert* cert) noexcept
{
    X509_STORE_CTX_cleanup(ctx_);
    if (!X509_STORE_CTX_init(ctx_, store_, cert, nullptr))
    {
        ERR_clear_error();
        return verify::MakeErrorCode(verify::Error::Unspecified);
    }

    X509_VERIFY_PARAM_set_flags(X509_STORE_CTX_get0_param(ctx_), flags_);

    if (0 >= X509_verify_cert(ctx_))
    {
        ERR_clear_error();
        return verify::MakeErrorCode(static_cast<verify::Error>(X509_STORE_CTX_get_error(ctx_)));
    }

    return verify::MakeErrorCode(verify::Error::No);
}

} // namespace certkit::crypto
