#include <openssl/err.h>
#include <openssl/x509_vfy.h>
#include <certkit/crypto/error_category.hpp>
#include <certkit/crypto/error_code.hpp>

namespace certkit::crypto::verify
{

const char* ErrorCategory::name() const noexcept
{
    return "X.509 verification";
}

std::string ErrorCategory::message(int value) const
{
    return X509_verify_cert_error_string(value);
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

} // namespace certkit::crypto::verify

namespace certkit::crypto
{

const char* ErrorCategory::name() const noexcept
{
    return "OpenSSL";
}

std::string ErrorCategory::message(int value) const
{
    const char* reason = ::ERR_reason_error_string(value);
    if (reason)
    {
        std::string result(reason);

        const char* lib = ::ERR_lib_error_string(value);
        if (lib)
        {
            result += " (";
            result += lib;
            result += ")";
        }
        return result;
    }

    return "OpenSSL error";
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

const char* CertErrorCategory::name() const noexcept
{
    return "certkit";
}

std::string CertErrorCategory::message(int value) const
{
    switch (static_cast<Errc>(value))
    {
    case Errc::DecodeError:
        return "malformed encoded structure";
    case Errc::DigestNotAllowed:
        return "digest is not allowed for the key algorithm";
    case Errc::UnknownDigest:
        return "unknown digest algorithm";
    case Errc::EmptyInput:
        return "empty input";
    case Errc::NoCertificates:
        return "no certificates found";
    case Errc::InvalidName:
        return "invalid distinguished name";
    case Errc::KeyMismatch:
        return "key doesn't match certificate";
    default:
        return "unknown error";
    }
}

CertErrorCategory& CertErrorCategory::getInstance()
{
    static CertErrorCategory instance;
    return instance;
}

} // namespace certkit::crypto
