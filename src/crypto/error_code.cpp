#include <openssl/err.h>
#include <certkit/crypto/error_code.hpp>
#include <certkit/crypto/error_category.hpp>
#include <certkit/crypto/exception.hpp>

namespace certkit::crypto
{

std::error_code TranslateError(unsigned long error)
{
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    if (ERR_SYSTEM_ERROR(error))
    {
        return std::error_code{static_cast<int>(ERR_GET_REASON(error)), std::system_category()};
    }
#endif // (OPENSSL_VERSION_NUMBER >= 0x30000000L)

    return std::error_code{static_cast<int>(error), ErrorCategory::getInstance()};
}

std::error_code GetLastError()
{
    const auto err = ::ERR_get_error();
    if (err)
    {
        ::ERR_clear_error();
        return TranslateError(err);
    }
    return TranslateError(ERR_R_OPERATION_FAIL);
}

std::error_code MakeErrorCode(Errc e)
{
    return std::error_code(static_cast<int>(e), CertErrorCategory::getInstance());
}

void ThrowIfTrue(bool expression, Errc error, std::string_view message)
{
    if (expression)
    {
        ::ERR_clear_error();
        throw CryptoException(error, message);
    }
}

} // namespace certkit::crypto

namespace certkit::crypto::verify
{

std::error_code MakeErrorCode(Error e)
{
    return std::error_code(static_cast<int>(e), ErrorCategory::getInstance());
}

} // namespace certkit::crypto::verify
