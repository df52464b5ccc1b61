/// @file
/// @brief General exception type for cryptographic errors.

#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <stdexcept>

#include <certkit/crypto/error_code.hpp>

namespace certkit::crypto
{

/// @brief Main class for cryptographic exceptions.
class CryptoException final : public std::system_error
{
public:
    /// @brief Constructor.
    ///
    /// @param[in] ec Error code.
    ///
    explicit CryptoException(std::error_code ec)
        : std::system_error(ec)
    {
    }

    /// @brief Constructor.
    ///
    /// @param[in] ec Error code.
    /// @param[in] what Error message.
    ///
    CryptoException(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }

    /// @brief Constructor for errors detected by certkit.
    ///
    /// @param[in] error Error value.
    /// @param[in] what Error message.
    ///
    CryptoException(Errc error, std::string_view what)
        : std::system_error(MakeErrorCode(error), std::string(what))
    {
    }
};

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
///
inline void ThrowIfTrue(bool expression)
{
    if (expression)
    {
        throw CryptoException(GetLastError());
    }
}

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Additional message.
///
inline void ThrowIfTrue(bool expression, std::string_view message)
{
    if (expression)
    {
        throw CryptoException(GetLastError(), message);
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
///
inline void ThrowIfFalse(bool expression)
{
    if (!expression)
    {
        throw CryptoException(GetLastError());
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Additional message.
///
inline void ThrowIfFalse(bool expression, std::string_view message)
{
    if (!expression)
    {
        throw CryptoException(GetLastError(), message);
    }
}

/// @brief Throws an exception with certkit error if @p expression is true.
///
/// Pending OpenSSL errors are discarded, they describe the same failure.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] error Error value.
/// @param[in] message Additional message.
///
void ThrowIfTrue(bool expression, Errc error, std::string_view message);

} // namespace certkit::crypto
