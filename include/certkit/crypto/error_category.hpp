#pragma once
#include <string>
#include <system_error>

namespace certkit::crypto
{

/// @brief Represents the error category for OpenSSL errors.
class ErrorCategory final : public std::error_category
{
public:
    /// @brief Gets the name of the error category.
    /// @return The name of the error category.
    const char* name() const noexcept override;

    /// @brief Gets the error message corresponding to an error value.
    /// @param value The error value.
    /// @return The error message.
    std::string message(int value) const override;

    static ErrorCategory& getInstance();

private:
    ErrorCategory() = default;
    ~ErrorCategory() = default;
};

/// @brief Error category of certkit's own failures (see Errc).
class CertErrorCategory final : public std::error_category
{
public:
    const char* name() const noexcept override;
    std::string message(int value) const override;

    static CertErrorCategory& getInstance();

private:
    CertErrorCategory() = default;
    ~CertErrorCategory() = default;
};

} // namespace certkit::crypto

namespace certkit::crypto::verify
{

class ErrorCategory final : public std::error_category
{
public:
    const char* name() const noexcept override;
    std::string message(int value) const override;

    static ErrorCategory& getInstance();

private:
    ErrorCategory() = default;
    ~ErrorCategory() = default;
};

} // namespace certkit::crypto::verify
