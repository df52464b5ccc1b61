#pragma once
#include <system_error>
#include <certkit/crypto/pointers.hpp>
#include <certkit/crypto/cert_manager.hpp>

namespace certkit::crypto
{

/// @brief Validates certificate chains against the trusted certificates of CertManager.
class CertVerifier final : public casket::NonCopyable
{
public:
    explicit CertVerifier(CertManager& manager);

    ~CertVerifier() noexcept;

    CertVerifier& setFlag(VerifyFlag flag);

    CertVerifier& clearFlag(VerifyFlag flag);

    /// @return verify::Error::No on success, verification error otherwise.
    std::error_code verify(X509Cert* cert) noexcept;

private:
    X509Store* store_;
    X509StoreCtxPtr ctx_;
    unsigned long flags_;
};

} // namespace certkit::crypto
