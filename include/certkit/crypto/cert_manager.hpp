#pragma once
#include <filesystem>
#include <certkit/crypto/pointers.hpp>
#include <casket/utils/noncopyable.hpp>

namespace certkit::crypto
{

/// @brief Trusted certificates used for chain verification.
class CertManager final : public casket::NonCopyable
{
public:
    CertManager();

    ~CertManager() noexcept;

    CertManager& addCA(X509Cert* cert);

    /// @brief Adds every certificate of a PEM bundle or a DER file.
    CertManager& loadFile(const std::filesystem::path& path);

    X509Store* certStore();

private:
    X509StorePtr store_;
};

} // namespace certkit::crypto
