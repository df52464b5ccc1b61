#pragma once
#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto
{

/// @brief Extension in text form, e.g. {"basicConstraints", "CA:TRUE", true}.
struct ExtensionEntry
{
    std::string name;
    std::string value;
    bool critical{false};
};

struct IssueOptions
{
    OSSL_CONST_COMPAT X509Name* subject{nullptr};
    Key* publicKey{nullptr};
    const BigNum* serial{nullptr}; ///< Random 64-bit serial when not set.
    std::vector<ExtensionEntry> extensions;
    X509Cert* issuerCert{nullptr}; ///< Self-signed with issuerKey when not set.
    Key* issuerKey{nullptr};
    std::optional<std::time_t> notBefore;
    std::optional<std::time_t> notAfter;
    std::chrono::seconds validity{std::chrono::hours(1)};
    std::string digest;
    std::string config;           ///< OpenSSL configuration text.
    std::string extensionSection; ///< Section of config with extensions added before the listed ones.
};

X509CertPtr IssueCert(const IssueOptions& options);

} // namespace certkit::crypto
