#pragma once
#include <string>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto
{

/// @brief Extension as it's stored in a certificate.
struct ExtensionInfo
{
    std::string oid;            ///< Short name or dotted OID for unknown extensions.
    bool critical{false};       ///< Critical flag.
    std::vector<uint8_t> value; ///< DER of extnValue content.
};

class X509Extension final
{
public:
    /// @brief Wraps already encoded @p value into an extension.
    static X509ExtPtr create(const int nid, nonstd::span<const uint8_t> value, bool critical = false);

    static nonstd::span<const uint8_t> view(X509Ext* extension);

    static std::string name(const X509Ext* extension);

    static bool isCritical(const X509Ext* extension);

    /// @brief Returns the first extension with @p nid or nullptr.
    static X509Ext* find(const X509Cert* cert, int nid);

    static std::vector<ExtensionInfo> list(const X509Cert* cert);
};

} // namespace certkit::crypto
