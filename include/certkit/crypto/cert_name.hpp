#pragma once
#include <string>
#include <vector>
#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto
{

class CertName final
{
public:
    static X509NamePtr deepCopy(OSSL_CONST_COMPAT X509Name* name);

    static bool isEqual(const X509Name* a, const X509Name* b);

    /// @brief Value of the first entry with @p nid, empty string when absent.
    static std::string entryValue(OSSL_CONST_COMPAT X509Name* name, int nid);

    static size_t entryCount(const X509Name* name);

    /// @brief One-line form, e.g. "/DC=org/DC=example/CN=CA".
    static std::string toString(OSSL_CONST_COMPAT X509Name* name);

    static std::vector<uint8_t> toDer(OSSL_CONST_COMPAT X509Name* name);
};

} // namespace certkit::crypto
