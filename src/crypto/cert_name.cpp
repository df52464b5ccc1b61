#include <casket/nonstd/span.hpp>
#include <openssl/x509.h>
#include <openssl/crypto.h>
#include <certkit/crypto/cert_name.hpp>
#include <certkit/crypto/exception.hpp>

namespace certkit::crypto
{

X509NamePtr CertName::deepCopy(OSSL_CONST_COMPAT X509Name* name)
{
    X509NamePtr result{X509_NAME_dup(name)};
    crypto::ThrowIfTrue(result == nullptr);
    return result;
}

bool CertName::isEqual(const X509Name* a, const X509Name* b)
{
    return (0 == X509_NAME_cmp(a, b));
}

static nonstd::span<const uint8_t> viewEntryValue(OSSL_CONST_COMPAT X509Name* name, const int nid)
{
    auto loc = X509_NAME_get_index_by_NID(name, nid, -1);
    if (loc >= 0)
    {
        auto entry = X509_NAME_get_entry(name, loc);
        if (entry)
        {
            auto value = X509_NAME_ENTRY_get_data(entry);
            return nonstd::span<const uint8_t>(value->data, value->length);
        }
    }
    return nonstd::span<const uint8_t>();
}

std::string CertName::entryValue(OSSL_CONST_COMPAT X509Name* name, int nid)
{
    auto entry = viewEntryValue(name, nid);
    if (entry.empty())
    {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(entry.data()), entry.size_bytes());
}

size_t CertName::entryCount(const X509Name* name)
{
    return static_cast<size_t>(X509_NAME_entry_count(name));
}

std::string CertName::toString(OSSL_CONST_COMPAT X509Name* name)
{
    char* line = X509_NAME_oneline(name, nullptr, 0);
    crypto::ThrowIfTrue(line == nullptr);

    std::string result(line);
    OPENSSL_free(line);
    return result;
}

std::vector<uint8_t> CertName::toDer(OSSL_CONST_COMPAT X509Name* name)
{
    int length = i2d_X509_NAME(name, nullptr);
    crypto::ThrowIfFalse(0 < length, "unable to encode name");

    std::vector<uint8_t> result(static_cast<size_t>(length));
    unsigned char* ptr = result.data();
    crypto::ThrowIfFalse(length == i2d_X509_NAME(name, &ptr), "unable to encode name");
    return result;
}

} // namespace certkit::crypto
