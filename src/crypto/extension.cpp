#include <openssl/objects.h>
#include <certkit/crypto/extension.hpp>
#include <certkit/crypto/exception.hpp>

namespace certkit::crypto
{

X509ExtPtr X509Extension::create(const int nid, nonstd::span<const uint8_t> value, bool critical)
{
    // We don't want to copy data unnecessarily.
    ASN1_OCTET_STRING octet{};
    octet.type = V_ASN1_OCTET_STRING;
    octet.data = const_cast<uint8_t*>(value.data());
    octet.length = static_cast<int>(value.size());

    X509ExtPtr ext(X509_EXTENSION_create_by_NID(nullptr, nid, critical ? 1 : 0, &octet));
    crypto::ThrowIfFalse(ext != nullptr);

    return ext;
}

nonstd::span<const uint8_t> X509Extension::view(X509Ext* extension)
{
    auto octet = X509_EXTENSION_get_data(extension);
    return octet ? nonstd::span<const uint8_t>(octet->data, octet->length) : nonstd::span<const uint8_t>();
}

std::string X509Extension::name(const X509Ext* extension)
{
    auto object = X509_EXTENSION_get_object(const_cast<X509Ext*>(extension));
    crypto::ThrowIfTrue(object == nullptr);

    const int nid = OBJ_obj2nid(object);
    const char* shortName = (nid != NID_undef) ? OBJ_nid2sn(nid) : nullptr;
    if (shortName)
    {
        return shortName;
    }

    char buffer[128];
    int length = OBJ_obj2txt(buffer, sizeof(buffer), object, 1);
    crypto::ThrowIfFalse(0 < length);

    if (static_cast<size_t>(length) < sizeof(buffer))
    {
        return std::string(buffer, length);
    }

    std::string result(length + 1, '\0');
    OBJ_obj2txt(result.data(), length + 1, object, 1);
    result.resize(length);
    return result;
}

bool X509Extension::isCritical(const X509Ext* extension)
{
    return 0 < X509_EXTENSION_get_critical(extension);
}

X509Ext* X509Extension::find(const X509Cert* cert, int nid)
{
    int loc = X509_get_ext_by_NID(cert, nid, -1);
    return loc < 0 ? nullptr : X509_get_ext(cert, loc);
}

std::vector<ExtensionInfo> X509Extension::list(const X509Cert* cert)
{
    std::vector<ExtensionInfo> result;

    const int count = X509_get_ext_count(cert);
    result.reserve(count > 0 ? count : 0);

    for (int i = 0; i < count; ++i)
    {
        auto ext = X509_get_ext(cert, i);
        crypto::ThrowIfTrue(ext == nullptr);

        auto data = view(ext);
        result.push_back({name(ext), isCritical(ext), {data.begin(), data.end()}});
    }

    return result;
}

} // namespace certkit::crypto
