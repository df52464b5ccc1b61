#include <certkit/crypto/cert_name_builder.hpp>

#include <certkit/crypto/exception.hpp>

#include <casket/utils/string.hpp>

namespace certkit::crypto
{

CertNameBuilder::CertNameBuilder()
{
    reset();
}

CertNameBuilder& CertNameBuilder::addEntry(const std::string& field, const std::string& value)
{
    auto data = reinterpret_cast<const unsigned char*>(value.data());
    int sz = static_cast<int>(value.size());

    crypto::ThrowIfFalse(X509_NAME_add_entry_by_txt(name(), field.c_str(), MBSTRING_UTF8, data, sz, -1, 0),
                         "unknown name entry '" + field + "'");
    return *this;
}

X509NamePtr CertNameBuilder::build()
{
    auto result = std::move(name_);
    reset();
    return result;
}

void CertNameBuilder::reset()
{
    name_.reset(X509_NAME_new());
    crypto::ThrowIfTrue(name_ == nullptr);
}

X509NamePtr CertNameBuilder::fromString(std::string_view DN)
{
    std::string text(DN);
    crypto::ThrowIfTrue(text.empty(), Errc::InvalidName, "DN can't be empty");

    const bool slashForm = text.front() == '/';
    auto&& entries = casket::split(slashForm ? text.substr(1) : text, slashForm ? "/" : ";");

    CertNameBuilder builder;
    for (auto&& entry : entries)
    {
        auto delimiter = entry.find('=');
        crypto::ThrowIfTrue(delimiter == std::string::npos || delimiter == 0, Errc::InvalidName,
                            "Invalid format of DN: '" + text +
                                "'. Expected format: /ENTRY=VALUE[/ENTRY=VALUE...] or ENTRY=VALUE[;ENTRY=VALUE...]");

        builder.addEntry(std::string(entry.substr(0, delimiter)), std::string(entry.substr(delimiter + 1)));
    }

    return builder.build();
}

} // namespace certkit::crypto
