#pragma once
#include <string>
#include <string_view>
#include <certkit/crypto/pointers.hpp>
#include <casket/utils/noncopyable.hpp>

namespace certkit::crypto
{

class CertNameBuilder final : casket::NonCopyable
{
public:
    /// @brief Parses "/DC=org/DC=example/CN=CA" or "CN=Test;O=Org".
    static X509NamePtr fromString(std::string_view DN);

public:
    CertNameBuilder();

    ~CertNameBuilder() = default;

    void reset();

    CertNameBuilder& addEntry(const std::string& field, const std::string& value);

    X509NamePtr build();

    X509Name* name()
    {
        return name_;
    }

private:
    X509NamePtr name_;
};

} // namespace certkit::crypto
