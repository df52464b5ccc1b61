#include <ctime>
#include <iostream>

#include <openssl/crypto.h>

#include <casket/log/log_manager.hpp>
#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>

#include <certkit/cli/command_dispatcher.hpp>
#include <certkit/cli/log_level.hpp>

#include <certkit/crypto/bignum.hpp>
#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/cert_name.hpp>
#include <certkit/crypto/cert_signer.hpp>
#include <certkit/crypto/exception.hpp>
#include <certkit/crypto/extension.hpp>
#include <certkit/crypto/extension_codec.hpp>

using namespace casket;
using namespace casket::opt;
using namespace certkit::crypto;

namespace certkit::viewer
{

static std::string FormatTime(std::time_t time)
{
    std::tm tmTime{};
    char buffer[80];
    gmtime_r(&time, &tmTime);
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &tmTime);
    return buffer;
}

static std::string FormatKeyId(const std::vector<uint8_t>& keyId)
{
    char* hex = OPENSSL_buf2hexstr(keyId.data(), static_cast<long>(keyId.size()));
    crypto::ThrowIfTrue(hex == nullptr);

    std::string result(hex);
    OPENSSL_free(hex);
    return result;
}

static void PrintUris(std::ostream& os, const char* title, const std::optional<std::vector<std::string>>& uris)
{
    if (!uris)
    {
        return;
    }
    for (const auto& uri : *uris)
    {
        os << title << uri << std::endl;
    }
}

static void PrintCert(std::ostream& os, X509Cert* cert, size_t index)
{
    std::string spaces(40, '-');
    os << spaces << std::endl << "Certificate #" << index << std::endl << spaces << std::endl;

    auto serial = Cert::serialNumber(cert);
    os << "Serial Number: " << BigNumTraits::toDecimal(serial) << " (0x" << BigNumTraits::toHex(serial) << ")"
       << std::endl;
    os << "Subject: " << CertName::toString(Cert::subjectName(cert)) << std::endl;
    os << "Issuer: " << CertName::toString(Cert::issuerName(cert)) << std::endl;
    os << "Not Before: " << FormatTime(Cert::notBefore(cert)) << std::endl;
    os << "Not After: " << FormatTime(Cert::notAfter(cert)) << std::endl;
    os << "Signature Algorithm: " << CertSigner::signatureAlgorithm(cert) << std::endl;

    auto extensions = X509Extension::list(cert);
    if (!extensions.empty())
    {
        os << "Extensions:" << std::endl;
        for (const auto& ext : extensions)
        {
            os << "    " << ext.oid << (ext.critical ? " (critical)" : "") << std::endl;
        }
    }

    auto ski = ExtensionCodec::subjectKeyIdentifier(cert);
    if (ski)
    {
        os << "Subject Key Identifier: " << FormatKeyId(*ski) << std::endl;
    }

    auto aki = ExtensionCodec::authorityKeyIdentifier(cert);
    if (aki)
    {
        os << "Authority Key Identifier: " << FormatKeyId(*aki) << std::endl;
    }

    PrintUris(os, "CRL Distribution Point: ", ExtensionCodec::crlUris(cert));
    PrintUris(os, "CA Issuers: ", ExtensionCodec::caIssuerUris(cert));
    PrintUris(os, "OCSP: ", ExtensionCodec::ocspUris(cert));
}

struct Options
{
    std::string certPath;
    std::string logLevel;
};

class Command final : public cmd::Command
{
public:
    Command()
    {
        // clang-format off
        parser_.add(
            OptionBuilder("help")
                .setDescription("Print help message")
                .build()
        );
        parser_.add(
            OptionBuilder("cert", Value(&options_.certPath))
                .setDescription("Path to certificate file, PEM bundle or DER")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("log-level", Value(&options_.logLevel))
                .setDescription("Log level (alert|crit|error|warn|notice|info|debug)")
                .setDefaultValue("warn")
                .build()
        );
        // clang-format on
    }

    ~Command() = default;

    void execute(const std::vector<std::string_view>& args) override
    {
        parser_.parse(args);
        if (parser_.isUsed("help"))
        {
            parser_.help(std::cout, "certkit show");
            return;
        }
        parser_.validate();

        cmd::SetupLogging(options_.logLevel);

        auto certs = Cert::loadFile(options_.certPath);
        for (size_t i = 0; i < certs.size(); ++i)
        {
            PrintCert(std::cout, certs[i], i + 1);
        }
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

REGISTER_COMMAND("show", "Print certificates", Command);

} // namespace certkit::viewer
