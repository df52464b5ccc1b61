#include <chrono>
#include <iostream>

#include <casket/log/log_manager.hpp>
#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>
#include <casket/utils/exception.hpp>

#include <certkit/cli/command_dispatcher.hpp>
#include <certkit/cli/log_level.hpp>

#include <certkit/crypto/asymm_key.hpp>
#include <certkit/crypto/bignum.hpp>
#include <certkit/crypto/bio.hpp>
#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/cert_issuer.hpp>
#include <certkit/crypto/cert_name_builder.hpp>

using namespace casket;
using namespace casket::opt;
using namespace certkit::crypto;

namespace certkit::issuer
{

struct Options
{
    std::string subject;
    std::string keyPath;
    std::string issuerCertPath;
    std::string issuerKeyPath;
    std::string serial;
    std::string digest;
    std::string extfile;
    std::string extensions;
    std::string output;
    std::string logLevel;
    int days{30};
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
            OptionBuilder("subject", Value(&options_.subject))
                .setDescription("Subject name, '/DC=org/CN=CA' or 'CN=CA;O=Org'")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("key", Value(&options_.keyPath))
                .setDescription("Subject private key, also the signing key for self-signed certificate")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("issuer-cert", Value(&options_.issuerCertPath))
                .setDescription("Issuer certificate")
                .build()
        );
        parser_.add(
            OptionBuilder("issuer-key", Value(&options_.issuerKeyPath))
                .setDescription("Issuer private key")
                .build()
        );
        parser_.add(
            OptionBuilder("serial", Value(&options_.serial))
                .setDescription("Decimal serial number, random 64-bit value by default")
                .build()
        );
        parser_.add(
            OptionBuilder("days", Value(&options_.days))
                .setDescription("Validity period in days (30 by default)")
                .build()
        );
        parser_.add(
            OptionBuilder("digest", Value(&options_.digest))
                .setDescription("Signature digest, default digest of the signing key when omitted")
                .build()
        );
        parser_.add(
            OptionBuilder("extfile", Value(&options_.extfile))
                .setDescription("OpenSSL configuration file with extensions")
                .build()
        );
        parser_.add(
            OptionBuilder("extensions", Value(&options_.extensions))
                .setDescription("Section of extfile with extensions")
                .build()
        );
        parser_.add(
            OptionBuilder("out", Value(&options_.output))
                .setDescription("Output file, standard output by default")
                .build()
        );
        parser_.add(
            OptionBuilder("der")
                .setDescription("Write certificate in DER")
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
            parser_.help(std::cout, "certkit issue");
            return;
        }
        parser_.validate();

        cmd::SetupLogging(options_.logLevel);

        casket::ThrowIfTrue(options_.days <= 0, "Validity period must be positive");
        casket::ThrowIfTrue(options_.issuerCertPath.empty() != options_.issuerKeyPath.empty(),
                            "Options 'issuer-cert' and 'issuer-key' must be used together");
        casket::ThrowIfTrue(!options_.extensions.empty() && options_.extfile.empty(),
                            "Option 'extensions' requires 'extfile'");

        auto subjectKey = AsymmKey::fromFile(KeyType::Private, options_.keyPath);
        auto subject = CertNameBuilder::fromString(options_.subject);

        IssueOptions issueOptions;
        issueOptions.subject = subject;
        issueOptions.publicKey = subjectKey;
        issueOptions.validity = std::chrono::hours(24) * options_.days;
        issueOptions.digest = options_.digest;

        BigNumPtr serial;
        if (!options_.serial.empty())
        {
            serial = BigNumTraits::fromDecimal(options_.serial);
            issueOptions.serial = serial;
        }

        X509CertPtr issuerCert;
        KeyPtr issuerKey;
        if (!options_.issuerCertPath.empty())
        {
            issuerCert = Cert::fromFile(options_.issuerCertPath);
            issuerKey = AsymmKey::fromFile(KeyType::Private, options_.issuerKeyPath);
            issueOptions.issuerCert = issuerCert;
            issueOptions.issuerKey = issuerKey;
        }
        else
        {
            issueOptions.issuerKey = subjectKey;
        }

        if (!options_.extfile.empty())
        {
            auto file = BioTraits::openFile(options_.extfile, "rb");
            auto content = BioTraits::readAllData(file);
            issueOptions.config.assign(content.begin(), content.end());
            issueOptions.extensionSection = options_.extensions.empty() ? "default" : options_.extensions;
        }

        auto cert = IssueCert(issueOptions);
        casket::info("issued certificate for '{}'", options_.subject);

        const auto encoding = parser_.isUsed("der") ? Encoding::DER : Encoding::PEM;
        if (options_.output.empty())
        {
            auto out = BioTraits::createMemoryBuffer();
            Cert::toBio(cert, out, encoding);
            auto data = BioTraits::getMemoryData(out);
            std::cout.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        else
        {
            auto out = BioTraits::openFile(options_.output, "wb");
            Cert::toBio(cert, out, encoding);
        }
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

REGISTER_COMMAND("issue", "Issue certificate", Command);

} // namespace certkit::issuer
