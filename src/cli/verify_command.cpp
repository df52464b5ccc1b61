#include <iostream>

#include <casket/log/log_manager.hpp>
#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>
#include <casket/utils/exception.hpp>

#include <certkit/cli/command_dispatcher.hpp>
#include <certkit/cli/log_level.hpp>

#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/cert_manager.hpp>
#include <certkit/crypto/cert_signer.hpp>
#include <certkit/crypto/cert_verifier.hpp>
#include <certkit/crypto/exception.hpp>

using namespace casket;
using namespace casket::opt;
using namespace certkit::crypto;

namespace certkit::validator
{

struct Options
{
    std::string certPath;
    std::string issuerPath;
    std::string caPath;
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
                .setDescription("Path to certificate")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("issuer", Value(&options_.issuerPath))
                .setDescription("Issuer certificate, checks the signature only")
                .build()
        );
        parser_.add(
            OptionBuilder("ca", Value(&options_.caPath))
                .setDescription("Trusted certificates bundle, checks the whole chain")
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
            parser_.help(std::cout, "certkit verify");
            return;
        }
        parser_.validate();

        cmd::SetupLogging(options_.logLevel);

        casket::ThrowIfTrue(options_.issuerPath.empty() == options_.caPath.empty(),
                            "Exactly one of 'issuer' and 'ca' options must be used");

        auto cert = Cert::fromFile(options_.certPath);

        if (!options_.issuerPath.empty())
        {
            auto issuer = Cert::fromFile(options_.issuerPath);
            auto issuerKey = Cert::publicKey(issuer);

            const bool verified = CertSigner::verify(cert, issuerKey);
            std::cout << "Signature: " << (verified ? "OK" : "FAILED") << std::endl;
            casket::ThrowIfFalse(verified, "Certificate signature verification failed");
            return;
        }

        CertManager manager;
        manager.loadFile(options_.caPath);

        CertVerifier verifier(manager);
        auto ec = verifier.verify(cert);

        std::cout << "Status: " << ec.message() << std::endl;
        if (ec)
        {
            casket::error("chain verification of '{}' failed", options_.certPath);
            throw CryptoException(ec, "Certificate chain verification failed");
        }
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

REGISTER_COMMAND("verify", "Verify certificate", Command);

} // namespace certkit::validator
