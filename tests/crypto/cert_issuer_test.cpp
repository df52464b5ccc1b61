#include <gtest/gtest.h>

#include <certkit/crypto/asymm_key.hpp>
#include <certkit/crypto/asymm_keygen.hpp>
#include <certkit/crypto/bignum.hpp>
#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/cert_issuer.hpp>
#include <certkit/crypto/cert_name.hpp>
#include <certkit/crypto/cert_name_builder.hpp>
#include <certkit/crypto/cert_signer.hpp>
#include <certkit/crypto/extension.hpp>
#include <certkit/crypto/extension_codec.hpp>
#include <certkit/crypto/exception.hpp>

using namespace certkit::crypto;

namespace
{

constexpr const char* kConfig = R"(
[ server_ext ]
basicConstraints = critical,CA:FALSE
keyUsage = critical,digitalSignature
extendedKeyUsage = serverAuth
crlDistributionPoints = URI:http://crl.example.org/ca.crl
)";

} // namespace

class CertIssuerTest : public testing::Test
{
public:
    static void SetUpTestSuite()
    {
        caKey_ = akey::ec::generate("prime256v1");
        leafKey_ = akey::ec::generate("prime256v1");

        auto subject = CertNameBuilder::fromString("CN=Issuer CA");

        IssueOptions options;
        options.subject = subject;
        options.publicKey = caKey_;
        options.issuerKey = caKey_;
        options.validity = std::chrono::hours(24);
        options.extensions = {
            {"subjectKeyIdentifier", "hash", false},
            {"basicConstraints", "CA:TRUE", true},
            {"keyUsage", "keyCertSign,cRLSign", true},
        };
        ca_ = IssueCert(options);
    }

    static void TearDownTestSuite()
    {
        ca_.reset();
        caKey_.reset();
        leafKey_.reset();
    }

protected:
    static KeyPtr caKey_;
    static KeyPtr leafKey_;
    static X509CertPtr ca_;
};

KeyPtr CertIssuerTest::caKey_;
KeyPtr CertIssuerTest::leafKey_;
X509CertPtr CertIssuerTest::ca_;

TEST_F(CertIssuerTest, SelfSigned)
{
    ASSERT_NE(ca_, nullptr);
    EXPECT_TRUE(CertName::isEqual(Cert::subjectName(ca_), Cert::issuerName(ca_)));
    EXPECT_TRUE(CertSigner::verify(ca_, caKey_));
    EXPECT_EQ(Cert::notAfter(ca_) - Cert::notBefore(ca_), 24 * 60 * 60);
    EXPECT_FALSE(BigNumTraits::isZero(Cert::serialNumber(ca_)));

    auto extensions = X509Extension::list(ca_);
    ASSERT_EQ(extensions.size(), 3U);
    EXPECT_EQ(extensions[0].oid, "subjectKeyIdentifier");
    EXPECT_EQ(extensions[1].oid, "basicConstraints");
    EXPECT_TRUE(extensions[1].critical);
}

TEST_F(CertIssuerTest, SignedByCA)
{
    auto subject = CertNameBuilder::fromString("CN=leaf.example.org");
    auto serial = BigNumTraits::fromWord(1001);

    IssueOptions options;
    options.subject = subject;
    options.publicKey = leafKey_;
    options.serial = serial;
    options.issuerCert = ca_;
    options.issuerKey = caKey_;
    options.notBefore = 1700000000;
    options.notAfter = 1800000000;
    options.digest = "SHA384";
    options.extensions = {{"authorityKeyIdentifier", "keyid:always", false}};

    X509CertPtr leaf;
    ASSERT_NO_THROW(leaf = IssueCert(options));

    EXPECT_TRUE(CertName::isEqual(Cert::issuerName(leaf), Cert::subjectName(ca_)));
    EXPECT_TRUE(BigNumTraits::isEqual(Cert::serialNumber(leaf), serial));
    EXPECT_EQ(Cert::notBefore(leaf), 1700000000);
    EXPECT_EQ(Cert::notAfter(leaf), 1800000000);
    EXPECT_EQ(CertSigner::signatureAlgorithm(leaf), "ecdsa-with-SHA384");
    EXPECT_TRUE(CertSigner::verify(leaf, caKey_));
    EXPECT_FALSE(CertSigner::verify(leaf, leafKey_));
    EXPECT_EQ(ExtensionCodec::authorityKeyIdentifier(leaf), ExtensionCodec::subjectKeyIdentifier(ca_));
}

TEST_F(CertIssuerTest, ValidityFromNotBefore)
{
    auto subject = CertNameBuilder::fromString("CN=short");

    IssueOptions options;
    options.subject = subject;
    options.publicKey = leafKey_;
    options.issuerCert = ca_;
    options.issuerKey = caKey_;
    options.notBefore = 1600000000;

    auto leaf = IssueCert(options);
    EXPECT_EQ(Cert::notBefore(leaf), 1600000000);
    EXPECT_EQ(Cert::notAfter(leaf), 1600000000 + 60 * 60);
}

TEST_F(CertIssuerTest, ExtensionsFromConfigSection)
{
    auto subject = CertNameBuilder::fromString("CN=server");

    IssueOptions options;
    options.subject = subject;
    options.publicKey = leafKey_;
    options.issuerCert = ca_;
    options.issuerKey = caKey_;
    options.config = kConfig;
    options.extensionSection = "server_ext";
    options.extensions = {{"subjectAltName", "DNS:server.example.org", false}};

    X509CertPtr leaf;
    ASSERT_NO_THROW(leaf = IssueCert(options));

    auto extensions = X509Extension::list(leaf);
    ASSERT_EQ(extensions.size(), 5U);
    EXPECT_EQ(extensions[0].oid, "basicConstraints");
    EXPECT_TRUE(extensions[0].critical);
    EXPECT_EQ(extensions[3].oid, "crlDistributionPoints");
    EXPECT_EQ(extensions[4].oid, "subjectAltName");

    auto uris = ExtensionCodec::crlUris(leaf);
    ASSERT_TRUE(uris.has_value());
    EXPECT_EQ(*uris, std::vector<std::string>{"http://crl.example.org/ca.crl"});
}

TEST_F(CertIssuerTest, MissingArguments)
{
    auto subject = CertNameBuilder::fromString("CN=incomplete");

    IssueOptions options;
    options.subject = subject;
    options.publicKey = leafKey_;
    EXPECT_ANY_THROW(IssueCert(options));

    options.issuerKey = caKey_;
    options.subject = nullptr;
    EXPECT_ANY_THROW(IssueCert(options));
}

TEST_F(CertIssuerTest, IssuerKeyMismatch)
{
    auto subject = CertNameBuilder::fromString("CN=mismatch");

    IssueOptions options;
    options.subject = subject;
    options.publicKey = leafKey_;
    options.issuerCert = ca_;
    options.issuerKey = leafKey_;

    try
    {
        IssueCert(options);
        FAIL() << "exception expected";
    }
    catch (const CryptoException& e)
    {
        EXPECT_EQ(e.code(), MakeErrorCode(Errc::KeyMismatch));
    }
}
