#include <functional>
#include <utility>
#include <gtest/gtest.h>

#include <certkit/crypto/asymm_key.hpp>
#include <certkit/crypto/asymm_keygen.hpp>
#include <certkit/crypto/bignum.hpp>
#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/cert_builder.hpp>
#include <certkit/crypto/cert_name_builder.hpp>
#include <certkit/crypto/cert_signer.hpp>
#include <certkit/crypto/exception.hpp>

using namespace certkit::crypto;

class CertSignerTest : public testing::Test
{
public:
    static void SetUpTestSuite()
    {
        rsa1024_ = akey::rsa::generate(1024);
        rsa2048_ = akey::rsa::generate(2048);
        dsa2048_ = akey::dsa::generate(2048);
        p256_ = akey::ec::generate("prime256v1");
        ed25519_ = akey::ed25519::generate();
    }

    static void TearDownTestSuite()
    {
        rsa1024_.reset();
        rsa2048_.reset();
        dsa2048_.reset();
        p256_.reset();
        ed25519_.reset();
    }

protected:
    static X509CertPtr issue(Key* key, std::string_view digest = {})
    {
        CertBuilder builder;
        // clang-format off
        return builder
            .selfSigned(key)
            .setPublicKey(key)
            .setSubjectName("/DC=org/DC=certkit/CN=Signer")
            .addExtension(NID_basic_constraints, "CA:FALSE")
            .setDigest(digest)
            .build();
        // clang-format on
    }

    static void expectError(const std::function<void()>& fn, Errc expected)
    {
        try
        {
            fn();
            FAIL() << "exception expected";
        }
        catch (const CryptoException& e)
        {
            EXPECT_EQ(e.code(), MakeErrorCode(expected)) << e.what();
        }
    }

protected:
    static KeyPtr rsa1024_;
    static KeyPtr rsa2048_;
    static KeyPtr dsa2048_;
    static KeyPtr p256_;
    static KeyPtr ed25519_;
};

KeyPtr CertSignerTest::rsa1024_;
KeyPtr CertSignerTest::rsa2048_;
KeyPtr CertSignerTest::dsa2048_;
KeyPtr CertSignerTest::p256_;
KeyPtr CertSignerTest::ed25519_;

TEST_F(CertSignerTest, VerifyWithCorrectKey)
{
    auto cert = issue(rsa2048_);
    EXPECT_TRUE(CertSigner::verify(cert, rsa2048_));
    EXPECT_TRUE(CertSigner::verify(cert, Cert::publicKey(cert)));
}

TEST_F(CertSignerTest, VerifyWithWrongKeyOfSameAlgorithm)
{
    auto cert = issue(rsa2048_);
    EXPECT_FALSE(CertSigner::verify(cert, rsa1024_));
}

TEST_F(CertSignerTest, VerifyWithKeyOfOtherAlgorithm)
{
    auto rsaCert = issue(rsa2048_);
    EXPECT_FALSE(CertSigner::verify(rsaCert, dsa2048_));
    EXPECT_FALSE(CertSigner::verify(rsaCert, p256_));
    EXPECT_FALSE(CertSigner::verify(rsaCert, ed25519_));

    auto dsaCert = issue(dsa2048_);
    EXPECT_FALSE(CertSigner::verify(dsaCert, rsa2048_));
}

TEST_F(CertSignerTest, MutationInvalidatesSignature)
{
    auto cert = issue(rsa2048_);
    auto serial = BigNumTraits::fromWord(42);
    Cert::setSerialNumber(cert, serial);
    EXPECT_FALSE(CertSigner::verify(cert, rsa2048_));

    cert = issue(rsa2048_);
    auto subject = CertNameBuilder::fromString("CN=Changed");
    Cert::setSubjectName(cert, subject);
    EXPECT_FALSE(CertSigner::verify(cert, rsa2048_));

    cert = issue(rsa2048_);
    Cert::setNotAfter(cert, Cert::notAfter(cert) + 1);
    EXPECT_FALSE(CertSigner::verify(cert, rsa2048_));

    cert = issue(ed25519_);
    Cert::setNotBefore(cert, Cert::notBefore(cert) - 1);
    EXPECT_FALSE(CertSigner::verify(cert, ed25519_));
}

TEST_F(CertSignerTest, ResigningAfterMutation)
{
    auto cert = issue(rsa2048_);
    auto serial = BigNumTraits::fromWord(7);
    Cert::setSerialNumber(cert, serial);
    ASSERT_FALSE(CertSigner::verify(cert, rsa2048_));

    ASSERT_NO_THROW(CertSigner::sign(cert, rsa2048_));
    EXPECT_TRUE(CertSigner::verify(cert, rsa2048_));
}

TEST_F(CertSignerTest, RsaLegacyDigests)
{
    const std::pair<std::string, std::string> digests[] = {
        {"SHA1", "sha1WithRSAEncryption"},
        {"MD5", "md5WithRSAEncryption"},
    };

    for (const auto& [digest, algorithm] : digests)
    {
        X509CertPtr cert;
        try
        {
            cert = issue(rsa2048_, digest);
        }
        catch (const CryptoException& e)
        {
            // Provider may have the digest disabled.
            GTEST_SKIP() << digest << ": " << e.what();
        }
        EXPECT_EQ(CertSigner::signatureAlgorithm(cert), algorithm);
        EXPECT_TRUE(CertSigner::verify(cert, rsa2048_));
    }
}

TEST_F(CertSignerTest, RsaStrongDigests)
{
    auto cert = issue(rsa2048_, "SHA512");
    EXPECT_EQ(CertSigner::signatureAlgorithm(cert), "sha512WithRSAEncryption");
    EXPECT_TRUE(CertSigner::verify(cert, rsa2048_));

    cert = issue(rsa2048_, "SHA3-256");
    EXPECT_EQ(CertSigner::signatureAlgorithm(cert), "RSA-SHA3-256");
    EXPECT_TRUE(CertSigner::verify(cert, rsa2048_));
}

TEST_F(CertSignerTest, DsaSignatures)
{
    auto cert = issue(dsa2048_);
    EXPECT_EQ(CertSigner::signatureAlgorithm(cert), "dsa_with_SHA256");
    EXPECT_TRUE(CertSigner::verify(cert, dsa2048_));

    try
    {
        cert = issue(dsa2048_, "SHA1");
    }
    catch (const CryptoException& e)
    {
        GTEST_SKIP() << "SHA1: " << e.what();
    }
    EXPECT_EQ(CertSigner::signatureAlgorithm(cert), "dsaWithSHA1");
    EXPECT_TRUE(CertSigner::verify(cert, dsa2048_));
}

TEST_F(CertSignerTest, DsaWithMd5IsRejected)
{
    expectError([&] { issue(dsa2048_, "MD5"); }, Errc::DigestNotAllowed);
    expectError([&] { CertSigner::resolveDigest(dsa2048_, "MD5"); }, Errc::DigestNotAllowed);
}

TEST_F(CertSignerTest, PolicyCheckPrecedesSigning)
{
    auto cert = issue(dsa2048_);
    auto before = Cert::toDer(cert);

    expectError([&] { CertSigner::sign(cert, dsa2048_, "MD5"); }, Errc::DigestNotAllowed);
    EXPECT_EQ(Cert::toDer(cert), before);
}

TEST_F(CertSignerTest, UnknownDigest)
{
    expectError([&] { CertSigner::resolveDigest(rsa2048_, "NO-SUCH-DIGEST"); }, Errc::UnknownDigest);
}

TEST_F(CertSignerTest, EcSignatures)
{
    auto cert = issue(p256_, "SHA384");
    EXPECT_EQ(CertSigner::signatureAlgorithm(cert), "ecdsa-with-SHA384");
    EXPECT_TRUE(CertSigner::verify(cert, p256_));
    EXPECT_FALSE(CertSigner::verify(cert, rsa2048_));

    expectError([&] { CertSigner::resolveDigest(p256_, "MD5"); }, Errc::DigestNotAllowed);
}

TEST_F(CertSignerTest, Ed25519SignsWithoutDigest)
{
    HashPtr md;
    ASSERT_NO_THROW(md = CertSigner::resolveDigest(ed25519_, ""));
    EXPECT_EQ(md, nullptr);

    auto cert = issue(ed25519_);
    EXPECT_EQ(CertSigner::signatureAlgorithm(cert), "ED25519");
    EXPECT_TRUE(CertSigner::verify(cert, ed25519_));
    EXPECT_FALSE(CertSigner::verify(cert, akey::ed25519::generate()));

    expectError([&] { issue(ed25519_, "SHA256"); }, Errc::DigestNotAllowed);
}

TEST_F(CertSignerTest, CheckPrivateKey)
{
    auto cert = issue(rsa2048_);
    EXPECT_TRUE(CertSigner::checkPrivateKey(cert, rsa2048_));
    EXPECT_FALSE(CertSigner::checkPrivateKey(cert, rsa1024_));
    EXPECT_FALSE(CertSigner::checkPrivateKey(cert, p256_));
}

TEST_F(CertSignerTest, SignedCertSurvivesEncoding)
{
    auto cert = issue(p256_);

    auto fromDer = Cert::fromDer(Cert::toDer(cert));
    EXPECT_TRUE(CertSigner::verify(fromDer, p256_));

    auto fromPem = Cert::fromPem(Cert::toPem(cert));
    EXPECT_TRUE(CertSigner::verify(fromPem, p256_));
}
