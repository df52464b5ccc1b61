#include <functional>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

#include <openssl/asn1.h>

#include <certkit/crypto/asymm_keygen.hpp>
#include <certkit/crypto/bignum.hpp>
#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/cert_builder.hpp>
#include <certkit/crypto/cert_name.hpp>
#include <certkit/crypto/exception.hpp>

using namespace testing;
using namespace certkit::crypto;

class CertTest : public Test
{
public:
    static void SetUpTestSuite()
    {
        key_ = akey::ec::generate("prime256v1");
    }

    static void TearDownTestSuite()
    {
        key_.reset();
    }

protected:
    void SetUp() override
    {
        path_ = std::filesystem::temp_directory_path() /
                ("certkit_cert_" + std::string(UnitTest::GetInstance()->current_test_info()->name()));
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    template <typename Container>
    void writeFile(const Container& content)
    {
        std::ofstream out(path_, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }

    static X509CertPtr issue(const std::string& cn, bool withExtensions = true)
    {
        CertBuilder builder;
        builder.selfSigned(key_).setPublicKey(key_).setSubjectName("CN=" + cn);
        if (withExtensions)
        {
            builder.addExtension(NID_basic_constraints, "CA:FALSE", true);
        }
        return builder.build();
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
    static KeyPtr key_;
    std::filesystem::path path_;
};

KeyPtr CertTest::key_;

TEST_F(CertTest, DerRoundTrip)
{
    auto cert = issue("DER");
    auto der = Cert::toDer(cert);

    X509CertPtr decoded;
    ASSERT_NO_THROW(decoded = Cert::fromDer(der));
    EXPECT_TRUE(Cert::isEqual(cert, decoded));
    EXPECT_EQ(Cert::toDer(decoded), der);
}

TEST_F(CertTest, PemRoundTrip)
{
    auto cert = issue("PEM");
    auto pem = Cert::toPem(cert);
    EXPECT_EQ(pem.rfind("-----BEGIN CERTIFICATE-----", 0), 0U);

    X509CertPtr decoded;
    ASSERT_NO_THROW(decoded = Cert::fromPem(pem));
    EXPECT_TRUE(Cert::isEqual(cert, decoded));
}

TEST_F(CertTest, SerializeIsStable)
{
    auto cert = issue("Serialize");
    auto bytes = Cert::serialize(cert);

    auto restored = Cert::deserialize(bytes);
    EXPECT_EQ(Cert::serialize(restored), bytes);
}

TEST_F(CertTest, DecodePrefersDer)
{
    auto inner = issue("Inner");
    auto innerPem = Cert::toPem(inner);

    // Outer DER carries a complete PEM block inside a comment extension.
    CertBuilder builder;
    // clang-format off
    auto outer = builder
        .selfSigned(key_)
        .setPublicKey(key_)
        .setSubjectName("CN=Outer")
        .addExtension(NID_netscape_comment, innerPem)
        .build();
    // clang-format on

    X509CertPtr decoded;
    ASSERT_NO_THROW(decoded = Cert::decode(Cert::toDer(outer)));
    EXPECT_TRUE(Cert::isEqual(decoded, outer));
    EXPECT_FALSE(Cert::isEqual(decoded, inner));
}

TEST_F(CertTest, DecodeFallsBackToPem)
{
    auto cert = issue("Fallback");
    auto pem = Cert::toPem(cert);

    X509CertPtr decoded;
    ASSERT_NO_THROW(decoded = Cert::decode({reinterpret_cast<const uint8_t*>(pem.data()), pem.size()}));
    EXPECT_TRUE(Cert::isEqual(decoded, cert));
}

TEST_F(CertTest, DecodeInvalidInput)
{
    const std::vector<uint8_t> garbage = {0x30, 0x03, 0x02, 0x01};
    expectError([&] { Cert::fromDer(garbage); }, Errc::DecodeError);
    expectError([&] { Cert::decode(garbage); }, Errc::DecodeError);
    expectError([&] { Cert::fromDer({}); }, Errc::EmptyInput);
    expectError([&] { Cert::fromPem("not a certificate"); }, Errc::DecodeError);
}

TEST_F(CertTest, CopiesAreEqual)
{
    auto cert = issue("Copy");

    auto shallow = Cert::shallowCopy(cert);
    EXPECT_EQ(shallow.get(), cert.get());

    auto deep = Cert::deepCopy(cert);
    EXPECT_NE(deep.get(), cert.get());
    EXPECT_TRUE(Cert::isEqual(deep, cert));
}

TEST_F(CertTest, MutationChangesEquality)
{
    auto cert = issue("Mutation");
    auto copy = Cert::deepCopy(cert);

    auto serial = BigNumTraits::fromWord(99);
    Cert::setSerialNumber(copy, serial);
    EXPECT_FALSE(Cert::isEqual(cert, copy));
    EXPECT_TRUE(BigNumTraits::isEqual(Cert::serialNumber(copy), serial));
}

TEST_F(CertTest, TbsStructure)
{
    auto check = [](X509Cert* cert, int expected) {
        auto tbs = Cert::tbsBytes(cert);
        const unsigned char* ptr = tbs.data();
        ASN1_SEQUENCE_ANY* seq = d2i_ASN1_SEQUENCE_ANY(nullptr, &ptr, static_cast<long>(tbs.size()));
        ASSERT_NE(seq, nullptr);
        EXPECT_EQ(sk_ASN1_TYPE_num(seq), expected);
        EXPECT_EQ(ptr, tbs.data() + tbs.size());
        sk_ASN1_TYPE_pop_free(seq, ASN1_TYPE_free);
    };

    // version, serial, signature, issuer, validity, subject, key
    auto plain = issue("Plain", false);
    check(plain, 7);

    // ... and extensions
    auto extended = issue("Extended");
    check(extended, 8);
}

TEST_F(CertTest, LoadPemSequenceKeepsOrder)
{
    std::vector<X509CertPtr> certs;
    certs.emplace_back(issue("First"));
    certs.emplace_back(issue("Second"));
    certs.emplace_back(issue("Third"));

    std::string content;
    for (const auto& cert : certs)
    {
        content += Cert::toPem(cert);
    }
    writeFile(content);

    std::vector<X509CertPtr> loaded;
    ASSERT_NO_THROW(loaded = Cert::loadFile(path_));
    ASSERT_EQ(loaded.size(), certs.size());
    for (size_t i = 0; i < certs.size(); ++i)
    {
        EXPECT_TRUE(Cert::isEqual(loaded[i], certs[i])) << i;
    }

    auto first = Cert::fromFile(path_);
    EXPECT_EQ(CertName::entryValue(Cert::subjectName(first), NID_commonName), "First");
}

TEST_F(CertTest, LoadDerFile)
{
    auto cert = issue("DerFile");
    writeFile(Cert::toDer(cert));

    std::vector<X509CertPtr> loaded;
    ASSERT_NO_THROW(loaded = Cert::loadFile(path_));
    ASSERT_EQ(loaded.size(), 1U);
    EXPECT_TRUE(Cert::isEqual(loaded.front(), cert));
}

TEST_F(CertTest, LoadEmptyFile)
{
    writeFile(std::string());
    expectError([&] { Cert::loadFile(path_); }, Errc::EmptyInput);
}

TEST_F(CertTest, LoadFileWithoutCertificates)
{
    writeFile(std::string("just some text\n"));
    expectError([&] { Cert::loadFile(path_); }, Errc::NoCertificates);
}

TEST_F(CertTest, LoadCorruptedPemBlock)
{
    writeFile(std::string("-----BEGIN CERTIFICATE-----\n!!!!\n-----END CERTIFICATE-----\n"));
    EXPECT_THROW(Cert::loadFile(path_), CryptoException);
}

TEST_F(CertTest, LoadValidThenCorruptedPemBlock)
{
    auto cert = issue("Valid");
    writeFile(Cert::toPem(cert) + "-----BEGIN CERTIFICATE-----\n!!!!\n-----END CERTIFICATE-----\n");

    std::vector<X509CertPtr> loaded;
    EXPECT_THROW(loaded = Cert::loadFile(path_), CryptoException);
    EXPECT_TRUE(loaded.empty());
}

TEST_F(CertTest, LoadMissingFile)
{
    EXPECT_THROW(Cert::loadFile(path_), CryptoException);
}
