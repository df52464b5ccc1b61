#include <cstring>
#include <openssl/x509.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/err.h>

#include <casket/log/log_manager.hpp>

#include <certkit/crypto/cert.hpp>
#include <certkit/crypto/cert_name.hpp>
#include <certkit/crypto/bio.hpp>

#include <certkit/crypto/exception.hpp>
#include <certkit/crypto/error_code.hpp>

using namespace certkit::crypto;

namespace
{

time_t asn1TimeToEpoch(const Asn1Time* asn1Time)
{
    std::tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    certkit::crypto::ThrowIfFalse(ASN1_TIME_to_tm(asn1Time, &tmTime));

    // ASN1_TIME_to_tm gives UTC.
    return timegm(&tmTime);
}

Asn1TimePtr epochToAsn1Time(std::time_t time)
{
    Asn1TimePtr result(ASN1_TIME_set(nullptr, time));
    certkit::crypto::ThrowIfTrue(result == nullptr);
    return result;
}

void markModified(X509Cert* cert)
{
    // Drops the cached TBS encoding so the next encoding uses current fields.
    certkit::crypto::ThrowIfFalse(0 < i2d_re_X509_tbs(cert, nullptr));
}

bool isNoStartLine(unsigned long err)
{
    return ERR_GET_LIB(err) == ERR_LIB_PEM && ERR_GET_REASON(err) == PEM_R_NO_START_LINE;
}

} // namespace

namespace certkit::crypto
{

X509CertPtr Cert::shallowCopy(X509Cert* cert)
{
    if (cert)
    {
        crypto::ThrowIfFalse(0 < X509_up_ref(cert));
        return X509CertPtr{cert};
    }
    return nullptr;
}

X509CertPtr Cert::deepCopy(X509Cert* cert)
{
    X509CertPtr result{X509_dup(cert)};
    crypto::ThrowIfTrue(result == nullptr);
    return result;
}

bool Cert::isEqual(const X509Cert* a, const X509Cert* b)
{
    return toDer(a) == toDer(b);
}

CertVersion Cert::version(X509Cert* cert)
{
    long value = X509_get_version(cert);
    switch (value)
    {
    case static_cast<long>(CertVersion::V1):
    case static_cast<long>(CertVersion::V2):
    case static_cast<long>(CertVersion::V3):
        return static_cast<CertVersion>(value);
    default:
        throw CryptoException(Errc::DecodeError, "Unsupported version of certificate: " + std::to_string(value));
    }
}

X509NamePtr Cert::subjectName(X509Cert* cert)
{
    auto name = X509_get_subject_name(cert);
    crypto::ThrowIfTrue(name == nullptr);

    return CertName::deepCopy(name);
}

X509NamePtr Cert::issuerName(X509Cert* cert)
{
    auto name = X509_get_issuer_name(cert);
    crypto::ThrowIfTrue(name == nullptr);

    return CertName::deepCopy(name);
}

BigNumPtr Cert::serialNumber(X509Cert* cert)
{
    Asn1Integer* sn = X509_get_serialNumber(cert);
    crypto::ThrowIfTrue(sn == nullptr);

    BigNumPtr result{ASN1_INTEGER_to_BN(sn, nullptr)};
    crypto::ThrowIfTrue(result == nullptr);
    return result;
}

KeyPtr Cert::publicKey(X509Cert* cert)
{
    auto result = X509_get_pubkey(cert);
    crypto::ThrowIfTrue(result == nullptr);

    return KeyPtr{result};
}

std::time_t Cert::notBefore(X509Cert* cert)
{
    const Asn1Time* asn1Time = X509_get0_notBefore(cert);
    crypto::ThrowIfTrue(asn1Time == nullptr);

    return asn1TimeToEpoch(asn1Time);
}

std::time_t Cert::notAfter(X509Cert* cert)
{
    const Asn1Time* asn1Time = X509_get0_notAfter(cert);
    crypto::ThrowIfTrue(asn1Time == nullptr);

    return asn1TimeToEpoch(asn1Time);
}

void Cert::setSerialNumber(X509Cert* cert, const BigNum* serialNumber)
{
    crypto::ThrowIfFalse(BN_to_ASN1_INTEGER(serialNumber, X509_get_serialNumber(cert)));
    markModified(cert);
}

void Cert::setSubjectName(X509Cert* cert, OSSL_CONST_COMPAT X509Name* name)
{
    crypto::ThrowIfFalse(X509_set_subject_name(cert, name));
    markModified(cert);
}

void Cert::setIssuerName(X509Cert* cert, OSSL_CONST_COMPAT X509Name* name)
{
    crypto::ThrowIfFalse(X509_set_issuer_name(cert, name));
    markModified(cert);
}

void Cert::setNotBefore(X509Cert* cert, std::time_t time)
{
    auto asn1Time = epochToAsn1Time(time);
    crypto::ThrowIfFalse(X509_set1_notBefore(cert, asn1Time));
    markModified(cert);
}

void Cert::setNotAfter(X509Cert* cert, std::time_t time)
{
    auto asn1Time = epochToAsn1Time(time);
    crypto::ThrowIfFalse(X509_set1_notAfter(cert, asn1Time));
    markModified(cert);
}

X509CertPtr Cert::fromFile(const std::filesystem::path& path)
{
    auto certs = loadFile(path);
    return std::move(certs.front());
}

std::vector<X509CertPtr> Cert::loadFile(const std::filesystem::path& path)
{
    auto file = BioTraits::openFile(path, "rb");
    auto content = BioTraits::readAllData(file);
    crypto::ThrowIfTrue(content.empty(), Errc::EmptyInput, "file '" + path.string() + "' is empty");

    std::vector<X509CertPtr> certs;

    const unsigned char* ptr = content.data();
    X509CertPtr der(d2i_X509(nullptr, &ptr, static_cast<long>(content.size())));
    if (der && ptr == content.data() + content.size())
    {
        certs.emplace_back(std::move(der));
        casket::debug("loaded DER certificate from '{}'", path.string());
        return certs;
    }
    ERR_clear_error();

    auto reader = BioTraits::createMemoryReader(content.data(), content.size());
    for (;;)
    {
        X509CertPtr cert(PEM_read_bio_X509(reader, nullptr, nullptr, nullptr));
        if (!cert)
        {
            if (isNoStartLine(ERR_peek_last_error()))
            {
                ERR_clear_error();
                break;
            }
            throw CryptoException(GetLastError(), "unable to parse certificate from '" + path.string() + "'");
        }
        certs.emplace_back(std::move(cert));
    }

    crypto::ThrowIfTrue(certs.empty(), Errc::NoCertificates, "no certificates found in '" + path.string() + "'");

    casket::debug("loaded {} PEM certificate(s) from '{}'", certs.size(), path.string());
    return certs;
}

X509CertPtr Cert::fromBio(Bio* bio, Encoding encoding)
{
    X509CertPtr result;

    switch (encoding)
    {
    case Encoding::DER:
    {
        result.reset(d2i_X509_bio(bio, nullptr));
        break;
    }

    case Encoding::PEM:
    {
        result.reset(PEM_read_bio_X509(bio, nullptr, nullptr, nullptr));
        break;
    }

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported encoding");
    }
    break;
    }

    if (!result)
    {
        throw CryptoException(GetLastError(), "Failed to parse certificate");
    }

    return result;
}

void Cert::toBio(X509Cert* cert, Bio* bio, Encoding encoding)
{
    int ret{0};

    switch (encoding)
    {
    case Encoding::DER:
    {
        ret = i2d_X509_bio(bio, cert);
    }
    break;

    case Encoding::PEM:
    {
        ret = PEM_write_bio_X509(bio, cert);
    }
    break;

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported encoding");
    }
    break;
    }

    if (!ret)
    {
        throw CryptoException(GetLastError(), "Failed to save certificate");
    }
}

X509CertPtr Cert::fromDer(nonstd::span<const uint8_t> input)
{
    crypto::ThrowIfTrue(input.empty(), Errc::EmptyInput, "certificate data is empty");

    const unsigned char* ptr = input.data();
    X509CertPtr result{d2i_X509(nullptr, &ptr, static_cast<long>(input.size_bytes()))};
    crypto::ThrowIfTrue(result == nullptr, Errc::DecodeError, "unable to decode DER certificate");
    return result;
}

std::vector<uint8_t> Cert::toDer(OSSL_CONST_COMPAT X509Cert* cert)
{
    int length = i2d_X509(cert, nullptr);
    crypto::ThrowIfFalse(0 < length, "unable to encode certificate");

    std::vector<uint8_t> result(static_cast<size_t>(length));
    unsigned char* ptr = result.data();
    crypto::ThrowIfFalse(length == i2d_X509(cert, &ptr), "unable to encode certificate");
    return result;
}

X509CertPtr Cert::fromPem(std::string_view input)
{
    crypto::ThrowIfTrue(input.empty(), Errc::EmptyInput, "certificate data is empty");

    auto bio = BioTraits::createMemoryReader(reinterpret_cast<const uint8_t*>(input.data()), input.size());
    X509CertPtr result{PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)};
    crypto::ThrowIfTrue(result == nullptr, Errc::DecodeError, "unable to decode PEM certificate");
    return result;
}

std::string Cert::toPem(X509Cert* cert)
{
    auto bio = BioTraits::createMemoryBuffer();
    toBio(cert, bio, Encoding::PEM);
    return BioTraits::getMemoryDataAsString(bio);
}

X509CertPtr Cert::decode(nonstd::span<const uint8_t> input)
{
    crypto::ThrowIfTrue(input.empty(), Errc::EmptyInput, "certificate data is empty");

    const unsigned char* ptr = input.data();
    X509CertPtr result{d2i_X509(nullptr, &ptr, static_cast<long>(input.size_bytes()))};
    if (result)
    {
        return result;
    }
    ERR_clear_error();

    auto bio = BioTraits::createMemoryReader(input.data(), input.size());
    result.reset(PEM_read_bio_X509(bio, nullptr, nullptr, nullptr));
    crypto::ThrowIfTrue(result == nullptr, Errc::DecodeError, "input is neither DER nor PEM certificate");
    return result;
}

std::vector<uint8_t> Cert::serialize(OSSL_CONST_COMPAT X509Cert* cert)
{
    return toDer(cert);
}

X509CertPtr Cert::deserialize(nonstd::span<const uint8_t> input)
{
    return fromDer(input);
}

std::vector<uint8_t> Cert::tbsBytes(X509Cert* cert)
{
    int length = i2d_re_X509_tbs(cert, nullptr);
    crypto::ThrowIfFalse(0 < length, "unable to encode TBSCertificate");

    std::vector<uint8_t> result(static_cast<size_t>(length));
    unsigned char* ptr = result.data();
    crypto::ThrowIfFalse(length == i2d_re_X509_tbs(cert, &ptr), "unable to encode TBSCertificate");
    return result;
}

} // namespace certkit::crypto
