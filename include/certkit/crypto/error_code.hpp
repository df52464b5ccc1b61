/// @file
/// @brief Declaration of error handling functions for cryptography.

#pragma once
#include <system_error>
#include <openssl/x509_vfy.h>

namespace certkit::crypto
{

/// @brief Errors detected by certkit itself rather than by OpenSSL.
enum class Errc
{
    DecodeError = 1,      ///< Present structure with malformed content.
    DigestNotAllowed,     ///< Digest is forbidden for the signing key algorithm.
    UnknownDigest,        ///< Digest name is not known to the provider.
    EmptyInput,           ///< Nothing to parse.
    NoCertificates,       ///< Input holds no certificate in any supported encoding.
    InvalidName,          ///< Distinguished name text can't be parsed.
    KeyMismatch,          ///< Private key doesn't belong to the certificate.
};

/// @brief Translates an error code from an unsigned long to a std::error_code.
/// @param error The error code to translate.
/// @return The corresponding std::error_code.
std::error_code TranslateError(unsigned long error);

/// @brief Retrieves the last error that occurred.
/// @return The last error as a std::error_code.
std::error_code GetLastError();

/// @brief Makes an error code in the certkit category.
std::error_code MakeErrorCode(Errc e);

} // namespace certkit::crypto

namespace certkit::crypto::verify
{

/// @brief Chain verification failures reported by the X509 store.
enum class Error
{
    No = X509_V_OK,
    Unspecified = X509_V_ERR_UNSPECIFIED,
    UnableToGetIssuerCert = X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT,
    UnableToGetIssuerCertLocally = X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY,
    UnableToVerifyLeafSignature = X509_V_ERR_UNABLE_TO_VERIFY_LEAF_SIGNATURE,
    CertSignatureFailure = X509_V_ERR_CERT_SIGNATURE_FAILURE,
    CertNotYetValid = X509_V_ERR_CERT_NOT_YET_VALID,
    CertHasExpired = X509_V_ERR_CERT_HAS_EXPIRED,
    SelfSignedCert = X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT,
    SelfSignedCertInChain = X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN,
    InvalidCA = X509_V_ERR_INVALID_CA,
    KeyUsageNoCertSign = X509_V_ERR_KEYUSAGE_NO_CERTSIGN,
    AKIDAndSKIDMismatch = X509_V_ERR_AKID_SKID_MISMATCH,
    UnsupportedSignatureAlgorithm = X509_V_ERR_UNSUPPORTED_SIGNATURE_ALGORITHM,
    SignatureAlgorithmMismatch = X509_V_ERR_SIGNATURE_ALGORITHM_MISMATCH,
    MissingAuthKeyID = X509_V_ERR_MISSING_AUTHORITY_KEY_IDENTIFIER,
    MissingSubjectKeyID = X509_V_ERR_MISSING_SUBJECT_KEY_IDENTIFIER,
    ExtensionsRequireV3 = X509_V_ERR_EXTENSIONS_REQUIRE_VERSION_3,
};

std::error_code MakeErrorCode(Error e);

} // namespace certkit::crypto::verify
