#pragma once

#include <openssl/evp.h>
#include <openssl/bn.h>
#include <openssl/conf.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <certkit/crypto/typedefs.hpp>
#include <certkit/utils/custom_unique_ptr.hpp>

namespace certkit::crypto
{

struct CrlDistPointsDeleter
{
    void operator()(CrlDistPoints* points) const noexcept
    {
        sk_DIST_POINT_pop_free(points, DIST_POINT_free);
    }
};

struct AuthInfoAccessDeleter
{
    void operator()(AuthInfoAccess* aia) const noexcept
    {
        sk_ACCESS_DESCRIPTION_pop_free(aia, ACCESS_DESCRIPTION_free);
    }
};

CERTKIT_DEFINE_UNIQUE_PTR(Asn1IntegerPtr, Asn1Integer, ASN1_INTEGER_free);
CERTKIT_DEFINE_UNIQUE_PTR(Asn1TimePtr, Asn1Time, ASN1_TIME_free);
CERTKIT_DEFINE_UNIQUE_PTR(Asn1OctetStringPtr, Asn1OctetString, ASN1_OCTET_STRING_free);
CERTKIT_DEFINE_UNIQUE_PTR(AuthorityKeyIdPtr, AuthorityKeyId, AUTHORITY_KEYID_free);

CERTKIT_DEFINE_UNIQUE_PTR(BigNumPtr, BigNum, BN_free);
CERTKIT_DEFINE_UNIQUE_PTR(BioPtr, Bio, BIO_free_all);
CERTKIT_DEFINE_UNIQUE_PTR(ConfPtr, Conf, NCONF_free);

CERTKIT_DEFINE_UNIQUE_PTR(X509CertPtr, X509Cert, X509_free);
CERTKIT_DEFINE_UNIQUE_PTR(X509ExtPtr, X509Ext, X509_EXTENSION_free);
CERTKIT_DEFINE_UNIQUE_PTR(X509NamePtr, X509Name, X509_NAME_free);
CERTKIT_DEFINE_UNIQUE_PTR(X509StorePtr, X509Store, X509_STORE_free);
CERTKIT_DEFINE_UNIQUE_PTR(X509StoreCtxPtr, X509StoreCtx, X509_STORE_CTX_free);

CERTKIT_DEFINE_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);
CERTKIT_DEFINE_UNIQUE_PTR(KeyCtxPtr, KeyCtx, EVP_PKEY_CTX_free);
CERTKIT_DEFINE_UNIQUE_PTR(HashPtr, Hash, EVP_MD_free);
CERTKIT_DEFINE_UNIQUE_PTR(HashCtxPtr, HashCtx, EVP_MD_CTX_free);

CERTKIT_DEFINE_UNIQUE_PTR_WITH_DELETER(CrlDistPointsPtr, CrlDistPoints, CrlDistPointsDeleter);
CERTKIT_DEFINE_UNIQUE_PTR_WITH_DELETER(AuthInfoAccessPtr, AuthInfoAccess, AuthInfoAccessDeleter);

} // namespace certkit::crypto
