#pragma once
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>

#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
#define OSSL_CONST_COMPAT const
#else
#define OSSL_CONST_COMPAT
#endif

namespace certkit::crypto
{

enum class CertVersion
{
    V1 = 0, ///< X509v1
    V2 = 1, ///< X509v2
    V3 = 2, ///< X509v3
};

enum class KeyType
{
    Public,
    Private
};

enum class Encoding
{
    PEM,
    DER,
};

enum class VerifyFlag
{
    StrictCheck = X509_V_FLAG_X509_STRICT,
    CheckSelfSigned = X509_V_FLAG_CHECK_SS_SIGNATURE,
    SearchTrustedFirst = X509_V_FLAG_TRUSTED_FIRST,
    PartialChain = X509_V_FLAG_PARTIAL_CHAIN,
    NoCheckTime = X509_V_FLAG_NO_CHECK_TIME,
};

using Asn1Integer = struct asn1_string_st;
using Asn1OctetString = struct asn1_string_st;
using Asn1Time = struct asn1_string_st;
using AuthorityKeyId = struct AUTHORITY_KEYID_st;
using BigNum = struct bignum_st;
using Bio = struct bio_st;
using Conf = struct conf_st;
using X509Cert = struct x509_st;
using X509Ext = struct X509_extension_st;
using X509Name = struct X509_name_st;
using X509Store = struct x509_store_st;
using X509StoreCtx = struct x509_store_ctx_st;
using X509V3Ctx = struct v3_ext_ctx;
using Hash = struct evp_md_st;
using HashCtx = struct evp_md_ctx_st;
using Key = struct evp_pkey_st;
using KeyCtx = struct evp_pkey_ctx_st;

using CrlDistPoints = STACK_OF(DIST_POINT);
using AuthInfoAccess = STACK_OF(ACCESS_DESCRIPTION);

} // namespace certkit::crypto
