#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <certkit/crypto/bignum.hpp>
#include <certkit/crypto/exception.hpp>

namespace
{

std::string takeString(char* value)
{
    certkit::crypto::ThrowIfTrue(value == nullptr);
    std::string result(value);
    OPENSSL_free(value);
    return result;
}

} // namespace

namespace certkit::crypto
{

BigNumPtr BigNumTraits::fromWord(uint64_t value)
{
    BigNumPtr result(BN_new());
    ThrowIfTrue(result == nullptr);
    ThrowIfFalse(BN_set_word(result, static_cast<BN_ULONG>(value)));
    return result;
}

BigNumPtr BigNumTraits::fromDecimal(std::string_view value)
{
    std::string str(value);
    BIGNUM* bn{nullptr};
    const auto length = BN_dec2bn(&bn, str.c_str());
    BigNumPtr result(bn);
    ThrowIfTrue(length == 0 || static_cast<size_t>(length) != str.size(),
                "invalid decimal number: '" + str + "'");
    return result;
}

BigNumPtr BigNumTraits::fromHex(std::string_view value)
{
    std::string str(value);
    BIGNUM* bn{nullptr};
    const auto length = BN_hex2bn(&bn, str.c_str());
    BigNumPtr result(bn);
    ThrowIfTrue(length == 0 || static_cast<size_t>(length) != str.size(),
                "invalid hex number: '" + str + "'");
    return result;
}

BigNumPtr BigNumTraits::powerOfTwo(int exponent)
{
    BigNumPtr result(BN_new());
    ThrowIfTrue(result == nullptr);
    ThrowIfFalse(BN_set_bit(result, exponent));
    return result;
}

BigNumPtr BigNumTraits::random(int bits)
{
    BigNumPtr result(BN_new());
    ThrowIfTrue(result == nullptr);
    ThrowIfFalse(0 < BN_rand(result, bits, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY));
    return result;
}

std::string BigNumTraits::toDecimal(const BigNum* value)
{
    return takeString(BN_bn2dec(value));
}

std::string BigNumTraits::toHex(const BigNum* value)
{
    return takeString(BN_bn2hex(value));
}

Asn1IntegerPtr BigNumTraits::toAsn1Integer(const BigNum* value)
{
    Asn1IntegerPtr result(BN_to_ASN1_INTEGER(value, nullptr));
    ThrowIfTrue(result == nullptr);
    return result;
}

} // namespace certkit::crypto
