#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto
{

class BigNumTraits final
{
public:
    static BigNumPtr fromWord(uint64_t value);

    static BigNumPtr fromDecimal(std::string_view value);

    static BigNumPtr fromHex(std::string_view value);

    /// @brief Returns 2^exponent.
    static BigNumPtr powerOfTwo(int exponent);

    static BigNumPtr random(int bits);

    static std::string toDecimal(const BigNum* value);

    static std::string toHex(const BigNum* value);

    static Asn1IntegerPtr toAsn1Integer(const BigNum* value);

    static bool isEqual(const BigNum* a, const BigNum* b) noexcept
    {
        return 0 == BN_cmp(a, b);
    }

    static bool isZero(const BigNum* value) noexcept
    {
        return BN_is_zero(value);
    }
};

} // namespace certkit::crypto
