#pragma once
#include <string_view>
#include <certkit/crypto/pointers.hpp>

namespace certkit::crypto::akey
{

namespace rsa
{

KeyPtr generate(size_t bits);

} // namespace rsa

namespace dsa
{

/// @brief Generates domain parameters of @p bits size and a key over them.
KeyPtr generate(size_t bits);

} // namespace dsa

namespace ec
{

KeyPtr generate(std::string_view groupName);

} // namespace ec

namespace ed25519
{

KeyPtr generate();

} // namespace ed25519

} // namespace certkit::crypto::akey
