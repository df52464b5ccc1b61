#pragma once
#include <memory>

namespace certkit::utils
{

template <typename T, void (*f)(T*)> struct StaticFunctionDeleter
{
    void operator()(T* t) const noexcept
    {
        f(t);
    }
};

} // namespace certkit::utils

/// Owning pointer which converts implicitly to the raw OpenSSL handle.
#define CERTKIT_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, deleter)                                                 \
    struct alias : public std::unique_ptr<object, deleter>                                                             \
    {                                                                                                                  \
        using unique_ptr::unique_ptr;                                                                                  \
                                                                                                                       \
        operator object*() const                                                                                       \
        {                                                                                                              \
            return this->get();                                                                                        \
        }                                                                                                              \
    }

#define CERTKIT_DEFINE_UNIQUE_PTR(alias, object, deleter)                                                              \
    using alias##Deleter = certkit::utils::StaticFunctionDeleter<object, &deleter>;                                    \
    CERTKIT_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, alias##Deleter)
