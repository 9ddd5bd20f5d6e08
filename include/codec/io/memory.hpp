////////////////////////////////////////////////////////////////////////////////
//
// codec/io/memory.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_1E9F6A3C_84B2_4D07_A5C1_6B38D0E2F94A
#define CODEC_INCLUDED_1E9F6A3C_84B2_4D07_A5C1_6B38D0E2F94A


#include <codec/endian.hpp>
#include <codec/stddef.hpp>
#include <codec/type_traits.hpp>

#include <cstring>
#include <memory>


namespace codec {
namespace io {

// Clang warns that the __attribute__((packed)) below is unnecessary, even
// though Clang generates aligned load instructions without it.
#if __has_warning("-Wpacked")
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wpacked"
#endif

template<typename T>
CODEC_READONLY
CODEC_INLINE T load(void const* const p) noexcept
{
    static_assert(is_trivially_copyable_v<T>, "");

#if __has_attribute(may_alias) || CODEC_GCC_PREREQ(3, 3)
    struct Alias { T t; } __attribute__((may_alias, packed));
    return static_cast<Alias const*>(p)->t;
#else
    T v;
    std::memcpy(std::addressof(v), p, sizeof(T));
    return v;
#endif
}

#if __has_warning("-Wpacked")
# pragma clang diagnostic pop
#endif


template<typename T, endian E>
CODEC_READONLY
CODEC_INLINE T load(void const* const p) noexcept
{
    return to_host<E>(io::load<T>(p));
}

}}    // namespace codec::io


#endif  // CODEC_INCLUDED_1E9F6A3C_84B2_4D07_A5C1_6B38D0E2F94A
