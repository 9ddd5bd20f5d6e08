////////////////////////////////////////////////////////////////////////////////
//
// codec/endian.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_72C9B4E1_0D3A_4F65_8B2E_D15A6F7093C8
#define CODEC_INCLUDED_72C9B4E1_0D3A_4F65_8B2E_D15A6F7093C8


#include <codec/stddef.hpp>
#include <codec/type_traits.hpp>


// All architectures currently supported by Windows are little-endian.
#if defined(_WIN32)
# define CODEC_LITTLE_ENDIAN 1

#elif defined(__BYTE_ORDER__)

# if (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
#  define CODEC_LITTLE_ENDIAN 1
# elif (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
#  define CODEC_BIG_ENDIAN 1
# endif

#elif defined(__linux__) || defined(__GLIBC__)

# include <endian.h>
# if (__BYTE_ORDER == __LITTLE_ENDIAN)
#  define CODEC_LITTLE_ENDIAN 1
# elif (__BYTE_ORDER == __BIG_ENDIAN)
#  define CODEC_BIG_ENDIAN 1
# endif

#elif defined(__ARMEL__) || defined(__AARCH64EL__) \
   || defined(__i386__)  || defined(__x86_64__)
# define CODEC_LITTLE_ENDIAN 1
#elif defined(__ARMEB__) || defined(__AARCH64EB__) \
   || defined(__s390x__) || defined(__s390__)
# define CODEC_BIG_ENDIAN 1
#endif


#ifndef CODEC_BIG_ENDIAN
#define CODEC_BIG_ENDIAN 0
#endif
#ifndef CODEC_LITTLE_ENDIAN
#define CODEC_LITTLE_ENDIAN 0
#endif

#if (!CODEC_BIG_ENDIAN && !CODEC_LITTLE_ENDIAN)
# error "unrecognized and/or unsupported byte order"
#elif (CODEC_BIG_ENDIAN && CODEC_LITTLE_ENDIAN)
# error "internal error in endianness auto detection"
#endif


namespace codec {

enum class endian {
    little = CODEC_LITTLE_ENDIAN,
    big    = CODEC_BIG_ENDIAN,
    host   = 1,
};

constexpr auto BE = endian::big;


namespace aux {

CODEC_INLINE constexpr uint64 byte_swap_(uint64 const x) noexcept
{
#if __has_builtin(__builtin_bswap64) || CODEC_GCC_PREREQ(4, 3)
    return __builtin_bswap64(x);
#else
    return ((x & 0xff00000000000000) >> 56)
         | ((x & 0x00ff000000000000) >> 40)
         | ((x & 0x0000ff0000000000) >> 24)
         | ((x & 0x000000ff00000000) >>  8)
         | ((x & 0x00000000ff000000) <<  8)
         | ((x & 0x0000000000ff0000) << 24)
         | ((x & 0x000000000000ff00) << 40)
         | ((x & 0x00000000000000ff) << 56);
#endif
}


template<endian E>
struct to_host_
{
    template<typename T>
    CODEC_INLINE constexpr T operator()(T const t) const noexcept
    { return aux::byte_swap_(t); }
};

template<>
struct to_host_<endian::host>
{
    template<typename T>
    CODEC_INLINE constexpr T operator()(T const t) const noexcept
    { return t; }
};

}     // namespace aux


// Converts an unsigned 64-bit word stored in byte order E to host
// byte order (and back; the conversion is its own inverse).
template<endian E>
constexpr aux::to_host_<E> to_host{};

}     // namespace codec


#endif  // CODEC_INCLUDED_72C9B4E1_0D3A_4F65_8B2E_D15A6F7093C8
