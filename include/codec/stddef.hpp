////////////////////////////////////////////////////////////////////////////////
//
// codec/stddef.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_9D27F4A0_61C3_4B8E_A5D2_0E83B7C14F69
#define CODEC_INCLUDED_9D27F4A0_61C3_4B8E_A5D2_0E83B7C14F69


#include <codec/aux/features.hpp>

#include <cstdint>


namespace codec {

using schar   =   signed char;
using uchar   = unsigned char;

using uint8   = ::std::uint8_t;
using uint32  = ::std::uint32_t;
using uint64  = ::std::uint64_t;


// Tag selecting constructors and resizes that leave new storage unwritten.
constexpr struct uninitialized_t {} uninitialized{};


inline namespace literals {

CODEC_INLINE constexpr auto operator"" _sz(unsigned long long const x) noexcept
{
    return static_cast<decltype(sizeof(x))>(x);
}

}}    // inline namespace codec::literals


#endif  // CODEC_INCLUDED_9D27F4A0_61C3_4B8E_A5D2_0E83B7C14F69
