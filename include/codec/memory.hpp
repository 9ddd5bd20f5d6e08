////////////////////////////////////////////////////////////////////////////////
//
// codec/memory.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_C8B15E72_9F40_4A3D_86E1_3D07A29B5FC4
#define CODEC_INCLUDED_C8B15E72_9F40_4A3D_86E1_3D07A29B5FC4


#include <codec/stddef.hpp>
#include <codec/type_traits.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>


namespace codec {
namespace mem {

template<typename T>
CODEC_READONLY
CODEC_INLINE int compare(T const* const p1, T const* const p2,
                         std::size_t const n) noexcept
{
    static_assert(is_trivially_copyable_v<T>, "");
    return (n != 0) ? std::memcmp(p1, p2, n * sizeof(T)) : 0;
}

template<typename T>
CODEC_READONLY
CODEC_INLINE int compare(T const* const p1, std::size_t const n1,
                         T const* const p2, std::size_t const n2) noexcept
{
    auto ret = mem::compare(p1, p2, std::min(n1, n2));
    if (ret == 0) {
        ret = int{n1 > n2} - int{n1 < n2};
    }
    return ret;
}

template<typename T>
CODEC_READONLY
CODEC_INLINE bool equal(T const* const p1, std::size_t const n1,
                        T const* const p2, std::size_t const n2) noexcept
{
    return (n1 == n2) && (mem::compare(p1, p2, n1) == 0);
}

}}    // namespace codec::mem


#endif  // CODEC_INCLUDED_C8B15E72_9F40_4A3D_86E1_3D07A29B5FC4
