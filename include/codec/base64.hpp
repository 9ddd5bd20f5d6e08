////////////////////////////////////////////////////////////////////////////////
//
// codec/base64.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_36D54937_85B9_4B1F_B2EE_45737A51065E
#define CODEC_INCLUDED_36D54937_85B9_4B1F_B2EE_45737A51065E


#include <codec/io/buffer.hpp>
#include <codec/stddef.hpp>
#include <codec/type_traits.hpp>

#include <cstddef>
#include <limits>


namespace codec {
namespace base64 {

// Longest input whose encoded size is representable in std::size_t.
constexpr std::size_t max_input_size =
    (std::numeric_limits<std::size_t>::max() / 4) * 3;

constexpr std::size_t encoded_size(std::size_t const n) noexcept
{ return ((n + 2) / 3) * 4; }


// Encodes `len` bytes at `src` into the `encoded_size(len)` bytes at `dst`
// and returns that size. Nothing is validated outside of CODEC_DEBUG builds.
CODEC_EXPORT std::size_t encode(void const* src, std::size_t len,
                                void* dst) noexcept;

// Encodes the window [offset, offset + length) of the `src_size` bytes at
// `src` into the `dst_size` bytes at `dst`, returning the number of bytes
// written. Throws before writing anything if the window does not fit the
// input or the output is smaller than encoded_size(length). The encoding
// always starts at `dst`; bytes past encoded_size(length) are left alone.
CODEC_EXPORT std::size_t encode_into(void const* src, std::size_t src_size,
                                     std::size_t offset, std::size_t length,
                                     void* dst, std::size_t dst_size);

CODEC_EXPORT io::buffer encode(void const* src, std::size_t src_size,
                               std::size_t offset, std::size_t length);

inline io::buffer encode(void const* const src, std::size_t const len)
{
    return base64::encode(src, len, 0, len);
}


template<typename In, typename Out>
inline auto encode_into(In const& in, std::size_t const offset,
                        std::size_t const length, Out& out) ->
    enable_if_t<is_byte_sequence_v<In> && is_mutable_byte_sequence_v<Out>,
                Out&>
{
    base64::encode_into(in.data(), in.size(), offset, length,
                        out.data(), out.size());
    return out;
}

template<typename In>
inline auto encode(In const& in, std::size_t const offset,
                   std::size_t const length) ->
    enable_if_t<is_byte_sequence_v<In>, io::buffer>
{
    return base64::encode(in.data(), in.size(), offset, length);
}

template<typename In>
inline auto encode(In const& in, std::size_t const offset = 0) ->
    enable_if_t<is_byte_sequence_v<In>, io::buffer>
{
    auto const n = in.size();
    return base64::encode(in.data(), n, offset, (offset < n) ? n - offset : 0);
}

}}    // namespace codec::base64


#endif  // CODEC_INCLUDED_36D54937_85B9_4B1F_B2EE_45737A51065E
