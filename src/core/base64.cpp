////////////////////////////////////////////////////////////////////////////////
//
// core/base64.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <codec/base64.hpp>
#include <codec/error.hpp>
#include <codec/io/buffer.hpp>
#include <codec/io/memory.hpp>
#include <codec/stddef.hpp>

#include <array>
#include <cstddef>


namespace codec {
namespace base64 {
namespace {

constexpr std::array<uint8, 64> encode_table {{
    'A','B','C','D','E','F','G','H','I','J','K','L','M',
    'N','O','P','Q','R','S','T','U','V','W','X','Y','Z',
    'a','b','c','d','e','f','g','h','i','j','k','l','m',
    'n','o','p','q','r','s','t','u','v','w','x','y','z',
    '0','1','2','3','4','5','6','7','8','9','+','/',
}};

constexpr uint8 pad = '=';


void check_window_(void const* const src, std::size_t const src_size,
                   std::size_t const offset, std::size_t const length)
{
    if (CODEC_UNLIKELY(src == nullptr && src_size != 0)) {
        raise(errc::invalid_pointer, "null input of %zu bytes", src_size);
    }
    if (CODEC_UNLIKELY(offset > src_size || length > src_size - offset)) {
        raise(errc::out_of_bounds,
              "window at offset %zu of length %zu exceeds input of %zu bytes",
              offset, length, src_size);
    }
    if (CODEC_UNLIKELY(length > max_input_size)) {
        raise(errc::arithmetic_overflow,
              "encoded size of %zu bytes is not representable", length);
    }
}

}     // namespace <unnamed>


std::size_t encode(void const* const src_, std::size_t const len,
                   void* const dst_) noexcept
{
    auto src = static_cast<uint8 const*>(src_);
    auto dst = static_cast<uint8*>(dst_);

    CODEC_ASSERT(len <= max_input_size);
    CODEC_ASSERT((src != nullptr && dst != nullptr) || len == 0);

    auto const tail = len % 3;
    auto const last = src + (len - tail);
    auto const dst_size = encoded_size(len);

    // Two groups per 64-bit load; the load also reads the first two bytes
    // of the following group, so it must stay at least 8 bytes from `last`.
    for (; last - src >= 8; src += 6) {
        auto const v = io::load<uint64,BE>(src);
        *dst++ = encode_table[(v >> 58) & 0x3f];
        *dst++ = encode_table[(v >> 52) & 0x3f];
        *dst++ = encode_table[(v >> 46) & 0x3f];
        *dst++ = encode_table[(v >> 40) & 0x3f];
        *dst++ = encode_table[(v >> 34) & 0x3f];
        *dst++ = encode_table[(v >> 28) & 0x3f];
        *dst++ = encode_table[(v >> 22) & 0x3f];
        *dst++ = encode_table[(v >> 16) & 0x3f];
    }
    for (; src != last; src += 3) {
        auto const v = uint32{src[0]} << 16
                     | uint32{src[1]} <<  8
                     | uint32{src[2]};
        *dst++ = encode_table[(v >> 18) & 0x3f];
        *dst++ = encode_table[(v >> 12) & 0x3f];
        *dst++ = encode_table[(v >>  6) & 0x3f];
        *dst++ = encode_table[(v >>  0) & 0x3f];
    }

    CODEC_ASSERT(dst == static_cast<uint8*>(dst_) + dst_size - (tail ? 4 : 0));
    CODEC_ASSUME(tail <= 2);

    switch (tail) {
    case 0:
        break;
    case 1:
        dst[0] = encode_table[src[0] >> 2];
        dst[1] = encode_table[(src[0] << 4) & 0x30];
        dst[2] = pad;
        dst[3] = pad;
        break;
    case 2:
        dst[0] = encode_table[src[0] >> 2];
        dst[1] = encode_table[((src[0] << 4) & 0x30) | (src[1] >> 4)];
        dst[2] = encode_table[(src[1] << 2) & 0x3c];
        dst[3] = pad;
        break;
    default:
        CODEC_UNREACHABLE();
    }
    return dst_size;
}

std::size_t encode_into(void const* const src, std::size_t const src_size,
                        std::size_t const offset, std::size_t const length,
                        void* const dst, std::size_t const dst_size)
{
    check_window_(src, src_size, offset, length);

    auto const n = encoded_size(length);
    if (CODEC_UNLIKELY(dst_size < n)) {
        raise(errc::out_of_bounds,
              "output of %zu bytes cannot hold %zu encoded bytes",
              dst_size, n);
    }
    if (CODEC_UNLIKELY(dst == nullptr && n != 0)) {
        raise(errc::invalid_pointer, "null output of %zu bytes", dst_size);
    }
    if (n == 0) {
        return 0;
    }
    return base64::encode(static_cast<uint8 const*>(src) + offset, length, dst);
}

io::buffer encode(void const* const src, std::size_t const src_size,
                  std::size_t const offset, std::size_t const length)
{
    check_window_(src, src_size, offset, length);

    io::buffer out{encoded_size(length), uninitialized};
    if (length != 0) {
        base64::encode(static_cast<uint8 const*>(src) + offset, length,
                       out.data());
    }
    return out;
}

}}    // namespace codec::base64
