////////////////////////////////////////////////////////////////////////////////
//
// codec/error.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_4F8C2E15_B7A3_4D09_9C61_2A5E0F83D7B4
#define CODEC_INCLUDED_4F8C2E15_B7A3_4D09_9C61_2A5E0F83D7B4


#include <codec/stddef.hpp>

#include <cstddef>


namespace codec {

enum class errc : uint32 {
    out_of_bounds          = 0x8000000b,
    invalid_pointer        = 0x80004003,
    invalid_argument       = 0x80070057,
    arithmetic_overflow    = 0x80070216,
};


// Canonical text for an error code; the prefix of every raised message.
CODEC_EXPORT char const* error_message(errc) noexcept;

[[noreturn]] CODEC_EXPORT
void raise(errc);
[[noreturn]] CODEC_EXPORT CODEC_PRINTF_FORMAT(2, 3)
void raise(errc, CODEC_PRINTF_FORMAT_STRING char const*, ...);
[[noreturn]] CODEC_EXPORT
void raise_bad_alloc();

}     // namespace codec


#endif  // CODEC_INCLUDED_4F8C2E15_B7A3_4D09_9C61_2A5E0F83D7B4
