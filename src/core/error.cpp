////////////////////////////////////////////////////////////////////////////////
//
// core/error.cpp
//
////////////////////////////////////////////////////////////////////////////////


#include <codec/error.hpp>
#include <codec/scope_guard.hpp>
#include <codec/stddef.hpp>

#include <algorithm>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <new>
#include <stdexcept>
#include <string_view>


namespace codec {

char const* error_message(errc const e) noexcept
{
    switch (e) {
    case errc::out_of_bounds:
        return "attempted to access out-of-bounds data";
    case errc::invalid_pointer:
        return "attempted to dereference an invalid pointer";
    case errc::invalid_argument:
        return "function received invalid argument(s)";
    case errc::arithmetic_overflow:
        return "conversion would cause arithmetic overflow";
    }
    return "unknown error";
}

void raise(errc const e)
{
    throw std::runtime_error{error_message(e)};
}

void raise(errc const e, char const* const format, ...)
{
    va_list ap1;
    va_start(ap1, format);
    CODEC_SCOPE_EXIT { va_end(ap1); };

    va_list ap2;
    va_copy(ap2, ap1);
    CODEC_SCOPE_EXIT { va_end(ap2); };

    auto const ret = std::vsnprintf(nullptr, 0, format, ap1);
    if (ret <= 0) {
        raise((ret < 0) ? errc::invalid_argument : e);
    }

    auto const n = static_cast<std::size_t>(ret);
    auto const msg = std::string_view{error_message(e)};
    auto const buf = std::make_unique<char[]>(msg.size() + 2 + n + 1);

    auto dst = std::copy(msg.begin(), msg.end(), buf.get());
    *dst++ = ':';
    *dst++ = ' ';
    std::vsnprintf(dst, n + 1, format, ap2);
    throw std::runtime_error(buf.get());
}

void raise_bad_alloc()
{
    throw std::bad_alloc();
}

}     // namespace codec
