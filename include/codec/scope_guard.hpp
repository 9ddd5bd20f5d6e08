////////////////////////////////////////////////////////////////////////////////
//
// codec/scope_guard.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_A06D3F9B_1C52_47E8_B3A7_9E4D28C1F570
#define CODEC_INCLUDED_A06D3F9B_1C52_47E8_B3A7_9E4D28C1F570


#include <codec/stddef.hpp>
#include <codec/type_traits.hpp>

#include <utility>


namespace codec {

template<typename F>
class scope_guard
{
public:
    static_assert(is_nothrow_destructible_v<F>, "");
    static_assert(is_nothrow_move_constructible_v<F>, "");

    scope_guard(scope_guard const&) = delete;
    scope_guard& operator=(scope_guard&&) = delete;
    scope_guard& operator=(scope_guard const&) = delete;

    explicit scope_guard(F&& f)
    noexcept(is_nothrow_move_constructible_v<F>) :
        func_(std::move(f))
    {}

    scope_guard(scope_guard&& x) noexcept :
        func_(std::move(x.func_)),
        dismissed_(std::exchange(x.dismissed_, true))
    {}

    ~scope_guard()
    {
        if (!dismissed_) {
            func_();
        }
    }

private:
    F func_;
    bool dismissed_{false};
};


namespace aux {

enum class scope_exit {};

template<typename F>
CODEC_INLINE auto operator+(aux::scope_exit, F&& f) noexcept
{ return scope_guard<decay_t<F>>(std::forward<F>(f)); }

}}    // namespace codec::aux


#define CODEC_SCOPE_EXIT                                                    \
    [[maybe_unused]] auto const& CODEC_PP_ANON(codec_scope_exit_) =         \
        ::codec::aux::scope_exit() + [&]() noexcept


#endif  // CODEC_INCLUDED_A06D3F9B_1C52_47E8_B3A7_9E4D28C1F570
