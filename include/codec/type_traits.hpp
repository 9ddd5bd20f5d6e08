////////////////////////////////////////////////////////////////////////////////
//
// codec/type_traits.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_E3A1C85D_2F70_4B96_8D4C_71B05E9A2C38
#define CODEC_INCLUDED_E3A1C85D_2F70_4B96_8D4C_71B05E9A2C38


#include <codec/stddef.hpp>

#include <cstddef>
#include <type_traits>
#include <utility>


namespace codec {

template<bool Cond, typename T = void>
using enable_if_t = typename std::enable_if<Cond, T>::type;
template<typename T>
using remove_cv_t = typename std::remove_cv<T>::type;
template<typename T>
using remove_pointer_t = typename std::remove_pointer<T>::type;
template<typename T>
using decay_t = typename std::decay<T>::type;


namespace aux {

template<typename...>
struct make_void_ { using type = void; };

}     // namespace aux

template<typename... T>
using void_t = typename aux::make_void_<T...>::type;


#define CODEC_VAR_TT_1(X) \
    template<typename T> \
    constexpr bool X##_v = std::X<T>::value

CODEC_VAR_TT_1(is_const);
CODEC_VAR_TT_1(is_trivially_copyable);
CODEC_VAR_TT_1(is_nothrow_move_constructible);
CODEC_VAR_TT_1(is_nothrow_destructible);

#undef CODEC_VAR_TT_1


////////////////////////////////////////////////////////////////////////////////
// Byte sequences
////////////////////////////////////////////////////////////////////////////////

template<typename T> constexpr bool is_byte_v = false;
template<> constexpr bool is_byte_v<char> = true;
template<> constexpr bool is_byte_v<schar> = true;
template<> constexpr bool is_byte_v<uchar> = true;
template<> constexpr bool is_byte_v<std::byte> = true;


namespace aux {

template<typename T>
using data_pointer_t_ = decltype(std::declval<T&>().data());

template<typename T, typename = void>
constexpr bool is_byte_sequence_ = false;

template<typename T>
constexpr bool is_byte_sequence_<
    T, void_t<data_pointer_t_<T>, decltype(std::declval<T&>().size())>
> = std::is_pointer<data_pointer_t_<T>>::value
 && is_byte_v<remove_cv_t<remove_pointer_t<data_pointer_t_<T>>>>;

template<typename T, typename = void>
constexpr bool is_mutable_byte_sequence_ = false;

template<typename T>
constexpr bool is_mutable_byte_sequence_<
    T, enable_if_t<is_byte_sequence_<T>>
> = !is_const_v<remove_pointer_t<data_pointer_t_<T>>>;

}     // namespace aux

// Contiguous containers of byte-sized elements exposing data() and size():
// std::string, std::vector<uint8>, std::array<char, N>, io::buffer, ...
template<typename T>
constexpr bool is_byte_sequence_v = aux::is_byte_sequence_<T const>;

template<typename T>
constexpr bool is_mutable_byte_sequence_v = aux::is_mutable_byte_sequence_<T>;

}     // namespace codec


#endif  // CODEC_INCLUDED_E3A1C85D_2F70_4B96_8D4C_71B05E9A2C38
