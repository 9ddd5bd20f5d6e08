////////////////////////////////////////////////////////////////////////////////
//
// codec/aux/features.hpp
//
////////////////////////////////////////////////////////////////////////////////


#ifndef CODEC_INCLUDED_5B0E2C71_3A94_4D6F_9E18_C47A2D93F0B6
#define CODEC_INCLUDED_5B0E2C71_3A94_4D6F_9E18_C47A2D93F0B6


#if defined(_MSC_VER)
# ifndef _USE_ATTRIBUTES_FOR_SAL
# define _USE_ATTRIBUTES_FOR_SAL 1
# endif
# include <sal.h>
#endif


////////////////////////////////////////////////////////////////////////////////
// Preprocessor utilities.
////////////////////////////////////////////////////////////////////////////////

#define CODEC_PP_CAT_AUX(a, b) a ## b
#define CODEC_PP_CAT(a, b) CODEC_PP_CAT_AUX(a, b)
#define CODEC_PP_ANON(tag) CODEC_PP_CAT(tag, __LINE__)


////////////////////////////////////////////////////////////////////////////////
// Feature detection.
////////////////////////////////////////////////////////////////////////////////

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif
#ifndef __has_builtin
#define __has_builtin(x) 0
#endif
#ifndef __has_warning
#define __has_warning(x) 0
#endif

#if defined(__GNUC__) && defined(__GNUC_MINOR__)
# define CODEC_GCC_PREREQ(major, minor) \
    ((__GNUC__ << 16) + __GNUC_MINOR__ >= ((major) << 16) + (minor))
#else
# define CODEC_GCC_PREREQ(major, minor) false
#endif


////////////////////////////////////////////////////////////////////////////////
// Debug.
////////////////////////////////////////////////////////////////////////////////

// Precondition checks on the unchecked fast paths. Release builds compile
// them away entirely.
#if defined(CODEC_DEBUG)
# include <cassert>
# define CODEC_ASSERT(...) assert(__VA_ARGS__)
#else
# define CODEC_ASSERT(...)
#endif


////////////////////////////////////////////////////////////////////////////////
// Optimization hints.
////////////////////////////////////////////////////////////////////////////////

#if __has_builtin(__builtin_assume)
# define CODEC_ASSUME(...) __builtin_assume(__VA_ARGS__)
#elif defined(_MSC_VER)
# define CODEC_ASSUME(...) __assume(__VA_ARGS__)
#else
# define CODEC_ASSUME(...)
#endif

#if __has_builtin(__builtin_unreachable) || CODEC_GCC_PREREQ(4, 5)
# define CODEC_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
# define CODEC_UNREACHABLE() __assume(false)
#else
# define CODEC_UNREACHABLE()
#endif

#if __has_builtin(__builtin_expect) || CODEC_GCC_PREREQ(4, 0)
# define CODEC_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), false)
#else
# define CODEC_UNLIKELY(...) !!(__VA_ARGS__)
#endif


////////////////////////////////////////////////////////////////////////////////
// Attributes.
////////////////////////////////////////////////////////////////////////////////

#if defined(CODEC_STATIC)
# define CODEC_EXPORT
#elif defined(_WIN32)
# if defined(CODEC_CORE_BUILD)
#  define CODEC_EXPORT __declspec(dllexport)
# else
#  define CODEC_EXPORT __declspec(dllimport)
# endif
#elif __has_attribute(visibility) || CODEC_GCC_PREREQ(4, 0)
# define CODEC_EXPORT __attribute__((visibility("default")))
#else
# define CODEC_EXPORT
#endif

#if __has_attribute(always_inline) || CODEC_GCC_PREREQ(3, 1)
# define CODEC_INLINE __attribute__((always_inline)) inline
#elif defined(_MSC_VER)
# define CODEC_INLINE __forceinline
#else
# define CODEC_INLINE inline
#endif

#if __has_attribute(format) || CODEC_GCC_PREREQ(4, 4)
# define CODEC_PRINTF_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#else
# define CODEC_PRINTF_FORMAT(...)
#endif

#if defined(_MSC_VER)
# define CODEC_PRINTF_FORMAT_STRING _Printf_format_string
#else
# define CODEC_PRINTF_FORMAT_STRING
#endif

#if __has_attribute(pure) || CODEC_GCC_PREREQ(3, 0)
# define CODEC_READONLY __attribute__((pure))
#else
# define CODEC_READONLY
#endif


#endif  // CODEC_INCLUDED_5B0E2C71_3A94_4D6F_9E18_C47A2D93F0B6
