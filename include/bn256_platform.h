#ifndef BN256_PLATFORM_H
#define BN256_PLATFORM_H

#if defined(__x86_64__) || defined(_M_X64)
#define BN256_PLATFORM_X64 1
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
#define BN256_PLATFORM_ARM64 1
#endif

#if BN256_PLATFORM_X64 || BN256_PLATFORM_ARM64 || (defined(__SIZEOF_POINTER__) && __SIZEOF_POINTER__ == 8)
#define BN256_PLATFORM_64BIT 1
#endif

#if defined(__SIZEOF_INT128__)
#define BN256_HAVE_INT128 1
typedef unsigned __int128 bn256_uint128;
#elif defined(_M_X64)
#define BN256_HAVE_UMUL128 1
#include <intrin.h>
#endif

#if defined(_MSC_VER)
#define BN256_FORCE_INLINE __forceinline
#else
#define BN256_FORCE_INLINE inline __attribute__((always_inline))
#endif

#endif // BN256_PLATFORM_H
