// Copyright (c) 2025-2026, Brandon Lehmann
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "bn256_secure_erase.h"

#include <cstring>

#if defined(_MSC_VER)
#include <windows.h>
#define BN256_ERASE_WITH_SECUREZERO 1
#elif defined(__STDC_LIB_EXT1__)
#define BN256_ERASE_WITH_MEMSET_S 1
#elif (defined(__GLIBC__) && (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 25))) || defined(__OpenBSD__) \
    || defined(__FreeBSD__)
#define BN256_ERASE_WITH_EXPLICIT_BZERO 1
#include <strings.h>
#else
/* the volatile function pointer keeps the store from being elided */
static void *(*const volatile bn256_memset)(void *, int, size_t) = std::memset;
#endif

void bn256_secure_erase(void *pointer, size_t length)
{
    if (pointer == nullptr || length == 0)
        return;

#if defined(BN256_ERASE_WITH_SECUREZERO)
    SecureZeroMemory(pointer, length);
#elif defined(BN256_ERASE_WITH_MEMSET_S)
    memset_s(pointer, length, 0, length);
#elif defined(BN256_ERASE_WITH_EXPLICIT_BZERO)
    explicit_bzero(pointer, length);
#else
    bn256_memset(pointer, 0, length);
#endif
}
