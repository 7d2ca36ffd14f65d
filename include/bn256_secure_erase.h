#ifndef BN256_SECURE_ERASE_H
#define BN256_SECURE_ERASE_H

#include <cstddef>

/**
 * Zero a buffer in a way the compiler is not allowed to elide.
 * Used on the temporaries of inversion and exponentiation chains.
 */
void bn256_secure_erase(void *pointer, size_t length);

#endif // BN256_SECURE_ERASE_H
