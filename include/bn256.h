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

/**
 * @file bn256.h
 * @brief Master include header for the bn256 target-field library.
 *
 * bn256 implements the extension-field tower of the 256-bit Barreto-Naehrig
 * curve with parameter u = 1868033^3:
 *
 * - **F_p (fp_*)**: Montgomery arithmetic modulo the 256-bit prime p.
 * - **F_p^2 (fp2_*)**: F_p[i]/(i^2 + 1).
 * - **F_p^6 (fp6_*)**: F_p^2[t]/(t^3 - xi), xi = i + 3.
 * - **F_p^12 (fp12_*)**: F_p^6[w]/(w^2 - t), the pairing target field, with
 *   Frobenius maps, cyclotomic squaring and the power-to-u chain used by the
 *   hard part of the final exponentiation.
 *
 * The C++ classes in bn256_field.h and bn256_fp12.h wrap the C-style
 * procedures with value semantics.
 *
 * @note Cyclotomic squaring and pow_to_u are only correct on the cyclotomic
 * subgroup. fp12_exp_vartime leaks its exponent through timing.
 */

#ifndef BN256_H
#define BN256_H

/* Platform detection and secure erase */
#include "bn256_platform.h"
#include "bn256_secure_erase.h"
#include "ct_barrier.h"

/* F_p */
#include "fp.h"
#include "fp_frombytes.h"
#include "fp_invert.h"
#include "fp_mul.h"
#include "fp_ops.h"
#include "fp_sq.h"
#include "fp_tobytes.h"
#include "fp_utils.h"

/* F_p^2 */
#include "fp2.h"
#include "fp2_invert.h"
#include "fp2_mul.h"
#include "fp2_ops.h"

/* F_p^6 */
#include "fp6.h"
#include "fp6_frobenius.h"
#include "fp6_invert.h"
#include "fp6_mul.h"
#include "fp6_ops.h"

/* F_p^12 */
#include "bn256_constants.h"
#include "fp12.h"
#include "fp12_exp.h"
#include "fp12_frobenius.h"
#include "fp12_invert.h"
#include "fp12_mul.h"
#include "fp12_ops.h"
#include "fp12_sq.h"
#include "fp12_utils.h"

/* C++ API */
#include "bn256_field.h"
#include "bn256_fp12.h"

#endif /* BN256_H */
