//////////////////////////////////////////////////////////////////////////////////////
//
// (C) Daniel Strano and the Qrack contributors 2017-2023. All rights reserved.
//
// This is a multithreaded, sharded state vector simulation of quantum circuits,
// stepped moment by moment, with measurement collapse and parameter sweeps.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#pragma once

#include "qshard_types.hpp"

#include <vector>
#if CPP_STD >= 20
#include <bit>
#endif

namespace Qshard {

inline bitLenInt log2Ocl(bitCapIntOcl n)
{
#if CPP_STD >= 20
    return std::bit_width(n) - 1U;
#elif defined(__GNUC__) || defined(__clang__)
#if UINTPOW < 6
    return (bitLenInt)(bitsInByte * sizeof(unsigned int) - __builtin_clz((unsigned int)n) - 1U);
#else
    return (bitLenInt)(bitsInByte * sizeof(unsigned long long) - __builtin_clzll((unsigned long long)n) - 1U);
#endif
#else
    bitLenInt pow = 0U;
    bitCapIntOcl p = n >> 1U;
    while (p) {
        p >>= 1U;
        ++pow;
    }
    return pow;
#endif
}

inline bitLenInt popCountOcl(bitCapIntOcl n)
{
#if CPP_STD >= 20
    return (bitLenInt)std::popcount(n);
#elif defined(__GNUC__) || defined(__clang__)
    return (bitLenInt)__builtin_popcountll((unsigned long long)n);
#else
    bitLenInt popCount;
    for (popCount = 0U; n; ++popCount) {
        n &= n - 1U;
    }
    return popCount;
#endif
}

inline bitCapIntOcl pow2Ocl(const bitLenInt& p) { return (bitCapIntOcl)1U << p; }
inline bitCapIntOcl pow2MaskOcl(const bitLenInt& p) { return ((bitCapIntOcl)1U << p) - 1U; }
inline bitCapIntOcl bitSliceOcl(const bitLenInt& bit, const bitCapIntOcl& source)
{
    return ((bitCapIntOcl)1U << bit) & source;
}
// Source: https://www.exploringbinary.com/ten-ways-to-check-if-an-integer-is-a-power-of-two-in-c/
inline bool isPowerOfTwoOcl(const bitCapIntOcl& x) { return x && !(x & (x - 1U)); }

/// Insert a 0 bit at position "bit," shifting all higher bits of "i" up by one.
inline bitCapIntOcl insertZeroBitOcl(const bitCapIntOcl& i, const bitLenInt& bit)
{
    const bitCapIntOcl lowMask = pow2MaskOcl(bit);
    return (i & lowMask) | ((i & ~lowMask) << 1U);
}

inline real1_f clampProb(real1_f toClamp)
{
    if (toClamp < ZERO_R1_F) {
        toClamp = ZERO_R1_F;
    }
    if (toClamp > ONE_R1_F) {
        toClamp = ONE_R1_F;
    }
    return toClamp;
}

} // namespace Qshard
