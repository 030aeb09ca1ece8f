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

#define _USE_MATH_DEFINES

#include "config.h"

#include <complex>
#include <functional>
#include <math.h>
#include <memory>
#include <random>
#include <stdint.h>

#define bitLenInt uint8_t

#if UINTPOW < 4
#define bitCapIntOcl uint8_t
#elif UINTPOW < 5
#define bitCapIntOcl uint16_t
#elif UINTPOW < 6
#define bitCapIntOcl uint32_t
#else
#define bitCapIntOcl uint64_t
#endif

#define bitsInByte 8U
#define qshard_rand_gen std::mt19937_64
#define qshard_rand_gen_ptr std::shared_ptr<qshard_rand_gen>
#define QSHARD_ALIGN_SIZE 64U

#define ZERO_R1_F 0.0
#define ONE_R1_F 1.0
#define HALF_R1_F 0.5
#define PI_R1 M_PI
#define SQRT1_2_R1 M_SQRT1_2
// Retained probability below which a measurement branch cannot be renormalized
#define QSHARD_DEGENERATE_EPSILON 1e-12
#define FP_NORM_EPSILON 1e-12

#define IS_NORM_0(c) (norm(c) <= FP_NORM_EPSILON)

namespace Qshard {

/**
 * Public-facing real and complex types. Gate matrices and state vectors exchanged with the caller are always double
 * precision. The amplitude arena itself is held at the precision chosen at run time.
 */
typedef double real1_f;
typedef std::complex<real1_f> complex;

#define ONE_CMPLX complex(ONE_R1_F, ZERO_R1_F)
#define ZERO_CMPLX complex(ZERO_R1_F, ZERO_R1_F)
#define I_CMPLX complex(ZERO_R1_F, ONE_R1_F)

/**
 * Floating point width of the amplitude arena
 */
enum QPrecision {
    /// 32-bit float amplitudes
    QPRECISION_SINGLE = 5,
    /// 64-bit double amplitudes
    QPRECISION_DOUBLE = 6
};

/**
 * How shard workers are realized
 */
enum QExecutionMode {
    /// One dispatch queue thread per shard, sharing the process address space
    QEXEC_THREAD = 0,
    /// One forked child process per shard per moment, over a shared memory arena
    QEXEC_PROCESS = 1
};

// Called once per value between begin and end.
typedef std::function<void(const bitCapIntOcl&, const unsigned& cpu)> ParallelFunc;
typedef std::function<bitCapIntOcl(const bitCapIntOcl&)> IncrementFunc;
typedef std::function<void(void)> DispatchFn;

} // namespace Qshard
