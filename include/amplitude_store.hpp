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

#include "common/qshard_errors.hpp"
#include "statevector.hpp"

#include <vector>

namespace Qshard {

/**
 * Exclusive, mutable window onto one shard of the amplitude arena. Index i of the view is global amplitude index
 * (shardId << localQubitCount) | i.
 */
template <typename FP> struct StateShard {
    std::complex<FP>* amplitudes;
    bitCapIntOcl shardId;
    bitLenInt localQubitCount;
    bitCapIntOcl length;

    StateShard(std::complex<FP>* amps, bitCapIntOcl id, bitLenInt localQb)
        : amplitudes(amps)
        , shardId(id)
        , localQubitCount(localQb)
        , length(pow2Ocl(localQb))
    {
        // Intentionally left blank.
    }
};

/**
 * Owns the 2^n amplitudes of a register and their partition into 2^shardPow contiguous shards. The highest shardPow
 * bits of an amplitude index select its shard.
 */
template <typename FP> class AmplitudeStore {
protected:
    bitLenInt qubitCount;
    bitLenInt shardPow;
    bitLenInt localQubitCount;
    bitCapIntOcl maxQPowerOcl;
    StateVectorArrayPtr<FP> stateVec;

public:
    /**
     * Allocate the arena in the |0...0> state. "isShared" requests memory that forked workers write in place.
     */
    AmplitudeStore(bitLenInt qBitCount, bitLenInt shardPower, bool isShared = false);

    bitLenInt GetQubitCount() { return qubitCount; }
    bitLenInt GetShardPower() { return shardPow; }
    bitCapIntOcl GetShardCount() { return pow2Ocl(shardPow); }
    bitLenInt GetLocalQubitCount() { return localQubitCount; }
    bitCapIntOcl GetMaxQPower() { return maxQPowerOcl; }
    StateVectorArrayPtr<FP> GetStateVector() { return stateVec; }

    /// Load the computational basis state "perm"
    void SetPermutation(bitCapIntOcl perm);
    /// Overwrite every amplitude with a caller vector of length 2^n. Normalization is the caller's responsibility.
    void SetQuantumState(const std::vector<complex>& state);
    /// Full copy of the amplitudes, widened to double precision
    std::vector<complex> GetQuantumState();
    StateShard<FP> ShardView(bitCapIntOcl shard);
    /// Sum of squared magnitudes over the whole arena
    real1_f Norm();
};

} // namespace Qshard
