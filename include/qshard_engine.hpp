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

#include "gate_applicator.hpp"

namespace Qshard {

class QShardEngine;
typedef std::shared_ptr<QShardEngine> QShardEnginePtr;

/**
 * Choose the shard count for a register of "qubitCount" qubits: 1 below "minQubitsBeforeSharding," and otherwise
 * "requestedShards" rounded down to a power of two, capped at 2^(n-2) so every shard keeps at least 2 local index
 * bits. A 2-qubit operation on two shard-selecting bits swaps each of them onto its own free local bit, so a shard
 * with fewer than 2 local bits could not run it.
 */
bitCapIntOcl ShardCountFor(bitLenInt qubitCount, bitCapIntOcl requestedShards, bitLenInt minQubitsBeforeSharding);

/**
 * A sharded state vector, and the workers that mutate it a moment at a time
 */
class QShardEngine {
public:
    virtual ~QShardEngine()
    {
        // Intentionally left blank.
    }

    virtual bitLenInt GetQubitCount() = 0;
    virtual bitCapIntOcl GetShardCount() = 0;
    virtual QPrecision GetPrecision() = 0;
    virtual QExecutionMode GetExecutionMode() = 0;

    /// Load computational basis state "perm"; DimensionMismatch if out of range
    virtual void SetPermutation(bitCapIntOcl perm) = 0;
    /// Overwrite all amplitudes; DimensionMismatch on a length other than 2^n
    virtual void SetQuantumState(const std::vector<complex>& state) = 0;
    virtual std::vector<complex> GetQuantumState() = 0;
    virtual real1_f GetNorm() = 0;

    /**
     * Apply a batch of unitary operations on pairwise disjoint bits, each worker on its own shard, with exchanges
     * between partner shards for bits that select shards. Returns when every worker finished. Throws WorkerFailure.
     */
    virtual void ApplyMoment(const std::vector<QBoundOp>& ops) = 0;

    virtual std::vector<real1_f> ProbMarginal(const std::vector<bitLenInt>& bits) = 0;
    /// Sample and collapse; one result per bit of "bits," in order
    virtual std::vector<bool> M(const std::vector<bitLenInt>& bits, qshard_rand_gen& rand) = 0;
    /// Collapse onto "values"; returns the probability mass the outcome had
    virtual real1_f ForceM(const std::vector<bitLenInt>& bits, const std::vector<bool>& values) = 0;

    /// A worker failure leaves the amplitudes partially updated; every further use throws.
    virtual bool IsPoisoned() = 0;
};

} // namespace Qshard
