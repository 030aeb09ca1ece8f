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

#include "measurement.hpp"
#include "qshard_engine.hpp"
#include "worker_pool.hpp"

namespace Qshard {

/**
 * Sharded engine over an arena of FP precision amplitudes. Bits [0, L) of an amplitude index are local to a shard,
 * and bits [L, n) select the shard, for L = n - log2(shard count).
 */
template <typename FP> class QShardEngineCPU : public QShardEngine {
protected:
    QExecutionMode execMode;
    std::unique_ptr<AmplitudeStore<FP>> store;
    WorkerPoolPtr workers;
    ParallelFor shardPar;
    bool isPoisoned;

    void CheckPoisoned(const char* method);

    /**
     * Swap halves with the partner shard across shard-selecting dimension "dim". Afterwards, local bit "swapBit"
     * stands in for the shard-selecting bit (and vice versa). The exchange is its own inverse.
     */
    void ExchangeHalves(const StateShard<FP>& shard, bitLenInt dim, bitLenInt swapBit, ShardRendezvous& rendezvous);

    void ApplyInShard(const StateShard<FP>& shard, const QBoundOp& op, ShardRendezvous& rendezvous);

public:
    QShardEngineCPU(bitLenInt qBitCount, bitCapIntOcl shardCount = 1U, QExecutionMode mode = QEXEC_THREAD,
        bool isVerbose = false);

    bitLenInt GetQubitCount() { return store->GetQubitCount(); }
    bitCapIntOcl GetShardCount() { return store->GetShardCount(); }
    QPrecision GetPrecision() { return (sizeof(FP) == sizeof(float)) ? QPRECISION_SINGLE : QPRECISION_DOUBLE; }
    QExecutionMode GetExecutionMode() { return execMode; }

    void SetPermutation(bitCapIntOcl perm);
    void SetQuantumState(const std::vector<complex>& state);
    std::vector<complex> GetQuantumState();
    real1_f GetNorm();

    void ApplyMoment(const std::vector<QBoundOp>& ops);

    std::vector<real1_f> ProbMarginal(const std::vector<bitLenInt>& bits);
    std::vector<bool> M(const std::vector<bitLenInt>& bits, qshard_rand_gen& rand);
    real1_f ForceM(const std::vector<bitLenInt>& bits, const std::vector<bool>& values);

    bool IsPoisoned() { return isPoisoned; }
};

} // namespace Qshard
