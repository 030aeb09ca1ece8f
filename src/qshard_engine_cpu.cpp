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

#include "qshard_engine_cpu.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace Qshard {

bitCapIntOcl ShardCountFor(bitLenInt qubitCount, bitCapIntOcl requestedShards, bitLenInt minQubitsBeforeSharding)
{
    if ((qubitCount < minQubitsBeforeSharding) || (qubitCount < 3U) || (requestedShards <= 1U)) {
        return 1U;
    }

    const bitCapIntOcl shards = pow2Ocl(log2Ocl(requestedShards));
    const bitCapIntOcl maxShards = pow2Ocl(qubitCount - 2U);

    return (shards < maxShards) ? shards : maxShards;
}

template <typename FP>
QShardEngineCPU<FP>::QShardEngineCPU(bitLenInt qBitCount, bitCapIntOcl shardCount, QExecutionMode mode, bool isVerbose)
    : execMode(mode)
    , isPoisoned(false)
{
    if (!isPowerOfTwoOcl(shardCount)) {
        throw std::invalid_argument("QShardEngineCPU shard count must be a power of two!");
    }
    if ((shardCount > 1U) && ((qBitCount < 2U) || (shardCount > pow2Ocl(qBitCount - 2U)))) {
        throw std::invalid_argument("QShardEngineCPU shard count must leave at least 2 local qubits per shard!");
    }

    store = std::unique_ptr<AmplitudeStore<FP>>(
        new AmplitudeStore<FP>(qBitCount, log2Ocl(shardCount), mode == QEXEC_PROCESS));

    if (mode == QEXEC_PROCESS) {
#if ENABLE_PROCESS_SHARDS
        workers = WorkerPoolPtr(new ProcessWorkerPool(shardCount, isVerbose));
        // Forked workers stay single threaded.
        shardPar.SetConcurrencyLevel(1U);
#else
        throw std::invalid_argument("QShardEngineCPU process execution requires ENABLE_PROCESS_SHARDS!");
#endif
    } else {
        workers = WorkerPoolPtr(new ThreadWorkerPool(shardCount, isVerbose));
        shardPar.SetConcurrencyLevel(shardPar.GetConcurrencyLevel() / (unsigned)shardCount);
    }

    if (isVerbose) {
        std::cout << "QShardEngineCPU: " << (int)qBitCount << " qubit(s), " << shardCount << " shard(s), "
                  << ((mode == QEXEC_PROCESS) ? "process" : "thread") << " workers, " << (sizeof(FP) * bitsInByte)
                  << "-bit amplitudes" << std::endl;
    }
}

template <typename FP> void QShardEngineCPU<FP>::CheckPoisoned(const char* method)
{
    if (isPoisoned) {
        throw std::logic_error(std::string("QShardEngineCPU::") + method +
            "() state was abandoned after a worker failure and cannot be used!");
    }
}

template <typename FP> void QShardEngineCPU<FP>::SetPermutation(bitCapIntOcl perm)
{
    CheckPoisoned("SetPermutation");
    store->SetPermutation(perm);
}

template <typename FP> void QShardEngineCPU<FP>::SetQuantumState(const std::vector<complex>& state)
{
    CheckPoisoned("SetQuantumState");
    store->SetQuantumState(state);
}

template <typename FP> std::vector<complex> QShardEngineCPU<FP>::GetQuantumState()
{
    CheckPoisoned("GetQuantumState");
    return store->GetQuantumState();
}

template <typename FP> real1_f QShardEngineCPU<FP>::GetNorm()
{
    CheckPoisoned("GetNorm");
    return store->Norm();
}

template <typename FP>
void QShardEngineCPU<FP>::ExchangeHalves(
    const StateShard<FP>& shard, bitLenInt dim, bitLenInt swapBit, ShardRendezvous& rendezvous)
{
    const bitCapIntOcl dimPower = pow2Ocl(dim);
    const bool isLower = !(shard.shardId & dimPower);
    const StateShard<FP> partner = store->ShardView(shard.shardId ^ dimPower);

    // The lower shard's swapBit=1 half trades places with the upper shard's swapBit=0 half.
    std::complex<FP>* lower = isLower ? shard.amplitudes : partner.amplitudes;
    std::complex<FP>* upper = isLower ? partner.amplitudes : shard.amplitudes;
    const bitCapIntOcl swapPower = pow2Ocl(swapBit);
    const bitCapIntOcl pairCount = shard.length >> 1U;
    const bitCapIntOcl splitAt = pairCount >> 1U;

    // Both partners are done with all prior work on both shards.
    rendezvous.Arrive(shard.shardId, dim);

    shardPar.par_for(isLower ? 0U : splitAt, isLower ? splitAt : pairCount,
        [lower, upper, swapBit, swapPower](const bitCapIntOcl& k, const unsigned& cpu) {
            const bitCapIntOcl i = insertZeroBitOcl(k, swapBit);
            std::swap(lower[i | swapPower], upper[i]);
        });

    // Both halves of the exchange have landed.
    rendezvous.Arrive(shard.shardId, dim);
}

template <typename FP>
void QShardEngineCPU<FP>::ApplyInShard(const StateShard<FP>& shard, const QBoundOp& op, ShardRendezvous& rendezvous)
{
    const std::vector<complex> mtrx = op.gate->GetUnitary();
    const bitLenInt localQubitCount = store->GetLocalQubitCount();

    std::vector<bitLenInt> localBits(op.bits);
    std::vector<std::pair<bitLenInt, bitLenInt>> exchanges;
    int candidate = (int)localQubitCount;
    for (size_t i = 0U; i < op.bits.size(); ++i) {
        if (op.bits[i] < localQubitCount) {
            continue;
        }

        // Highest local bit the operation does not already use
        do {
            --candidate;
        } while ((candidate >= 0) && (std::find(op.bits.begin(), op.bits.end(), (bitLenInt)candidate) != op.bits.end()));
        if (candidate < 0) {
            throw std::logic_error("QShardEngineCPU::ApplyInShard() no free local bit to exchange through!");
        }

        exchanges.push_back(std::make_pair((bitLenInt)(op.bits[i] - localQubitCount), (bitLenInt)candidate));
        localBits[i] = (bitLenInt)candidate;
    }

    for (size_t i = 0U; i < exchanges.size(); ++i) {
        ExchangeHalves(shard, exchanges[i].first, exchanges[i].second, rendezvous);
    }

    GateApplicator::ApplyMatrix<FP>(shardPar, shard, mtrx, localBits);

    for (size_t i = exchanges.size(); i > 0U; --i) {
        ExchangeHalves(shard, exchanges[i - 1U].first, exchanges[i - 1U].second, rendezvous);
    }
}

template <typename FP> void QShardEngineCPU<FP>::ApplyMoment(const std::vector<QBoundOp>& ops)
{
    CheckPoisoned("ApplyMoment");

    const bitLenInt qubitCount = store->GetQubitCount();
    bitCapIntOcl usedMask = 0U;
    for (const QBoundOp& op : ops) {
        if (op.gate->IsMeasurement()) {
            throw std::invalid_argument("QShardEngineCPU::ApplyMoment() measurement is not a unitary operation!");
        }
        if (op.bits.empty() || (op.bits.size() > 2U)) {
            throw std::invalid_argument("QShardEngineCPU::ApplyMoment() operations must act on 1 or 2 qubits!");
        }
        for (const bitLenInt& bit : op.bits) {
            if (bit >= qubitCount) {
                throw std::invalid_argument("QShardEngineCPU::ApplyMoment() bit index out-of-bounds!");
            }
            if (usedMask & pow2Ocl(bit)) {
                throw std::invalid_argument("QShardEngineCPU::ApplyMoment() operations in a moment cannot share bits!");
            }
            usedMask |= pow2Ocl(bit);
        }
    }

    if (ops.empty()) {
        return;
    }

    try {
        workers->Run([this, &ops](const bitCapIntOcl& shardId, ShardRendezvous& rendezvous) {
            const StateShard<FP> shard = store->ShardView(shardId);
            for (const QBoundOp& op : ops) {
                ApplyInShard(shard, op, rendezvous);
            }
        });
    } catch (const WorkerFailure&) {
        isPoisoned = true;
        throw;
    }
}

template <typename FP> std::vector<real1_f> QShardEngineCPU<FP>::ProbMarginal(const std::vector<bitLenInt>& bits)
{
    CheckPoisoned("ProbMarginal");
    return ShardMeasurement<FP>::ProbMarginal(*store, bits);
}

template <typename FP> std::vector<bool> QShardEngineCPU<FP>::M(const std::vector<bitLenInt>& bits, qshard_rand_gen& rand)
{
    CheckPoisoned("M");
    return ShardMeasurement<FP>::M(*store, bits, rand);
}

template <typename FP>
real1_f QShardEngineCPU<FP>::ForceM(const std::vector<bitLenInt>& bits, const std::vector<bool>& values)
{
    CheckPoisoned("ForceM");

    if (bits.size() != values.size()) {
        throw std::invalid_argument("QShardEngineCPU::ForceM() values vector length does not match bit vector length!");
    }

    bitCapIntOcl outcome = 0U;
    for (size_t j = 0U; j < values.size(); ++j) {
        outcome = (outcome << 1U) | (values[j] ? 1U : 0U);
    }

    return ShardMeasurement<FP>::ForceM(*store, bits, outcome);
}

template class QShardEngineCPU<float>;
template class QShardEngineCPU<double>;

} // namespace Qshard
