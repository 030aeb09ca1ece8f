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

#include "qshard_functions.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <vector>

#if ENABLE_PROCESS_SHARDS
#include <pthread.h>
#endif

namespace Qshard {

/**
 * Thrown out of a rendezvous wait when the moment has been aborted by a failure in another worker.
 */
class ShardCancelled : public std::runtime_error {
public:
    ShardCancelled()
        : std::runtime_error("Shard worker cancelled at rendezvous")
    {
        // Intentionally left blank.
    }
};

/**
 * Pairwise blocking meeting point for the two shard workers that differ only in one shard-selecting bit.
 *
 * Each (dimension, pair) slot is cyclic: both partners must call Arrive() the same number of times, in the same
 * order, which holds whenever every worker walks the same operation list.
 */
class ShardRendezvous {
protected:
    bitCapIntOcl shardCount;
    bitLenInt shardPow;

    size_t SlotIndex(const bitCapIntOcl& shard, const bitLenInt& dim)
    {
        return (size_t)dim * (size_t)shardCount + (size_t)(shard & ~pow2Ocl(dim));
    }

public:
    ShardRendezvous(bitCapIntOcl shards)
        : shardCount(shards)
        , shardPow(log2Ocl(shards))
    {
        // Intentionally left blank.
    }
    virtual ~ShardRendezvous()
    {
        // Intentionally left blank.
    }

    /// Block until the partner of "shard" across shard-selecting dimension "dim" arrives at the same slot.
    virtual void Arrive(const bitCapIntOcl& shard, const bitLenInt& dim) = 0;
    /// Release every blocked worker with ShardCancelled.
    virtual void Abort() = 0;
    /// Clear the abort state before a new moment.
    virtual void Reset() = 0;
};

class ThreadRendezvous : public ShardRendezvous {
protected:
    struct PairGate {
        unsigned arrived;
        uint64_t generation;
    };

    std::mutex lock_;
    std::condition_variable cv_;
    std::vector<PairGate> gates;
    bool isAborted;

public:
    ThreadRendezvous(bitCapIntOcl shards);

    void Arrive(const bitCapIntOcl& shard, const bitLenInt& dim);
    void Abort();
    void Reset();
};

#if ENABLE_PROCESS_SHARDS
/**
 * Process-shared pthread barriers, one per pair slot, in an anonymous shared mapping that forked workers inherit.
 * A process blocked here is cancelled by its parent with SIGKILL, so Abort() has nothing to release.
 */
class ProcessRendezvous : public ShardRendezvous {
protected:
    pthread_barrier_t* barriers;
    size_t slotCount;
    bool isPoisoned;

public:
    ProcessRendezvous(bitCapIntOcl shards);
    ~ProcessRendezvous();

    void Arrive(const bitCapIntOcl& shard, const bitLenInt& dim);
    void Abort() { isPoisoned = true; }
    void Reset()
    {
        if (isPoisoned) {
            throw std::logic_error("ProcessRendezvous::Reset() barriers were abandoned by a killed worker!");
        }
    }
};
#endif

} // namespace Qshard
