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

#include "common/shard_rendezvous.hpp"

#if ENABLE_PROCESS_SHARDS
#include <errno.h>
#include <string.h>
#include <string>
#include <sys/mman.h>
#endif

namespace Qshard {

ThreadRendezvous::ThreadRendezvous(bitCapIntOcl shards)
    : ShardRendezvous(shards)
    , gates((size_t)shardPow * (size_t)shards)
    , isAborted(false)
{
    Reset();
}

void ThreadRendezvous::Arrive(const bitCapIntOcl& shard, const bitLenInt& dim)
{
    if (dim >= shardPow) {
        throw std::invalid_argument("ThreadRendezvous::Arrive() dimension is not shard-selecting!");
    }

    std::unique_lock<std::mutex> lock(lock_);

    if (isAborted) {
        throw ShardCancelled();
    }

    PairGate& gate = gates[SlotIndex(shard, dim)];
    const uint64_t generation = gate.generation;

    if (++gate.arrived == 2U) {
        gate.arrived = 0U;
        ++gate.generation;
        lock.unlock();
        cv_.notify_all();
        return;
    }

    cv_.wait(lock, [this, &gate, generation] { return isAborted || (gate.generation != generation); });

    if (gate.generation == generation) {
        throw ShardCancelled();
    }
}

void ThreadRendezvous::Abort()
{
    std::unique_lock<std::mutex> lock(lock_);
    isAborted = true;
    lock.unlock();
    cv_.notify_all();
}

void ThreadRendezvous::Reset()
{
    std::lock_guard<std::mutex> lock(lock_);
    isAborted = false;
    for (size_t i = 0U; i < gates.size(); ++i) {
        gates[i].arrived = 0U;
        gates[i].generation = 0U;
    }
}

#if ENABLE_PROCESS_SHARDS
ProcessRendezvous::ProcessRendezvous(bitCapIntOcl shards)
    : ShardRendezvous(shards)
    , barriers(NULL)
    , slotCount((size_t)shardPow * (size_t)shards)
    , isPoisoned(false)
{
    if (!slotCount) {
        return;
    }

    void* region = mmap(NULL, sizeof(pthread_barrier_t) * slotCount, PROT_READ | PROT_WRITE,
        MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (region == MAP_FAILED) {
        throw std::runtime_error(
            std::string("ProcessRendezvous could not map shared barrier memory: ") + strerror(errno));
    }
    barriers = (pthread_barrier_t*)region;

    pthread_barrierattr_t attr;
    pthread_barrierattr_init(&attr);
    pthread_barrierattr_setpshared(&attr, PTHREAD_PROCESS_SHARED);
    for (size_t i = 0U; i < slotCount; ++i) {
        const int err = pthread_barrier_init(barriers + i, &attr, 2U);
        if (err) {
            pthread_barrierattr_destroy(&attr);
            munmap(region, sizeof(pthread_barrier_t) * slotCount);
            barriers = NULL;
            throw std::runtime_error(std::string("ProcessRendezvous could not initialize barrier: ") + strerror(err));
        }
    }
    pthread_barrierattr_destroy(&attr);
}

ProcessRendezvous::~ProcessRendezvous()
{
    if (!barriers) {
        return;
    }

    // A barrier with a waiter that was killed mid-wait cannot be destroyed safely, only unmapped.
    if (!isPoisoned) {
        for (size_t i = 0U; i < slotCount; ++i) {
            pthread_barrier_destroy(barriers + i);
        }
    }
    munmap(barriers, sizeof(pthread_barrier_t) * slotCount);
}

void ProcessRendezvous::Arrive(const bitCapIntOcl& shard, const bitLenInt& dim)
{
    if (dim >= shardPow) {
        throw std::invalid_argument("ProcessRendezvous::Arrive() dimension is not shard-selecting!");
    }

    const int result = pthread_barrier_wait(barriers + SlotIndex(shard, dim));
    if ((result != 0) && (result != PTHREAD_BARRIER_SERIAL_THREAD)) {
        throw std::runtime_error(std::string("ProcessRendezvous barrier wait failed: ") + strerror(result));
    }
}
#endif

} // namespace Qshard
