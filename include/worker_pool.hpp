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

#include "common/dispatchqueue.hpp"
#include "common/qshard_errors.hpp"
#include "common/shard_rendezvous.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Qshard {

typedef std::function<void(const bitCapIntOcl& shard, ShardRendezvous& rendezvous)> ShardWorkFn;

/**
 * One worker per shard. Run() is the moment barrier: it returns only after every worker finished its share, and if
 * any worker failed, only after all of the others have been cancelled and joined.
 */
class WorkerPool {
protected:
    bitCapIntOcl workerCount;
    bool isVerbose;

public:
    WorkerPool(bitCapIntOcl workers, bool verbose)
        : workerCount(workers)
        , isVerbose(verbose)
    {
        // Intentionally left blank.
    }
    virtual ~WorkerPool()
    {
        // Intentionally left blank.
    }

    bitCapIntOcl GetWorkerCount() { return workerCount; }

    /**
     * Call "fn" once per shard index, concurrently. Throws WorkerFailure, with the first failing worker's message.
     */
    virtual void Run(ShardWorkFn fn) = 0;
};

typedef std::unique_ptr<WorkerPool> WorkerPoolPtr;

/**
 * Workers are persistent DispatchQueue threads in this process.
 */
class ThreadWorkerPool : public WorkerPool {
protected:
    std::vector<std::unique_ptr<DispatchQueue>> queues;
    ThreadRendezvous rendezvous;

public:
    ThreadWorkerPool(bitCapIntOcl workers, bool verbose = false);

    void Run(ShardWorkFn fn);
};

#if ENABLE_PROCESS_SHARDS
#define QSHARD_FAILURE_MESSAGE_LEN 512U

/**
 * Workers are child processes, forked per Run() over memory the caller allocated as shared. Failure reports travel
 * through a shared mapping, one slot per shard.
 */
class ProcessWorkerPool : public WorkerPool {
protected:
    struct FailureSlot {
        int isFailed;
        char message[QSHARD_FAILURE_MESSAGE_LEN];
    };

    FailureSlot* slots;
    ProcessRendezvous rendezvous;

    void ReportFailure(const bitCapIntOcl& shard, const char* message);

public:
    ProcessWorkerPool(bitCapIntOcl workers, bool verbose = false);
    ~ProcessWorkerPool();

    void Run(ShardWorkFn fn);
};
#endif

} // namespace Qshard
