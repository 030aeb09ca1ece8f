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

#include "worker_pool.hpp"

#include <iostream>

#if ENABLE_PROCESS_SHARDS
#include <chrono>
#include <errno.h>
#include <signal.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#endif

namespace Qshard {

ThreadWorkerPool::ThreadWorkerPool(bitCapIntOcl workers, bool verbose)
    : WorkerPool(workers, verbose)
    , rendezvous(workers)
{
    queues.reserve(workers);
    for (bitCapIntOcl i = 0U; i < workers; ++i) {
        queues.push_back(std::unique_ptr<DispatchQueue>(new DispatchQueue()));
    }
}

void ThreadWorkerPool::Run(ShardWorkFn fn)
{
    rendezvous.Reset();

    for (bitCapIntOcl shard = 0U; shard < workerCount; ++shard) {
        queues[shard]->dispatch([this, fn, shard] {
            try {
                fn(shard, rendezvous);
            } catch (const ShardCancelled&) {
                throw;
            } catch (...) {
                // Release any partner blocked on this worker, then let the queue hold the error.
                rendezvous.Abort();
                throw;
            }
        });
    }

    bool isFailed = false;
    std::string failure;
    for (bitCapIntOcl shard = 0U; shard < workerCount; ++shard) {
        try {
            queues[shard]->finish();
        } catch (const ShardCancelled&) {
            isFailed = true;
        } catch (const std::exception& e) {
            if (failure.empty()) {
                failure = "shard " + std::to_string(shard) + ": " + e.what();
            }
            isFailed = true;
        } catch (...) {
            if (failure.empty()) {
                failure = "shard " + std::to_string(shard) + ": non-standard exception";
            }
            isFailed = true;
        }
    }

    if (!isFailed) {
        return;
    }

    if (failure.empty()) {
        failure = "shard worker cancelled without a reported cause";
    }
    if (isVerbose) {
        std::cout << "ThreadWorkerPool: worker failure, all " << workerCount << " worker(s) cancelled and joined ("
                  << failure << ")" << std::endl;
    }

    throw WorkerFailure("ThreadWorkerPool::Run() " + failure);
}

#if ENABLE_PROCESS_SHARDS
ProcessWorkerPool::ProcessWorkerPool(bitCapIntOcl workers, bool verbose)
    : WorkerPool(workers, verbose)
    , slots(NULL)
    , rendezvous(workers)
{
    void* region =
        mmap(NULL, sizeof(FailureSlot) * workers, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (region == MAP_FAILED) {
        throw std::runtime_error(std::string("ProcessWorkerPool could not map failure slots: ") + strerror(errno));
    }
    slots = (FailureSlot*)region;
}

ProcessWorkerPool::~ProcessWorkerPool() { munmap(slots, sizeof(FailureSlot) * workerCount); }

void ProcessWorkerPool::ReportFailure(const bitCapIntOcl& shard, const char* message)
{
    slots[shard].isFailed = 1;
    strncpy(slots[shard].message, message, QSHARD_FAILURE_MESSAGE_LEN - 1U);
    slots[shard].message[QSHARD_FAILURE_MESSAGE_LEN - 1U] = '\0';
}

void ProcessWorkerPool::Run(ShardWorkFn fn)
{
    rendezvous.Reset();
    memset(slots, 0, sizeof(FailureSlot) * workerCount);

    // Anything still buffered would otherwise be flushed once per child, too.
    std::cout.flush();

    std::vector<pid_t> pids(workerCount, -1);
    bool isFailed = false;
    std::string failure;

    for (bitCapIntOcl shard = 0U; shard < workerCount; ++shard) {
        const pid_t pid = fork();

        if (pid < 0) {
            isFailed = true;
            failure = std::string("fork() failed: ") + strerror(errno);
            break;
        }

        if (!pid) {
            int exitCode = 0;
            try {
                fn(shard, rendezvous);
            } catch (const std::exception& e) {
                ReportFailure(shard, e.what());
                exitCode = 1;
            } catch (...) {
                ReportFailure(shard, "non-standard exception");
                exitCode = 1;
            }
            _exit(exitCode);
        }

        pids[shard] = pid;
    }

    size_t remaining = 0U;
    for (bitCapIntOcl shard = 0U; shard < workerCount; ++shard) {
        if (pids[shard] > 0) {
            ++remaining;
        }
    }

    if (isFailed) {
        // The pool could not be fully populated, so no partner of a missing worker can ever be released.
        for (bitCapIntOcl shard = 0U; shard < workerCount; ++shard) {
            if (pids[shard] > 0) {
                kill(pids[shard], SIGKILL);
            }
        }
    }

    while (remaining) {
        bool isReaped = false;
        for (bitCapIntOcl shard = 0U; shard < workerCount; ++shard) {
            if (pids[shard] <= 0) {
                continue;
            }

            int status = 0;
            const pid_t result = waitpid(pids[shard], &status, WNOHANG);
            if (!result || ((result < 0) && (errno == EINTR))) {
                continue;
            }

            pids[shard] = -1;
            --remaining;
            isReaped = true;

            const bool isClean = (result > 0) && WIFEXITED(status) && !WEXITSTATUS(status);
            if (isClean || isFailed) {
                continue;
            }

            isFailed = true;
            if (slots[shard].isFailed) {
                failure = "shard " + std::to_string(shard) + ": " + slots[shard].message;
            } else if ((result > 0) && WIFSIGNALED(status)) {
                failure = "shard " + std::to_string(shard) + ": terminated by signal " + std::to_string(WTERMSIG(status));
            } else {
                failure = "shard " + std::to_string(shard) + ": exited abnormally";
            }

            for (bitCapIntOcl other = 0U; other < workerCount; ++other) {
                if (pids[other] > 0) {
                    kill(pids[other], SIGKILL);
                }
            }
        }

        if (remaining && !isReaped) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }

    if (!isFailed) {
        return;
    }

    rendezvous.Abort();
    if (isVerbose) {
        std::cout << "ProcessWorkerPool: worker failure, all " << workerCount << " worker(s) terminated and reaped ("
                  << failure << ")" << std::endl;
    }

    throw WorkerFailure("ProcessWorkerPool::Run() " + failure);
}
#endif

} // namespace Qshard
