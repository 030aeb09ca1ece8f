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

// From https://github.com/embeddedartistry/embedded-resources/blob/master/examples/cpp/dispatch.cpp

#pragma once

#include "qshard_types.hpp"

#if !ENABLE_PTHREAD
#error PTHREAD has not been enabled
#endif

#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <queue>

namespace Qshard {

/**
 * A single worker thread, fed in FIFO order. An exception escaping a dispatched function is held, the remainder of
 * the queue is dropped, and the exception is rethrown from the next finish().
 */
class DispatchQueue {
public:
    DispatchQueue()
        : quit_(false)
        , isFinished_(true)
        , isStarted_(false)
        , error_(nullptr)
    {
        // Intentionally left blank.
    }
    ~DispatchQueue();

    // dispatch and copy
    void dispatch(const DispatchFn& op);
    // finish queue, rethrowing any exception raised by a dispatched function
    void finish();
    // dump queue
    void dump();
    // check if queue is finished
    bool isFinished() { return isFinished_; }

    // Deleted operations
    DispatchQueue(const DispatchQueue& rhs) = delete;
    DispatchQueue& operator=(const DispatchQueue& rhs) = delete;
    DispatchQueue(DispatchQueue&& rhs) = delete;
    DispatchQueue& operator=(DispatchQueue&& rhs) = delete;

private:
    std::mutex lock_;
    std::future<void> thread_;
    std::queue<DispatchFn> q_;
    std::condition_variable cv_;
    std::condition_variable cvFinished_;
    bool quit_;
    bool isFinished_;
    bool isStarted_;
    std::exception_ptr error_;

    void dispatch_thread_handler(void);
};

} // namespace Qshard
