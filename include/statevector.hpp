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

#include "common/parallel_for.hpp"

#include <algorithm>
#include <errno.h>
#include <stdexcept>
#include <stdlib.h>
#include <string.h>
#include <string>

#if ENABLE_PROCESS_SHARDS
#include <sys/mman.h>
#endif

namespace Qshard {

/**
 * Contiguous amplitude buffer at precision FP. The buffer is either private, aligned heap memory, or (for forked
 * shard workers) an anonymous shared mapping that survives fork() with both sides writing the same pages.
 */
template <typename FP> class StateVectorArray : public ParallelFor {
public:
    typedef std::complex<FP> complex_fp;
    typedef std::function<void(complex_fp*)> AmplitudeDeleter;

protected:
    bitCapIntOcl capacity;
    bool isShared;

    std::unique_ptr<complex_fp[], AmplitudeDeleter> Alloc(bitCapIntOcl elemCount)
    {
        // elemCount is always a power of two, but might be smaller than QSHARD_ALIGN_SIZE
        size_t allocSize = sizeof(complex_fp) * elemCount;
        if (allocSize < QSHARD_ALIGN_SIZE) {
            allocSize = QSHARD_ALIGN_SIZE;
        }

        if (isShared) {
#if ENABLE_PROCESS_SHARDS
            void* region = mmap(NULL, allocSize, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
            if (region == MAP_FAILED) {
                throw std::runtime_error(
                    std::string("StateVectorArray::Alloc() shared mapping failed: ") + strerror(errno));
            }
            return std::unique_ptr<complex_fp[], AmplitudeDeleter>(
                (complex_fp*)region, [allocSize](complex_fp* c) { munmap(c, allocSize); });
#else
            throw std::invalid_argument("StateVectorArray::Alloc() shared arenas require ENABLE_PROCESS_SHARDS!");
#endif
        }

        complex_fp* toRet = (complex_fp*)aligned_alloc(QSHARD_ALIGN_SIZE, allocSize);
        if (!toRet) {
            throw std::bad_alloc();
        }

        return std::unique_ptr<complex_fp[], AmplitudeDeleter>(toRet, [](complex_fp* c) { free(c); });
    }

public:
    std::unique_ptr<complex_fp[], AmplitudeDeleter> amplitudes;

    StateVectorArray(bitCapIntOcl cap, bool shared)
        : capacity(cap)
        , isShared(shared)
        , amplitudes(Alloc(cap))
    {
        // Intentionally left blank.
    }

    bitCapIntOcl GetCapacity() { return capacity; }
    bool IsShared() { return isShared; }

    complex_fp read(const bitCapIntOcl& i) { return amplitudes.get()[i]; };

    void write(const bitCapIntOcl& i, const complex_fp& c) { amplitudes.get()[i] = c; };

    void write2(const bitCapIntOcl& i1, const complex_fp& c1, const bitCapIntOcl& i2, const complex_fp& c2)
    {
        amplitudes.get()[i1] = c1;
        amplitudes.get()[i2] = c2;
    };

    void clear()
    {
        complex_fp* amps = amplitudes.get();
        par_for(0, capacity, [amps](const bitCapIntOcl& lcv, const unsigned& cpu) { amps[lcv] = complex_fp(); });
    }

    /// Copy in (and narrow) a full double precision vector
    void copy_in(const complex* copyIn)
    {
        complex_fp* amps = amplitudes.get();
        if (copyIn) {
            par_for(0, capacity, [amps, copyIn](const bitCapIntOcl& lcv, const unsigned& cpu) {
                amps[lcv] = complex_fp((FP)real(copyIn[lcv]), (FP)imag(copyIn[lcv]));
            });
        } else {
            par_for(0, capacity, [amps](const bitCapIntOcl& lcv, const unsigned& cpu) { amps[lcv] = complex_fp(); });
        }
    }

    /// Copy out (and widen) to a full double precision vector
    void copy_out(complex* copyOut)
    {
        const complex_fp* amps = amplitudes.get();
        par_for(0, capacity, [amps, copyOut](const bitCapIntOcl& lcv, const unsigned& cpu) {
            copyOut[lcv] = complex((real1_f)real(amps[lcv]), (real1_f)imag(amps[lcv]));
        });
    }
};

template <typename FP> using StateVectorArrayPtr = std::shared_ptr<StateVectorArray<FP>>;

} // namespace Qshard
