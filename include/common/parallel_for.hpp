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

namespace Qshard {

class ParallelFor {
private:
    const bitCapIntOcl pStride;
    bitLenInt dispatchThreshold;
    unsigned numCores;

public:
    ParallelFor();

    void SetConcurrencyLevel(unsigned num)
    {
        if (!num) {
            num = 1U;
        }
        if (numCores == num) {
            return;
        }
        numCores = num;
        const bitLenInt pStridePow = log2Ocl(pStride);
        const bitLenInt minStridePow = (numCores > 1U) ? (bitLenInt)pow2Ocl(log2Ocl(numCores - 1U)) : 0U;
        dispatchThreshold = (pStridePow > minStridePow) ? (pStridePow - minStridePow) : 0U;
    }
    unsigned GetConcurrencyLevel() { return numCores; }
    bitCapIntOcl GetStride() { return pStride; }
    bitLenInt GetPreferredConcurrencyPower() { return dispatchThreshold; }
    /*
     * Parallelization routines for spreading work across multiple cores.
     */

    /**
     * Iterate through the permutations a maximum of end-begin times, allowing
     * the caller to control the incrementation offset through 'inc'.
     */
    void par_for_inc(const bitCapIntOcl begin, const bitCapIntOcl itemCount, IncrementFunc, ParallelFunc fn);

    /** Call fn once for every numerical value between begin and end. */
    void par_for(const bitCapIntOcl begin, const bitCapIntOcl end, ParallelFunc fn);

    /**
     * Skip over the skipPower bits.
     *
     * For example, if skipPower is 2, it will count:
     *   0000, 0001, 0100, 0101, 1000, 1001, 1100, 1101.
     *     ^     ^     ^     ^     ^     ^     ^     ^ - The second bit is
     *                                                   untouched.
     */
    void par_for_skip(const bitCapIntOcl begin, const bitCapIntOcl end, const bitCapIntOcl skipPower,
        const bitLenInt skipBitCount, ParallelFunc fn);

    /** Skip over the bits listed in maskArray in the same fashion as par_for_skip. */
    void par_for_mask(
        const bitCapIntOcl, const bitCapIntOcl, const std::vector<bitCapIntOcl>& maskArray, ParallelFunc fn);
};

} // namespace Qshard
