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

#include "amplitude_store.hpp"

namespace Qshard {

/**
 * Joint computational basis measurement over a whole amplitude arena.
 *
 * Outcomes are indexed with the first listed bit as the most significant bit: outcome o assigns bits[j] the value of
 * bit (m - 1 - j) of o, for m measured bits.
 */
template <typename FP> class ShardMeasurement {
public:
    /// Probability of each of the 2^m joint outcomes, without collapse
    static std::vector<real1_f> ProbMarginal(AmplitudeStore<FP>& store, const std::vector<bitLenInt>& bits);

    /**
     * Project onto "outcome" and renormalize. Returns the probability mass retained before renormalization.
     * Throws DegenerateMeasurement if that mass is (numerically) zero.
     */
    static real1_f ForceM(AmplitudeStore<FP>& store, const std::vector<bitLenInt>& bits, bitCapIntOcl outcome);

    /**
     * Sample an outcome from "rand" with the Born rule, then collapse onto it. Returns one bit per measured bit, in
     * the order of "bits."
     */
    static std::vector<bool> M(AmplitudeStore<FP>& store, const std::vector<bitLenInt>& bits, qshard_rand_gen& rand);

    static bitCapIntOcl OutcomeToMask(const std::vector<bitLenInt>& bits, bitCapIntOcl outcome);
};

} // namespace Qshard
