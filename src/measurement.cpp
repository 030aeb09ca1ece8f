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

#include "measurement.hpp"

#include <set>
#include <string>

namespace Qshard {

static void CheckMeasurementBits(const std::vector<bitLenInt>& bits, bitLenInt qubitCount)
{
    if (bits.empty()) {
        throw std::invalid_argument("ShardMeasurement requires at least one bit!");
    }
    if (bits.size() > (bitsInByte * sizeof(bitCapIntOcl) - 1U)) {
        throw std::invalid_argument("ShardMeasurement cannot measure this many bits jointly!");
    }

    std::set<bitLenInt> seen;
    for (size_t i = 0U; i < bits.size(); ++i) {
        if (bits[i] >= qubitCount) {
            throw std::invalid_argument("ShardMeasurement bit index out-of-bounds!");
        }
        if (!seen.insert(bits[i]).second) {
            throw std::invalid_argument("ShardMeasurement bits cannot be duplicated!");
        }
    }
}

template <typename FP>
bitCapIntOcl ShardMeasurement<FP>::OutcomeToMask(const std::vector<bitLenInt>& bits, bitCapIntOcl outcome)
{
    const size_t m = bits.size();
    bitCapIntOcl toRet = 0U;
    for (size_t j = 0U; j < m; ++j) {
        if ((outcome >> (m - 1U - j)) & 1U) {
            toRet |= pow2Ocl(bits[j]);
        }
    }

    return toRet;
}

template <typename FP>
std::vector<real1_f> ShardMeasurement<FP>::ProbMarginal(AmplitudeStore<FP>& store, const std::vector<bitLenInt>& bits)
{
    CheckMeasurementBits(bits, store.GetQubitCount());

    StateVectorArrayPtr<FP> stateVec = store.GetStateVector();
    const size_t m = bits.size();
    const bitCapIntOcl outcomeCount = pow2Ocl((bitLenInt)m);
    const unsigned numCores = stateVec->GetConcurrencyLevel();
    std::unique_ptr<real1_f[]> probs(new real1_f[numCores * outcomeCount]());

    std::vector<bitCapIntOcl> qPowers(m);
    for (size_t j = 0U; j < m; ++j) {
        qPowers[j] = pow2Ocl(bits[j]);
    }

    const std::complex<FP>* amps = stateVec->amplitudes.get();
    // The arena is contiguous, so lcv is already (shard << localQubitCount) | local.
    stateVec->par_for(0U, store.GetMaxQPower(), [&](const bitCapIntOcl& lcv, const unsigned& cpu) {
        bitCapIntOcl outcome = 0U;
        for (size_t j = 0U; j < m; ++j) {
            outcome = (outcome << 1U) | ((lcv & qPowers[j]) ? 1U : 0U);
        }
        probs[cpu * outcomeCount + outcome] += (real1_f)norm(amps[lcv]);
    });

    std::vector<real1_f> toRet(outcomeCount, ZERO_R1_F);
    for (unsigned cpu = 0U; cpu < numCores; ++cpu) {
        for (bitCapIntOcl o = 0U; o < outcomeCount; ++o) {
            toRet[o] += probs[cpu * outcomeCount + o];
        }
    }

    return toRet;
}

template <typename FP>
real1_f ShardMeasurement<FP>::ForceM(AmplitudeStore<FP>& store, const std::vector<bitLenInt>& bits, bitCapIntOcl outcome)
{
    const std::vector<real1_f> probs = ProbMarginal(store, bits);
    if (outcome >= probs.size()) {
        throw std::invalid_argument("ShardMeasurement::ForceM() outcome out-of-bounds!");
    }

    const real1_f retained = probs[outcome];
    if (retained < QSHARD_DEGENERATE_EPSILON) {
        throw DegenerateMeasurement("ShardMeasurement::ForceM() outcome " + std::to_string(outcome) +
            " retains no probability mass to renormalize!");
    }

    bitCapIntOcl regMask = 0U;
    for (size_t j = 0U; j < bits.size(); ++j) {
        regMask |= pow2Ocl(bits[j]);
    }
    const bitCapIntOcl result = OutcomeToMask(bits, outcome);
    const FP nrm = (FP)(ONE_R1_F / sqrt(retained));

    StateVectorArrayPtr<FP> stateVec = store.GetStateVector();
    std::complex<FP>* amps = stateVec->amplitudes.get();
    stateVec->par_for(0U, store.GetMaxQPower(), [amps, regMask, result, nrm](const bitCapIntOcl& i, const unsigned& cpu) {
        if ((i & regMask) == result) {
            amps[i] *= nrm;
        } else {
            amps[i] = std::complex<FP>();
        }
    });

    return retained;
}

template <typename FP>
std::vector<bool> ShardMeasurement<FP>::M(AmplitudeStore<FP>& store, const std::vector<bitLenInt>& bits, qshard_rand_gen& rand)
{
    const std::vector<real1_f> probs = ProbMarginal(store, bits);

    real1_f total = ZERO_R1_F;
    for (size_t o = 0U; o < probs.size(); ++o) {
        total += probs[o];
    }
    if (total < QSHARD_DEGENERATE_EPSILON) {
        throw DegenerateMeasurement("ShardMeasurement::M() state has no probability mass to measure!");
    }

    std::uniform_real_distribution<real1_f> rand_distribution(ZERO_R1_F, ONE_R1_F);
    const real1_f draw = rand_distribution(rand) * total;

    // Fall back to the last outcome with nonzero mass, against round-off in the running sum.
    bitCapIntOcl outcome = 0U;
    real1_f cumulative = ZERO_R1_F;
    for (bitCapIntOcl o = 0U; o < probs.size(); ++o) {
        if (probs[o] <= ZERO_R1_F) {
            continue;
        }
        outcome = o;
        cumulative += probs[o];
        if (draw < cumulative) {
            break;
        }
    }

    ForceM(store, bits, outcome);

    const size_t m = bits.size();
    std::vector<bool> toRet(m);
    for (size_t j = 0U; j < m; ++j) {
        toRet[j] = (outcome >> (m - 1U - j)) & 1U;
    }

    return toRet;
}

template class ShardMeasurement<float>;
template class ShardMeasurement<double>;

} // namespace Qshard
