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

#include "sweep_runner.hpp"

namespace Qshard {

// splitmix64 finalizer
static uint64_t MixSeed(uint64_t z)
{
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30U)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27U)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31U);
}

uint64_t SweepRunner::DeriveSeed(uint64_t base, uint64_t resolverIndex, uint64_t repetition)
{
    return MixSeed(MixSeed(MixSeed(base) ^ resolverIndex) ^ repetition);
}

SweepRunner::SweepRunner(const QSimulatorConfig& cfg)
    : config(cfg)
    , baseSeed(cfg.randomSeed)
{
    if (!config.useRandomSeed) {
        std::random_device rd;
        baseSeed = ((uint64_t)rd() << 32U) | (uint64_t)rd();
    }
}

std::vector<TrialResult> SweepRunner::Run(const QCircuit& circuit, const std::vector<ParamResolver>& resolvers,
    size_t repetitions, const QubitOrder& order, const QInitialState& initialState, bool keepFinalState)
{
    const std::vector<ParamResolver> sweep = resolvers.empty() ? std::vector<ParamResolver>(1U) : resolvers;

    // Per-step snapshots are not needed to run to completion.
    QSimulatorConfig trialConfig(config);
    trialConfig.captureStepStates = false;

    std::vector<TrialResult> toRet;
    toRet.reserve(sweep.size() * repetitions);

    for (size_t r = 0U; r < sweep.size(); ++r) {
        if (!repetitions) {
            break;
        }

        const QCircuit resolved = circuit.Resolve(sweep[r]);

        for (size_t rep = 0U; rep < repetitions; ++rep) {
            qshard_rand_gen_ptr rand = std::make_shared<qshard_rand_gen>(DeriveSeed(baseSeed, r, rep));
            MomentStepper stepper(resolved, order, trialConfig, rand, initialState);

            TrialResult result(TrialContext(sweep[r], r, rep));
            while (!stepper.IsDone()) {
                const StepResult step = stepper.Advance();
                result.measurements.insert(step.measurements.begin(), step.measurements.end());
            }

            if (keepFinalState) {
                result.finalState = std::make_shared<std::vector<complex>>(stepper.GetState());
            }

            toRet.push_back(result);
        }
    }

    return toRet;
}

} // namespace Qshard
