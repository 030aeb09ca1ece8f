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

#include "moment_stepper.hpp"

namespace Qshard {

struct TrialContext {
    ParamResolver params;
    size_t resolverIndex;
    size_t repetition;

    TrialContext(const ParamResolver& p, size_t r, size_t rep)
        : params(p)
        , resolverIndex(r)
        , repetition(rep)
    {
        // Intentionally left blank.
    }
};

/**
 * Everything one full run of a circuit produced
 */
struct TrialResult {
    TrialContext context;
    QMeasurements measurements;
    std::shared_ptr<std::vector<complex>> finalState;

    TrialResult(const TrialContext& ctx)
        : context(ctx)
        , measurements()
        , finalState()
    {
        // Intentionally left blank.
    }
};

/**
 * Runs a circuit once per (resolver, repetition) pair, resolver-major, each trial on a fresh register and a fresh
 * random source. Results come back in exactly that order. A failing trial aborts the sweep.
 */
class SweepRunner {
protected:
    QSimulatorConfig config;
    uint64_t baseSeed;

public:
    SweepRunner(const QSimulatorConfig& cfg);

    uint64_t GetBaseSeed() { return baseSeed; }

    /**
     * An empty resolver list is treated as a single empty resolver. "keepFinalState" attaches the register at the end
     * of each trial to its result.
     */
    std::vector<TrialResult> Run(const QCircuit& circuit, const std::vector<ParamResolver>& resolvers,
        size_t repetitions, const QubitOrder& order = QubitOrder(), const QInitialState& initialState = QInitialState(),
        bool keepFinalState = false);

    /// Deterministic, well-mixed seed for one trial
    static uint64_t DeriveSeed(uint64_t base, uint64_t resolverIndex, uint64_t repetition);
};

} // namespace Qshard
