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

#include "pauli.hpp"
#include "sweep_runner.hpp"

namespace Qshard {

/**
 * Entry points for sampling and for inspecting state
 */
class QSimulator {
protected:
    QSimulatorConfig config;

public:
    QSimulator(const QSimulatorConfig& cfg = QSimulatorConfig::FromEnvironment())
        : config(cfg)
    {
        // Intentionally left blank.
    }

    const QSimulatorConfig& GetConfig() { return config; }

    /// Sample "repetitions" runs of the circuit under one resolver
    std::vector<TrialResult> Run(const QCircuit& circuit, const ParamResolver& resolver = ParamResolver(),
        size_t repetitions = 1U, const QubitOrder& order = QubitOrder());

    /// Sample "repetitions" runs per resolver, resolver-major
    std::vector<TrialResult> RunSweep(const QCircuit& circuit, const std::vector<ParamResolver>& resolvers,
        size_t repetitions = 1U, const QubitOrder& order = QubitOrder());

    /// One run, returning its measurements and final state
    TrialResult Simulate(const QCircuit& circuit, const ParamResolver& resolver = ParamResolver(),
        const QubitOrder& order = QubitOrder(), const QInitialState& initialState = QInitialState());

    /// A stepper, positioned before the first moment, over the resolved circuit
    MomentStepperPtr SimulateMoments(const QCircuit& circuit, const ParamResolver& resolver = ParamResolver(),
        const QubitOrder& order = QubitOrder(), const QInitialState& initialState = QInitialState());
};

} // namespace Qshard
