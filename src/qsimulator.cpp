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

#include "qsimulator.hpp"

namespace Qshard {

std::vector<TrialResult> QSimulator::Run(
    const QCircuit& circuit, const ParamResolver& resolver, size_t repetitions, const QubitOrder& order)
{
    return RunSweep(circuit, std::vector<ParamResolver>(1U, resolver), repetitions, order);
}

std::vector<TrialResult> QSimulator::RunSweep(
    const QCircuit& circuit, const std::vector<ParamResolver>& resolvers, size_t repetitions, const QubitOrder& order)
{
    SweepRunner runner(config);
    return runner.Run(circuit, resolvers, repetitions, order);
}

TrialResult QSimulator::Simulate(
    const QCircuit& circuit, const ParamResolver& resolver, const QubitOrder& order, const QInitialState& initialState)
{
    SweepRunner runner(config);
    return runner.Run(circuit, std::vector<ParamResolver>(1U, resolver), 1U, order, initialState, true).front();
}

MomentStepperPtr QSimulator::SimulateMoments(
    const QCircuit& circuit, const ParamResolver& resolver, const QubitOrder& order, const QInitialState& initialState)
{
    SweepRunner runner(config);
    qshard_rand_gen_ptr rand = std::make_shared<qshard_rand_gen>(SweepRunner::DeriveSeed(runner.GetBaseSeed(), 0U, 0U));

    return MomentStepperPtr(new MomentStepper(circuit.Resolve(resolver), order, config, rand, initialState));
}

} // namespace Qshard
