//////////////////////////////////////////////////////////////////////////////////////
//
// (C) Daniel Strano and the Qrack contributors 2017-2023. All rights reserved.
//
// This example samples the two qubit circuit sqrt(X), CZ, sqrt(X), and steps through it moment by moment.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

// "qsimulator.hpp" pulls in all headers needed to build and run a "Qshard::QCircuit."
#include "qsimulator.hpp"

#include <iostream> // std::cout

using namespace Qshard;

void PrintState(const std::vector<complex>& state)
{
    for (size_t i = 0U; i < state.size(); ++i) {
        std::cout << "  |" << ((i >> 1U) & 1U) << (i & 1U) << ">: " << state[i] << " (Prob.=" << std::norm(state[i])
                  << ")" << std::endl;
    }
}

int main()
{
    const Qubit a("a");
    const Qubit b("b");
    const QGatePtr sqrtX = std::make_shared<XPowGate>(0.5);

    QCircuit circuit;
    circuit.AppendMoment(QMoment({ QOperation(sqrtX, { a }), QOperation(sqrtX, { b }) }));
    circuit.AppendMoment(QMoment({ QOperation(std::make_shared<CZPowGate>(), { a, b }) }));
    circuit.AppendMoment(QMoment({ QOperation(sqrtX, { a }), QOperation(sqrtX, { b }) }));
    circuit.AppendMoment(QMoment({ QOperation(std::make_shared<MeasurementGate>("a"), { a }),
        QOperation(std::make_shared<MeasurementGate>("b"), { b }) }));

    // Takes shard count, precision, and worker mode from QSHARD_* environment variables, if set.
    QSimulator sim;

    // Every outcome should come up about a quarter of the time.
    const size_t repetitions = 1000U;
    size_t counts[4U] = { 0U, 0U, 0U, 0U };
    const std::vector<TrialResult> results = sim.Run(circuit, ParamResolver(), repetitions);
    for (const TrialResult& trial : results) {
        counts[(trial.measurements.at("a")[0U] ? 2U : 0U) | (trial.measurements.at("b")[0U] ? 1U : 0U)]++;
    }

    std::cout << "Sampled " << repetitions << " repetitions:" << std::endl;
    for (size_t i = 0U; i < 4U; ++i) {
        std::cout << "  ab=" << ((i >> 1U) & 1U) << (i & 1U) << ": " << counts[i] << std::endl;
    }

    // The same circuit, a moment at a time
    MomentStepperPtr stepper = sim.SimulateMoments(circuit);
    while (!stepper->IsDone()) {
        const StepResult step = stepper->Advance();
        std::cout << "After moment " << step.momentIndex << ":" << std::endl;
        for (const auto& m : step.measurements) {
            std::cout << "  measured " << m.first << "=" << m.second[0U] << std::endl;
        }
        if (step.state) {
            PrintState(*(step.state));
        }
    }

    return 0;
}
