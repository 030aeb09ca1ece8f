//////////////////////////////////////////////////////////////////////////////////////
//
// (C) Daniel Strano and the Qrack contributors 2017-2023. All rights reserved.
//
// This example sweeps the exponent of an X gate, and reports how often its qubit measures as 1.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#include "qsimulator.hpp"

#include <iostream> // std::cout

using namespace Qshard;

int main()
{
    const Qubit q("q");
    const Qubit r("r");

    // X**x on "q," then a CNOT copies it to "r" in the computational basis.
    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<XPowGate>(QParam("x")), { q }));
    circuit.AppendOperation(QOperation(std::make_shared<CNotPowGate>(), { q, r }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("qr", 2U), { q, r }));

    QSimulatorConfig config = QSimulatorConfig::FromEnvironment();
    QSimulator sim(config);

    const size_t repetitions = 200U;
    const QSweep sweep = SweepLinspace("x", 0.0, 1.0, 5U);
    const std::vector<TrialResult> results = sim.RunSweep(circuit, sweep, repetitions);

    // Resolver-major: "repetitions" results per sweep point, in sweep order
    for (size_t i = 0U; i < sweep.size(); ++i) {
        size_t ones = 0U;
        size_t agree = 0U;
        for (size_t rep = 0U; rep < repetitions; ++rep) {
            const std::vector<bool>& qr = results[i * repetitions + rep].measurements.at("qr");
            if (qr[0U]) {
                ++ones;
            }
            if (qr[0U] == qr[1U]) {
                ++agree;
            }
        }

        const real1_f x = sweep[i].Lookup("x");
        const real1_f expected = sin(PI_R1 * x / 2) * sin(PI_R1 * x / 2);
        std::cout << "x=" << x << ": P(q=1)~" << ((real1_f)ones / repetitions) << " (exact " << expected
                  << "), q and r agreed " << agree << "/" << repetitions << " times" << std::endl;
    }

    return 0;
}
