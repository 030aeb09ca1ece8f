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

#include "qsimulator.hpp"

#include <iomanip>
#include <sstream>
#include <string>

/*
 * Engine settings to run the tests with. Global because catch doesn't
 * support parameterization.
 */
extern enum Qshard::QExecutionMode testExecMode;
extern enum Qshard::QPrecision testPrecision;
extern bitCapIntOcl testShardCount;
extern bool verbose_workers;
extern qshard_rand_gen_ptr rng;

/* Declare the stream-to-state prior to including catch.hpp. */
namespace Qshard {

inline std::ostream& operator<<(std::ostream& os, const std::vector<complex>& state)
{
    os << "[";
    for (size_t i = 0U; i < state.size(); ++i) {
        os << (i ? ", " : "") << std::setprecision(4) << state[i];
    }
    os << "]";

    return os;
}

} // namespace Qshard

#include "catch.hpp"

/*
 * A fixture to create a unique simulator configuration, of the mode and precision under test, for each executing test
 * case.
 */
class QShardTestFixture {
protected:
    Qshard::QSimulatorConfig config;

public:
    QShardTestFixture();

    /// Engine of "qubitCount" qubits, with the configured number of shards
    Qshard::QShardEnginePtr MakeEngine(bitLenInt qubitCount);
};

class StateMatches : public Catch::MatcherBase<std::vector<Qshard::complex>> {
    std::vector<Qshard::complex> expected;
    Qshard::real1_f tolerance;

public:
    StateMatches(const std::vector<Qshard::complex>& e, Qshard::real1_f t)
        : expected(e)
        , tolerance(t)
    {
    }

    virtual bool match(std::vector<Qshard::complex> const& state) const override
    {
        if (state.size() != expected.size()) {
            return false;
        }
        for (size_t i = 0U; i < state.size(); ++i) {
            if (std::norm(state[i] - expected[i]) > tolerance) {
                return false;
            }
        }
        return true;
    }

    virtual std::string describe() const override
    {
        std::ostringstream ss;
        ss << "matches amplitudes ";
        Qshard::operator<<(ss, expected);
        return ss.str();
    }
};

inline StateMatches HasAmplitudes(const std::vector<Qshard::complex>& e, Qshard::real1_f t = 1e-4)
{
    return StateMatches(e, t);
}
