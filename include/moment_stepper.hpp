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

#include "qcircuit.hpp"
#include "qfactory.hpp"

#include <map>

namespace Qshard {

typedef std::map<std::string, std::vector<bool>> QMeasurements;

/**
 * Initial register state: a computational basis integer (under the active qubit order), or a full amplitude vector
 */
struct QInitialState {
    bool isVector;
    bitCapIntOcl permutation;
    std::vector<complex> amplitudes;

    QInitialState(bitCapIntOcl perm = 0U)
        : isVector(false)
        , permutation(perm)
        , amplitudes()
    {
        // Intentionally left blank.
    }
    QInitialState(const std::vector<complex>& amps)
        : isVector(true)
        , permutation(0U)
        , amplitudes(amps)
    {
        // Intentionally left blank.
    }
};

/**
 * Outcome of one moment: only the measurements taken in that moment, and (optionally) the state after it
 */
struct StepResult {
    size_t momentIndex;
    QMeasurements measurements;
    std::shared_ptr<std::vector<complex>> state;

    StepResult(size_t index)
        : momentIndex(index)
        , measurements()
        , state()
    {
        // Intentionally left blank.
    }
};

enum QStepperStatus { STEPPER_READY = 0, STEPPER_STEPPING, STEPPER_DONE, STEPPER_FAILED };

/**
 * Executes a circuit one moment per Advance() call, on its own engine and random source.
 *
 * READY -> STEPPING -> READY, until the final moment leaves it DONE. Any error while stepping leaves it FAILED.
 * Advancing a DONE or FAILED stepper throws StepperExhausted.
 */
class MomentStepper {
protected:
    QCircuit circuit;
    std::vector<Qubit> qubits;
    QubitBitMap bitMap;
    QSimulatorConfig config;
    QShardEnginePtr engine;
    qshard_rand_gen_ptr rand_generator;
    size_t nextMoment;
    QStepperStatus status;

    void FlushUnitaries(std::vector<QBoundOp>& batch);

public:
    /**
     * "circuit" must already be resolved. The register is sized by the final qubit order, not only by the qubits
     * the circuit uses.
     */
    MomentStepper(const QCircuit& c, const QubitOrder& order, const QSimulatorConfig& cfg, qshard_rand_gen_ptr rgp,
        const QInitialState& initialState = QInitialState());

    StepResult Advance();

    QStepperStatus GetStatus() { return status; }
    bool IsDone() { return status == STEPPER_DONE; }
    /// Index of the moment the next Advance() will run
    size_t GetMomentIndex() { return nextMoment; }
    const std::vector<Qubit>& GetQubits() { return qubits; }
    QShardEnginePtr GetEngine() { return engine; }

    /// Overwrite the register between steps. No check is made against prior execution.
    void SetState(const std::vector<complex>& state);
    void SetState(bitCapIntOcl perm);
    std::vector<complex> GetState();
};

typedef std::unique_ptr<MomentStepper> MomentStepperPtr;

} // namespace Qshard
