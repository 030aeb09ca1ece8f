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

#include "moment_stepper.hpp"

namespace Qshard {

MomentStepper::MomentStepper(const QCircuit& c, const QubitOrder& order, const QSimulatorConfig& cfg,
    qshard_rand_gen_ptr rgp, const QInitialState& initialState)
    : circuit(c)
    , config(cfg)
    , rand_generator(rgp)
    , nextMoment(0U)
    , status(STEPPER_READY)
{
    if (!rand_generator) {
        throw std::invalid_argument("MomentStepper requires a random number generator!");
    }

    // Throws on a repeated key.
    circuit.GetMeasurementKeys();

    qubits = order.OrderFor(circuit.GetQubits());
    bitMap = QubitOrder::BitMapFor(qubits);
    engine = CreateShardEngine(config, (bitLenInt)qubits.size());

    if (initialState.isVector) {
        engine->SetQuantumState(initialState.amplitudes);
    } else {
        engine->SetPermutation(initialState.permutation);
    }

    if (!circuit.GetMomentCount()) {
        status = STEPPER_DONE;
    }
}

void MomentStepper::FlushUnitaries(std::vector<QBoundOp>& batch)
{
    if (batch.empty()) {
        return;
    }
    engine->ApplyMoment(batch);
    batch.clear();
}

StepResult MomentStepper::Advance()
{
    if (status == STEPPER_DONE) {
        throw StepperExhausted("MomentStepper::Advance() every moment has already been run!");
    }
    if (status == STEPPER_FAILED) {
        throw StepperExhausted("MomentStepper::Advance() a previous step failed; this stepper cannot continue!");
    }

    status = STEPPER_STEPPING;

    try {
        const QMoment& moment = circuit.GetMoments()[nextMoment];
        moment.Validate();

        StepResult toRet(nextMoment);
        std::vector<QBoundOp> batch;
        bitCapIntOcl usedMask = 0U;
        for (const QOperation& op : moment.operations) {
            const std::vector<QOperation> expanded = GateApplicator::Expand(op, config.maxDecompositionDepth);
            for (const QOperation& sub : expanded) {
                if (sub.gate->IsParameterized()) {
                    throw UnresolvedSymbol(
                        "MomentStepper::Advance() " + sub.gate->GetName() + " still has an unresolved parameter!");
                }

                const QBoundOp bound = GateApplicator::Bind(sub, bitMap);
                if (!sub.gate->IsMeasurement()) {
                    bitCapIntOcl opMask = 0U;
                    for (const bitLenInt& bit : bound.bits) {
                        opMask |= pow2Ocl(bit);
                    }
                    // Steps of one decomposition share bits, and must run in sequence.
                    if (usedMask & opMask) {
                        FlushUnitaries(batch);
                        usedMask = 0U;
                    }
                    batch.push_back(bound);
                    usedMask |= opMask;
                    continue;
                }

                // Everything decomposed ahead of this measurement lands first.
                FlushUnitaries(batch);
                usedMask = 0U;
                toRet.measurements[sub.gate->GetMeasurementKey()] = engine->M(bound.bits, *rand_generator);
            }
        }
        FlushUnitaries(batch);

        ++nextMoment;
        if (config.captureStepStates) {
            toRet.state = std::make_shared<std::vector<complex>>(engine->GetQuantumState());
        }
        status = (nextMoment < circuit.GetMomentCount()) ? STEPPER_READY : STEPPER_DONE;

        return toRet;
    } catch (...) {
        status = STEPPER_FAILED;
        throw;
    }
}

void MomentStepper::SetState(const std::vector<complex>& state)
{
    if (status == STEPPER_FAILED) {
        throw std::logic_error("MomentStepper::SetState() stepper has failed!");
    }
    engine->SetQuantumState(state);
}

void MomentStepper::SetState(bitCapIntOcl perm)
{
    if (status == STEPPER_FAILED) {
        throw std::logic_error("MomentStepper::SetState() stepper has failed!");
    }
    engine->SetPermutation(perm);
}

std::vector<complex> MomentStepper::GetState()
{
    if (status == STEPPER_FAILED) {
        throw std::logic_error("MomentStepper::GetState() stepper has failed; its state is not valid!");
    }

    return engine->GetQuantumState();
}

} // namespace Qshard
