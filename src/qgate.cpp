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

#include "qgate.hpp"

namespace Qshard {

QOperation::QOperation(QGatePtr g, const std::vector<Qubit>& q)
    : gate(g)
    , qubits(q)
{
    if (!gate) {
        throw std::invalid_argument("QOperation cannot be constructed without a gate!");
    }

    if (qubits.size() != gate->GetQubitCount()) {
        throw std::invalid_argument("QOperation " + gate->GetName() + " acts on " +
            std::to_string((int)gate->GetQubitCount()) + " qubit(s), but was given " + std::to_string(qubits.size()) +
            "!");
    }

    const QubitSet distinct(qubits.begin(), qubits.end());
    if (distinct.size() != qubits.size()) {
        throw std::invalid_argument("QOperation " + gate->GetName() + " qubits must be distinct!");
    }
}

QOperation QOperation::Resolve(const ParamResolver& resolver) const
{
    if (!gate->IsParameterized()) {
        return *this;
    }

    return QOperation(gate->Resolve(resolver), qubits);
}

std::vector<complex> QGate::GetUnitary()
{
    throw UnsupportedOperation("QGate::GetUnitary() " + GetName() + " has no unitary!");
}

std::vector<QOperation> QGate::Decompose(const std::vector<Qubit>& qubits)
{
    throw UnsupportedOperation("QGate::Decompose() " + GetName() + " has no decomposition!");
}

QGatePtr QGate::Inverse() { throw UnsupportedOperation("QGate::Inverse() " + GetName() + " has no known inverse!"); }

} // namespace Qshard
