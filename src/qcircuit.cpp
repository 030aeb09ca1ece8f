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

#include "qcircuit.hpp"

#include <algorithm>

namespace Qshard {

QubitSet QMoment::GetQubits() const
{
    QubitSet toRet;
    for (const QOperation& op : operations) {
        toRet.insert(op.qubits.begin(), op.qubits.end());
    }

    return toRet;
}

bool QMoment::IsFree(const QOperation& op) const
{
    const QubitSet used = GetQubits();
    for (const Qubit& q : op.qubits) {
        if (used.find(q) != used.end()) {
            return false;
        }
    }

    return true;
}

void QMoment::Validate() const
{
    QubitSet used;
    for (const QOperation& op : operations) {
        for (const Qubit& q : op.qubits) {
            if (!used.insert(q).second) {
                throw std::invalid_argument(
                    "QMoment::Validate() qubit " + q.GetId() + " is acted on more than once in the same moment!");
            }
        }
    }
}

void QCircuit::AppendOperation(const QOperation& op)
{
    if (moments.empty() || !moments.back().IsFree(op)) {
        moments.push_back(QMoment());
    }
    moments.back().AppendOperation(op);
}

QubitSet QCircuit::GetQubits() const
{
    QubitSet toRet;
    for (const QMoment& moment : moments) {
        const QubitSet mQubits = moment.GetQubits();
        toRet.insert(mQubits.begin(), mQubits.end());
    }

    return toRet;
}

bool QCircuit::IsParameterized() const
{
    for (const QMoment& moment : moments) {
        for (const QOperation& op : moment.operations) {
            if (op.gate->IsParameterized()) {
                return true;
            }
        }
    }

    return false;
}

std::vector<std::string> QCircuit::GetMeasurementKeys() const
{
    std::vector<std::string> toRet;
    std::set<std::string> seen;
    for (const QMoment& moment : moments) {
        for (const QOperation& op : moment.operations) {
            if (!op.gate->IsMeasurement()) {
                continue;
            }
            const std::string key = op.gate->GetMeasurementKey();
            if (!seen.insert(key).second) {
                throw std::invalid_argument("QCircuit measurement key \"" + key + "\" is used more than once!");
            }
            toRet.push_back(key);
        }
    }

    return toRet;
}

QCircuit QCircuit::Resolve(const ParamResolver& resolver) const
{
    QCircuit toRet;
    for (const QMoment& moment : moments) {
        QMoment resolved;
        for (const QOperation& op : moment.operations) {
            resolved.AppendOperation(op.Resolve(resolver));
        }
        toRet.AppendMoment(resolved);
    }

    return toRet;
}

QCircuit QCircuit::Inverse() const
{
    QCircuit toRet;
    for (auto mIt = moments.rbegin(); mIt != moments.rend(); ++mIt) {
        QMoment inverted;
        for (const QOperation& op : mIt->operations) {
            inverted.AppendOperation(QOperation(op.gate->Inverse(), op.qubits));
        }
        toRet.AppendMoment(inverted);
    }

    return toRet;
}

} // namespace Qshard
