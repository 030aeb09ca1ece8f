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

#include "qgate.hpp"

#include <set>

namespace Qshard {

/**
 * Operations that happen at the same time step. Their qubit sets must be pairwise disjoint. Construction does not
 * enforce this; Validate() does, and the stepper calls it before running each moment.
 */
struct QMoment {
    std::vector<QOperation> operations;

    QMoment() {}
    QMoment(const std::vector<QOperation>& ops)
        : operations(ops)
    {
        // Intentionally left blank.
    }

    void AppendOperation(const QOperation& op) { operations.push_back(op); }

    QubitSet GetQubits() const;
    /// Whether "op" could join this moment without sharing a qubit
    bool IsFree(const QOperation& op) const;
    /// Throws std::invalid_argument if two operations share a qubit.
    void Validate() const;
};

/**
 * Ordered sequence of moments
 */
class QCircuit {
protected:
    std::vector<QMoment> moments;

public:
    QCircuit() {}
    QCircuit(const std::vector<QMoment>& m)
        : moments(m)
    {
        // Intentionally left blank.
    }

    const std::vector<QMoment>& GetMoments() const { return moments; }
    size_t GetMomentCount() const { return moments.size(); }

    void AppendMoment(const QMoment& moment) { moments.push_back(moment); }
    /**
     * Append "op" to the last moment, or open a new moment if the last one already uses one of its qubits
     */
    void AppendOperation(const QOperation& op);

    QubitSet GetQubits() const;
    bool IsParameterized() const;
    /// Every measurement key, in order of appearance. Throws std::invalid_argument on a repeated key.
    std::vector<std::string> GetMeasurementKeys() const;

    /// Every symbolic gate parameter substituted from "resolver"
    QCircuit Resolve(const ParamResolver& resolver) const;

    /**
     * Reverse moment order, and invert every operation. Fails for gates without a known inverse, such as measurement.
     */
    QCircuit Inverse() const;
};

} // namespace Qshard
