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

#include "param_resolver.hpp"
#include "qubit_order.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Qshard {

class QGate;
typedef std::shared_ptr<QGate> QGatePtr;

/**
 * A gate applied to an ordered tuple of distinct qubits. The first qubit of the tuple is the most significant bit of
 * the gate's matrix index.
 */
struct QOperation {
    QGatePtr gate;
    std::vector<Qubit> qubits;

    QOperation(QGatePtr g, const std::vector<Qubit>& q);

    /// Same qubits, with every symbolic gate parameter substituted from "resolver"
    QOperation Resolve(const ParamResolver& resolver) const;
};

/**
 * Capability interface every gate exposes to the engine. A gate answers whether it has a unitary, a decomposition,
 * or is a measurement. The engine prefers a unitary over a decomposition, where both exist.
 */
class QGate : public std::enable_shared_from_this<QGate> {
protected:
    std::string name;
    bitLenInt qubitCount;

public:
    QGate(const std::string& n, bitLenInt qbCount)
        : name(n)
        , qubitCount(qbCount)
    {
        // Intentionally left blank.
    }
    virtual ~QGate()
    {
        // Intentionally left blank.
    }

    bitLenInt GetQubitCount() { return qubitCount; }
    virtual std::string GetName() { return name; }

    virtual bool HasUnitary() { return false; }
    /**
     * Row-major 2^k x 2^k unitary, for a k qubit gate.
     */
    virtual std::vector<complex> GetUnitary();

    virtual bool HasDecomposition() { return false; }
    /**
     * Equivalent sequence of operations on "qubits"
     */
    virtual std::vector<QOperation> Decompose(const std::vector<Qubit>& qubits);

    virtual bool IsMeasurement() { return false; }
    virtual std::string GetMeasurementKey() { return ""; }

    virtual bool IsParameterized() { return false; }
    /**
     * Substitute symbolic parameters. A gate without parameters returns itself.
     */
    virtual QGatePtr Resolve(const ParamResolver& resolver) { return shared_from_this(); }

    /**
     * The inverse gate, if one is known
     */
    virtual QGatePtr Inverse();
};

} // namespace Qshard
