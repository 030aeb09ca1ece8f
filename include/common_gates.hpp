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

#include <functional>

namespace Qshard {

/**
 * One term of an eigendecomposition: the projector onto an eigenspace, and its eigenvalue as a number of half turns
 * (eigenvalue = e^{i pi halfTurns}).
 */
struct EigenComponent {
    real1_f halfTurns;
    std::vector<complex> projector;

    EigenComponent(real1_f h, const std::vector<complex>& p)
        : halfTurns(h)
        , projector(p)
    {
        // Intentionally left blank.
    }
};

/**
 * A gate defined by its eigendecomposition, raised to an exponent t: U(t) = sum_k e^{i pi t h_k} P_k.
 * The exponent may be a symbol, resolved before simulation.
 */
class EigenPowGate : public QGate {
protected:
    QParam exponent;

    virtual std::vector<EigenComponent> EigenComponents() = 0;
    virtual QGatePtr WithExponent(const QParam& e) = 0;

public:
    EigenPowGate(const std::string& n, bitLenInt qbCount, const QParam& e)
        : QGate(n, qbCount)
        , exponent(e)
    {
        // Intentionally left blank.
    }

    const QParam& GetExponent() { return exponent; }
    std::string GetName();

    bool HasUnitary() { return true; }
    std::vector<complex> GetUnitary();
    bool IsParameterized() { return exponent.IsSymbol(); }
    QGatePtr Resolve(const ParamResolver& resolver);
    QGatePtr Inverse() { return WithExponent(exponent * -ONE_R1_F); }
    /// This gate raised to the power "p"
    QGatePtr Pow(real1_f p) { return WithExponent(exponent * p); }
};

#define QSHARD_EIGEN_POW_GATE(className, gateName, qbCount)                                                            \
    class className : public EigenPowGate {                                                                            \
    protected:                                                                                                         \
        std::vector<EigenComponent> EigenComponents();                                                                 \
        QGatePtr WithExponent(const QParam& e) { return std::make_shared<className>(e); }                              \
                                                                                                                       \
    public:                                                                                                            \
        className(const QParam& e = ONE_R1_F)                                                                          \
            : EigenPowGate(gateName, qbCount, e)                                                                       \
        {                                                                                                              \
        }                                                                                                              \
    };

/// Pauli X, raised to a power
QSHARD_EIGEN_POW_GATE(XPowGate, "X", 1U)
/// Pauli Y, raised to a power
QSHARD_EIGEN_POW_GATE(YPowGate, "Y", 1U)
/// Pauli Z, raised to a power. Z^0.5 is S, and Z^0.25 is T.
QSHARD_EIGEN_POW_GATE(ZPowGate, "Z", 1U)
/// Hadamard, raised to a power
QSHARD_EIGEN_POW_GATE(HPowGate, "H", 1U)
/// Controlled Z, raised to a power
QSHARD_EIGEN_POW_GATE(CZPowGate, "CZ", 2U)
/// Controlled X, raised to a power. The first qubit is the control.
QSHARD_EIGEN_POW_GATE(CNotPowGate, "CNOT", 2U)
/// SWAP, raised to a power
QSHARD_EIGEN_POW_GATE(SwapPowGate, "SWAP", 2U)

/**
 * Doubly-controlled Z, raised to a power. Three qubits, so it is only ever simulated through its decomposition into
 * CNOT and Z powers.
 */
class CCZPowGate : public QGate {
protected:
    QParam exponent;

public:
    CCZPowGate(const QParam& e = ONE_R1_F)
        : QGate("CCZ", 3U)
        , exponent(e)
    {
        // Intentionally left blank.
    }

    bool HasDecomposition() { return true; }
    std::vector<QOperation> Decompose(const std::vector<Qubit>& qubits);
    bool IsParameterized() { return exponent.IsSymbol(); }
    QGatePtr Resolve(const ParamResolver& resolver) { return std::make_shared<CCZPowGate>(exponent.Resolve(resolver)); }
    QGatePtr Inverse() { return std::make_shared<CCZPowGate>(exponent * -ONE_R1_F); }
};

/**
 * Toffoli, raised to a power: CCZ conjugated by Hadamard on the target (last) qubit
 */
class CCXPowGate : public QGate {
protected:
    QParam exponent;

public:
    CCXPowGate(const QParam& e = ONE_R1_F)
        : QGate("CCX", 3U)
        , exponent(e)
    {
        // Intentionally left blank.
    }

    bool HasDecomposition() { return true; }
    std::vector<QOperation> Decompose(const std::vector<Qubit>& qubits);
    bool IsParameterized() { return exponent.IsSymbol(); }
    QGatePtr Resolve(const ParamResolver& resolver) { return std::make_shared<CCXPowGate>(exponent.Resolve(resolver)); }
    QGatePtr Inverse() { return std::make_shared<CCXPowGate>(exponent * -ONE_R1_F); }
};

/**
 * Fixed unitary, given as a row-major 2^k x 2^k matrix
 */
class MatrixGate : public QGate {
protected:
    std::vector<complex> matrix;

public:
    MatrixGate(const std::string& n, bitLenInt qbCount, const std::vector<complex>& mtrx);

    bool HasUnitary() { return true; }
    std::vector<complex> GetUnitary() { return matrix; }
    QGatePtr Inverse();
};

/**
 * Measurement of k qubits in the computational basis, recorded under "key"
 */
class MeasurementGate : public QGate {
protected:
    std::string key;

public:
    MeasurementGate(const std::string& k, bitLenInt qbCount = 1U)
        : QGate("M", qbCount)
        , key(k)
    {
        // Intentionally left blank.
    }

    std::string GetName() { return "M('" + key + "')"; }
    bool IsMeasurement() { return true; }
    std::string GetMeasurementKey() { return key; }
};

typedef std::function<std::vector<QOperation>(const std::vector<Qubit>&)> DecomposeFn;

/**
 * Composite gate defined only by a caller-supplied decomposition
 */
class DecomposedGate : public QGate {
protected:
    DecomposeFn decomposer;

public:
    DecomposedGate(const std::string& n, bitLenInt qbCount, DecomposeFn fn)
        : QGate(n, qbCount)
        , decomposer(fn)
    {
        // Intentionally left blank.
    }

    bool HasDecomposition() { return true; }
    std::vector<QOperation> Decompose(const std::vector<Qubit>& qubits) { return decomposer(qubits); }
};

} // namespace Qshard
