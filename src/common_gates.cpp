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

#include "common_gates.hpp"

#include <sstream>

#define C_HALF complex(HALF_R1_F, ZERO_R1_F)
#define C_I_HALF complex(ZERO_R1_F, HALF_R1_F)

namespace Qshard {

std::string EigenPowGate::GetName()
{
    std::stringstream ss;
    ss << name;
    if (exponent.IsSymbol()) {
        ss << "**";
        if (exponent.GetCoefficient() != ONE_R1_F) {
            ss << exponent.GetCoefficient() << "*";
        }
        ss << exponent.GetSymbol();
    } else if (exponent.GetValue() != ONE_R1_F) {
        ss << "**" << exponent.GetValue();
    }

    return ss.str();
}

std::vector<complex> EigenPowGate::GetUnitary()
{
    const real1_f t = exponent.GetValue();
    const std::vector<EigenComponent> components = EigenComponents();
    const size_t mtrxSize = components[0U].projector.size();

    std::vector<complex> toRet(mtrxSize, ZERO_CMPLX);
    for (const EigenComponent& component : components) {
        const real1_f angle = (real1_f)PI_R1 * t * component.halfTurns;
        const complex phase(cos(angle), sin(angle));
        for (size_t i = 0U; i < mtrxSize; ++i) {
            toRet[i] += phase * component.projector[i];
        }
    }

    return toRet;
}

QGatePtr EigenPowGate::Resolve(const ParamResolver& resolver)
{
    if (!exponent.IsSymbol()) {
        return shared_from_this();
    }

    return WithExponent(exponent.Resolve(resolver));
}

std::vector<EigenComponent> XPowGate::EigenComponents()
{
    return { EigenComponent(ZERO_R1_F, { C_HALF, C_HALF, C_HALF, C_HALF }),
        EigenComponent(ONE_R1_F, { C_HALF, -C_HALF, -C_HALF, C_HALF }) };
}

std::vector<EigenComponent> YPowGate::EigenComponents()
{
    return { EigenComponent(ZERO_R1_F, { C_HALF, -C_I_HALF, C_I_HALF, C_HALF }),
        EigenComponent(ONE_R1_F, { C_HALF, C_I_HALF, -C_I_HALF, C_HALF }) };
}

std::vector<EigenComponent> ZPowGate::EigenComponents()
{
    return { EigenComponent(ZERO_R1_F, { ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, ZERO_CMPLX }),
        EigenComponent(ONE_R1_F, { ZERO_CMPLX, ZERO_CMPLX, ZERO_CMPLX, ONE_CMPLX }) };
}

std::vector<EigenComponent> HPowGate::EigenComponents()
{
    const real1_f s = (real1_f)SQRT1_2_R1;
    const complex d((ONE_R1_F + s) / 2, ZERO_R1_F);
    const complex e((ONE_R1_F - s) / 2, ZERO_R1_F);
    const complex o(s / 2, ZERO_R1_F);

    return { EigenComponent(ZERO_R1_F, { d, o, o, e }), EigenComponent(ONE_R1_F, { e, -o, -o, d }) };
}

std::vector<EigenComponent> CZPowGate::EigenComponents()
{
    std::vector<complex> p0(16U, ZERO_CMPLX);
    std::vector<complex> p1(16U, ZERO_CMPLX);
    p0[0U] = ONE_CMPLX;
    p0[5U] = ONE_CMPLX;
    p0[10U] = ONE_CMPLX;
    p1[15U] = ONE_CMPLX;

    return { EigenComponent(ZERO_R1_F, p0), EigenComponent(ONE_R1_F, p1) };
}

std::vector<EigenComponent> CNotPowGate::EigenComponents()
{
    // |1><1| on the control, tensored with the X eigenprojectors on the target
    std::vector<complex> p0(16U, ZERO_CMPLX);
    std::vector<complex> p1(16U, ZERO_CMPLX);
    p0[0U] = ONE_CMPLX;
    p0[5U] = ONE_CMPLX;
    p0[10U] = C_HALF;
    p0[11U] = C_HALF;
    p0[14U] = C_HALF;
    p0[15U] = C_HALF;
    p1[10U] = C_HALF;
    p1[11U] = -C_HALF;
    p1[14U] = -C_HALF;
    p1[15U] = C_HALF;

    return { EigenComponent(ZERO_R1_F, p0), EigenComponent(ONE_R1_F, p1) };
}

std::vector<EigenComponent> SwapPowGate::EigenComponents()
{
    // Symmetric and antisymmetric subspaces of |01> and |10>
    std::vector<complex> p0(16U, ZERO_CMPLX);
    std::vector<complex> p1(16U, ZERO_CMPLX);
    p0[0U] = ONE_CMPLX;
    p0[5U] = C_HALF;
    p0[6U] = C_HALF;
    p0[9U] = C_HALF;
    p0[10U] = C_HALF;
    p0[15U] = ONE_CMPLX;
    p1[5U] = C_HALF;
    p1[6U] = -C_HALF;
    p1[9U] = -C_HALF;
    p1[10U] = C_HALF;

    return { EigenComponent(ZERO_R1_F, p0), EigenComponent(ONE_R1_F, p1) };
}

std::vector<QOperation> CCZPowGate::Decompose(const std::vector<Qubit>& qubits)
{
    const Qubit& a = qubits[0U];
    const Qubit& b = qubits[1U];
    const Qubit& c = qubits[2U];

    // Phase polynomial over a, b, c, with CNOT ladders to reach the pairwise and triple parities
    const QGatePtr p = std::make_shared<ZPowGate>(exponent * 0.25);
    const QGatePtr pInv = std::make_shared<ZPowGate>(exponent * -0.25);
    const QGatePtr cnot = std::make_shared<CNotPowGate>();

    std::vector<QOperation> toRet;
    toRet.push_back(QOperation(p, { a }));
    toRet.push_back(QOperation(p, { b }));
    toRet.push_back(QOperation(p, { c }));
    for (int round = 0; round < 4; ++round) {
        toRet.push_back(QOperation(cnot, { a, b }));
        toRet.push_back(QOperation(cnot, { b, c }));
        if (round == 0) {
            toRet.push_back(QOperation(pInv, { b }));
            toRet.push_back(QOperation(p, { c }));
        } else if (round < 3) {
            toRet.push_back(QOperation(pInv, { c }));
        }
    }

    return toRet;
}

std::vector<QOperation> CCXPowGate::Decompose(const std::vector<Qubit>& qubits)
{
    const QGatePtr h = std::make_shared<HPowGate>();

    std::vector<QOperation> toRet;
    toRet.push_back(QOperation(h, { qubits[2U] }));
    toRet.push_back(QOperation(std::make_shared<CCZPowGate>(exponent), qubits));
    toRet.push_back(QOperation(h, { qubits[2U] }));

    return toRet;
}

MatrixGate::MatrixGate(const std::string& n, bitLenInt qbCount, const std::vector<complex>& mtrx)
    : QGate(n, qbCount)
    , matrix(mtrx)
{
    if (!qbCount) {
        throw std::invalid_argument("MatrixGate must act on at least one qubit!");
    }

    const size_t dim = (size_t)1U << qbCount;
    if (matrix.size() != (dim * dim)) {
        throw DimensionMismatch("MatrixGate " + n + " matrix has " + std::to_string(matrix.size()) +
            " entries, but a " + std::to_string((int)qbCount) + " qubit gate needs " + std::to_string(dim * dim) +
            "!");
    }
}

QGatePtr MatrixGate::Inverse()
{
    const size_t dim = (size_t)1U << qubitCount;
    std::vector<complex> adjoint(matrix.size());
    for (size_t i = 0U; i < dim; ++i) {
        for (size_t j = 0U; j < dim; ++j) {
            adjoint[j * dim + i] = conj(matrix[i * dim + j]);
        }
    }

    return std::make_shared<MatrixGate>(name + "^-1", qubitCount, adjoint);
}

} // namespace Qshard
