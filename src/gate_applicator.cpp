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

#include "gate_applicator.hpp"

#include <algorithm>

namespace Qshard {

std::vector<QOperation> GateApplicator::Expand(const QOperation& op, size_t maxDepth)
{
    std::vector<QOperation> toRet;
    ExpandInto(op, 0U, maxDepth, toRet);

    return toRet;
}

void GateApplicator::ExpandInto(const QOperation& op, size_t depth, size_t maxDepth, std::vector<QOperation>& out)
{
    if (op.gate->IsMeasurement()) {
        out.push_back(op);
        return;
    }

    if (op.gate->HasUnitary() && (op.gate->GetQubitCount() <= 2U)) {
        out.push_back(op);
        return;
    }

    if (!op.gate->HasDecomposition()) {
        throw UnsupportedOperation("GateApplicator::Expand() " + op.gate->GetName() + " on " +
            std::to_string((int)op.gate->GetQubitCount()) +
            " qubit(s) has neither a 1 or 2 qubit unitary nor a decomposition!");
    }

    if (depth >= maxDepth) {
        throw DecompositionCycle("GateApplicator::Expand() decomposition of " + op.gate->GetName() +
            " did not terminate within depth " + std::to_string(maxDepth) + "!");
    }

    const std::vector<QOperation> decomposed = op.gate->Decompose(op.qubits);
    for (const QOperation& sub : decomposed) {
        ExpandInto(sub, depth + 1U, maxDepth, out);
    }
}

QBoundOp GateApplicator::Bind(const QOperation& op, const QubitBitMap& bitMap)
{
    std::vector<bitLenInt> bits(op.qubits.size());
    for (size_t i = 0U; i < op.qubits.size(); ++i) {
        const auto it = bitMap.find(op.qubits[i]);
        if (it == bitMap.end()) {
            throw std::invalid_argument(
                "GateApplicator::Bind() qubit " + op.qubits[i].GetId() + " is not part of the qubit order!");
        }
        bits[i] = it->second;
    }

    return QBoundOp(op.gate, bits);
}

template <typename FP>
void GateApplicator::ApplyMatrix(
    ParallelFor& par, const StateShard<FP>& shard, const std::vector<complex>& mtrx, const std::vector<bitLenInt>& localBits)
{
    const size_t dim = (size_t)1U << localBits.size();
    if ((localBits.size() < 1U) || (localBits.size() > 2U)) {
        throw std::invalid_argument("GateApplicator::ApplyMatrix() only 1 and 2 qubit matrices apply directly!");
    }
    if (mtrx.size() != (dim * dim)) {
        throw DimensionMismatch("GateApplicator::ApplyMatrix() " + std::to_string(localBits.size()) +
            " qubit operation supplied a matrix with " + std::to_string(mtrx.size()) + " entries!");
    }
    for (size_t i = 0U; i < localBits.size(); ++i) {
        if (localBits[i] >= shard.localQubitCount) {
            throw std::invalid_argument("GateApplicator::ApplyMatrix() bit is not local to the shard!");
        }
    }
    if ((localBits.size() == 2U) && (localBits[0U] == localBits[1U])) {
        throw std::invalid_argument("GateApplicator::ApplyMatrix() bits cannot be duplicated!");
    }

    std::unique_ptr<std::complex<FP>[]> mtrxFp(new std::complex<FP>[mtrx.size()]);
    for (size_t i = 0U; i < mtrx.size(); ++i) {
        mtrxFp[i] = std::complex<FP>((FP)real(mtrx[i]), (FP)imag(mtrx[i]));
    }

    if (localBits.size() == 1U) {
        Apply2x2<FP>(par, shard, mtrxFp.get(), localBits[0U]);
    } else {
        Apply4x4<FP>(par, shard, mtrxFp.get(), localBits[0U], localBits[1U]);
    }
}

template <typename FP>
void GateApplicator::Apply2x2(ParallelFor& par, const StateShard<FP>& shard, const std::complex<FP>* mtrx, bitLenInt bit)
{
    std::complex<FP>* amps = shard.amplitudes;
    const bitCapIntOcl qPower = pow2Ocl(bit);

    par.par_for_skip(0U, shard.length, qPower, 1U, [amps, mtrx, qPower](const bitCapIntOcl& lcv, const unsigned& cpu) {
        const std::complex<FP> c0 = amps[lcv];
        const std::complex<FP> c1 = amps[lcv | qPower];
        amps[lcv] = mtrx[0U] * c0 + mtrx[1U] * c1;
        amps[lcv | qPower] = mtrx[2U] * c0 + mtrx[3U] * c1;
    });
}

template <typename FP>
void GateApplicator::Apply4x4(ParallelFor& par, const StateShard<FP>& shard, const std::complex<FP>* mtrx,
    bitLenInt bitHigh, bitLenInt bitLow)
{
    std::complex<FP>* amps = shard.amplitudes;
    const bitCapIntOcl highPower = pow2Ocl(bitHigh);
    const bitCapIntOcl lowPower = pow2Ocl(bitLow);
    // Matrix index k = 2 * (bitHigh set) + (bitLow set)
    const bitCapIntOcl offsets[4U] = { 0U, lowPower, highPower, highPower | lowPower };

    std::vector<bitCapIntOcl> qPowersSorted({ highPower, lowPower });
    std::sort(qPowersSorted.begin(), qPowersSorted.end());

    par.par_for_mask(0U, shard.length, qPowersSorted, [amps, mtrx, &offsets](const bitCapIntOcl& lcv, const unsigned& cpu) {
        std::complex<FP> in[4U];
        for (size_t k = 0U; k < 4U; ++k) {
            in[k] = amps[lcv | offsets[k]];
        }
        for (size_t row = 0U; row < 4U; ++row) {
            const std::complex<FP>* mRow = mtrx + (row << 2U);
            amps[lcv | offsets[row]] = mRow[0U] * in[0U] + mRow[1U] * in[1U] + mRow[2U] * in[2U] + mRow[3U] * in[3U];
        }
    });
}

template void GateApplicator::ApplyMatrix<float>(
    ParallelFor& par, const StateShard<float>& shard, const std::vector<complex>& mtrx, const std::vector<bitLenInt>& localBits);
template void GateApplicator::ApplyMatrix<double>(
    ParallelFor& par, const StateShard<double>& shard, const std::vector<complex>& mtrx, const std::vector<bitLenInt>& localBits);

} // namespace Qshard
