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

#include "amplitude_store.hpp"
#include "qgate.hpp"

namespace Qshard {

/**
 * An operation with its qubits replaced by amplitude index bits. bits[0] is the most significant bit of the gate's
 * matrix index.
 */
struct QBoundOp {
    QGatePtr gate;
    std::vector<bitLenInt> bits;

    QBoundOp(QGatePtr g, const std::vector<bitLenInt>& b)
        : gate(g)
        , bits(b)
    {
        // Intentionally left blank.
    }
};

class GateApplicator {
public:
    /**
     * Flatten "op" into measurements, and unitaries on at most 2 qubits. A gate with a usable unitary is kept as is;
     * otherwise its decomposition is expanded recursively. Throws UnsupportedOperation for a gate with neither, and
     * DecompositionCycle once recursion passes "maxDepth".
     */
    static std::vector<QOperation> Expand(const QOperation& op, size_t maxDepth);

    /// Map an operation's qubits to index bits
    static QBoundOp Bind(const QOperation& op, const QubitBitMap& bitMap);

    /**
     * Apply a row-major 2x2 or 4x4 "mtrx" in place to the shard, over its local index bits "localBits."
     */
    template <typename FP>
    static void ApplyMatrix(
        ParallelFor& par, const StateShard<FP>& shard, const std::vector<complex>& mtrx, const std::vector<bitLenInt>& localBits);

protected:
    static void ExpandInto(const QOperation& op, size_t depth, size_t maxDepth, std::vector<QOperation>& out);

    template <typename FP>
    static void Apply2x2(ParallelFor& par, const StateShard<FP>& shard, const std::complex<FP>* mtrx, bitLenInt bit);
    template <typename FP>
    static void Apply4x4(ParallelFor& par, const StateShard<FP>& shard, const std::complex<FP>* mtrx, bitLenInt bitHigh,
        bitLenInt bitLow);
};

} // namespace Qshard
