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

#include "qubit_order.hpp"

#include <algorithm>
#include <stdexcept>

namespace Qshard {

bool DefaultQubitLess(const Qubit& left, const Qubit& right) { return left.GetId() < right.GetId(); }

QubitOrder::QubitOrder(QubitLess natural)
    : explicitOrder()
    , naturalLess(natural)
{
    // Intentionally left blank.
}

QubitOrder::QubitOrder(const std::vector<Qubit>& explicitQubits, QubitLess natural)
    : explicitOrder(explicitQubits)
    , naturalLess(natural)
{
    QubitSet seen;
    for (size_t i = 0U; i < explicitOrder.size(); ++i) {
        if (!seen.insert(explicitOrder[i]).second) {
            throw std::invalid_argument("QubitOrder explicit list contains qubit " + explicitOrder[i].GetId() + " twice!");
        }
    }
}

std::vector<Qubit> QubitOrder::OrderFor(const QubitSet& circuitQubits) const
{
    std::vector<Qubit> toRet(explicitOrder);
    const QubitSet listed(explicitOrder.begin(), explicitOrder.end());

    std::vector<Qubit> rest;
    for (const Qubit& q : circuitQubits) {
        if (listed.find(q) == listed.end()) {
            rest.push_back(q);
        }
    }
    std::stable_sort(rest.begin(), rest.end(), naturalLess);
    toRet.insert(toRet.end(), rest.begin(), rest.end());

    if (toRet.size() >= (bitsInByte * sizeof(bitCapIntOcl))) {
        throw std::invalid_argument("QubitOrder::OrderFor() too many qubits for the amplitude index width!");
    }

    return toRet;
}

QubitBitMap QubitOrder::BitMapFor(const std::vector<Qubit>& ordered)
{
    QubitBitMap toRet;
    const bitLenInt n = (bitLenInt)ordered.size();
    for (bitLenInt p = 0U; p < n; ++p) {
        toRet[ordered[p]] = n - 1U - p;
    }

    return toRet;
}

} // namespace Qshard
