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

#include "pauli.hpp"

namespace Qshard {

static const Pauli pauliCycle[3U] = { PauliX, PauliY, PauliZ };

static int mod3(int i) { return ((i % 3) + 3) % 3; }

int PauliCycleIndex(Pauli p)
{
    switch (p) {
    case PauliX:
        return 0;
    case PauliY:
        return 1;
    case PauliZ:
        return 2;
    case PauliI:
    default:
        throw std::invalid_argument("PauliCycleIndex() identity is not part of the (X, Y, Z) cycle!");
    }
}

Pauli PauliByIndex(int index) { return pauliCycle[mod3(index)]; }

Pauli PauliByRelativeIndex(Pauli p, int relativeIndex) { return pauliCycle[mod3(PauliCycleIndex(p) + relativeIndex)]; }

int PauliRelativeIndex(Pauli first, Pauli second)
{
    return mod3(PauliCycleIndex(first) - PauliCycleIndex(second) + 1) - 1;
}

Pauli PauliThird(Pauli first, Pauli second)
{
    return pauliCycle[mod3(-PauliCycleIndex(first) - PauliCycleIndex(second))];
}

bool PauliCycleLess(Pauli first, Pauli second)
{
    return mod3(PauliCycleIndex(second) - PauliCycleIndex(first)) == 1;
}

QGatePtr MakePauliGate(Pauli p, const QParam& exponent)
{
    switch (p) {
    case PauliX:
        return std::make_shared<XPowGate>(exponent);
    case PauliY:
        return std::make_shared<YPowGate>(exponent);
    case PauliZ:
        return std::make_shared<ZPowGate>(exponent);
    case PauliI:
    default:
        // Identity is any Pauli to the 0th power.
        return std::make_shared<ZPowGate>(QParam(ZERO_R1_F));
    }
}

} // namespace Qshard
