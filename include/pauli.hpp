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

#include "common_gates.hpp"

namespace Qshard {

/**
 * Enumerated list of Pauli bases
 */
enum Pauli {
    /// Pauli Identity operator
    PauliI = 0,
    /// Pauli X operator
    PauliX = 1,
    /// Pauli Y operator
    PauliY = 3,
    /// Pauli Z operator
    PauliZ = 2
};

/*
 * The non-identity Paulis form the cycle (X, Y, Z). "Cycle index" is the position in that cycle.
 */

/// Position of "p" in (X, Y, Z). Throws for PauliI.
int PauliCycleIndex(Pauli p);
/// Pauli at position "index" of (X, Y, Z), modulo 3
Pauli PauliByIndex(int index);
/// Pauli "relativeIndex" steps after "p" in the cycle
Pauli PauliByRelativeIndex(Pauli p, int relativeIndex);
/// Relative index of "first" with respect to "second", in {-1, 0, 1}
int PauliRelativeIndex(Pauli first, Pauli second);
/// The Pauli that is neither "first" nor "second," (or "first" itself, if both are the same)
Pauli PauliThird(Pauli first, Pauli second);
inline bool PauliCommutes(Pauli first, Pauli second) { return first == second; }
/// "first" immediately precedes "second" in the cycle
bool PauliCycleLess(Pauli first, Pauli second);

/// The gate for "p," raised to "exponent"
QGatePtr MakePauliGate(Pauli p, const QParam& exponent = ONE_R1_F);

} // namespace Qshard
