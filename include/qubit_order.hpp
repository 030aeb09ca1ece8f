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

#include "common/qshard_types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace Qshard {

/**
 * Opaque qubit identity. Two qubits are the same qubit if and only if their ids are equal. Nothing else about the id
 * is meaningful to the engine.
 */
class Qubit {
protected:
    std::string id;

public:
    Qubit() {}
    explicit Qubit(const std::string& i)
        : id(i)
    {
        // Intentionally left blank.
    }
    explicit Qubit(const char* i)
        : id(i)
    {
        // Intentionally left blank.
    }

    const std::string& GetId() const { return id; }

    bool operator==(const Qubit& other) const { return id == other.id; }
    bool operator!=(const Qubit& other) const { return id != other.id; }
};

/// Container key ordering by identity. This is not the "natural" basis ordering.
struct QubitIdLess {
    bool operator()(const Qubit& left, const Qubit& right) const { return left.GetId() < right.GetId(); }
};

typedef std::set<Qubit, QubitIdLess> QubitSet;
typedef std::map<Qubit, bitLenInt, QubitIdLess> QubitBitMap;

/// Externally supplied total "natural" ordering over qubits
typedef std::function<bool(const Qubit&, const Qubit&)> QubitLess;

/// Convenience natural ordering, by id string
bool DefaultQubitLess(const Qubit& left, const Qubit& right);

/**
 * Fixes which qubit maps to which amplitude index bit. The explicitly listed qubits come first, in the given order;
 * every other qubit of the circuit follows, sorted by the natural ordering. The first qubit of the final order is the
 * most significant bit of the amplitude index.
 */
class QubitOrder {
protected:
    std::vector<Qubit> explicitOrder;
    QubitLess naturalLess;

public:
    /// Pure natural ordering
    QubitOrder(QubitLess natural = DefaultQubitLess);
    /// Explicit prefix, then natural ordering for the rest. Duplicate entries are rejected.
    QubitOrder(const std::vector<Qubit>& explicitQubits, QubitLess natural = DefaultQubitLess);

    const std::vector<Qubit>& GetExplicitOrder() const { return explicitOrder; }

    /// The final ordering for a circuit using "circuitQubits". Explicitly listed qubits are kept even if unused.
    std::vector<Qubit> OrderFor(const QubitSet& circuitQubits) const;

    /// Amplitude index bit for each qubit of "ordered": position p maps to bit (n - 1 - p).
    static QubitBitMap BitMapFor(const std::vector<Qubit>& ordered);
};

} // namespace Qshard
