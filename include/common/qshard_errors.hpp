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

#include <stdexcept>
#include <string>

namespace Qshard {

/**
 * A caller-supplied state vector, basis integer, or gate matrix does not fit the register it is applied to.
 */
class DimensionMismatch : public std::invalid_argument {
public:
    DimensionMismatch(const std::string& what)
        : std::invalid_argument(what)
    {
        // Intentionally left blank.
    }
};

/**
 * An operation exposes neither a usable unitary nor a decomposition.
 */
class UnsupportedOperation : public std::invalid_argument {
public:
    UnsupportedOperation(const std::string& what)
        : std::invalid_argument(what)
    {
        // Intentionally left blank.
    }
};

/**
 * A symbolic parameter has no value in the active resolver.
 */
class UnresolvedSymbol : public std::invalid_argument {
public:
    UnresolvedSymbol(const std::string& what)
        : std::invalid_argument(what)
    {
        // Intentionally left blank.
    }
};

/**
 * Decomposition did not bottom out in directly applicable operations within the depth limit.
 */
class DecompositionCycle : public std::runtime_error {
public:
    DecompositionCycle(const std::string& what)
        : std::runtime_error(what)
    {
        // Intentionally left blank.
    }
};

/**
 * The sampled outcome leaves (numerically) zero probability mass to renormalize.
 */
class DegenerateMeasurement : public std::domain_error {
public:
    DegenerateMeasurement(const std::string& what)
        : std::domain_error(what)
    {
        // Intentionally left blank.
    }
};

/**
 * A shard worker failed. Every other worker of the moment has been cancelled and joined before this is thrown.
 */
class WorkerFailure : public std::runtime_error {
public:
    WorkerFailure(const std::string& what)
        : std::runtime_error(what)
    {
        // Intentionally left blank.
    }
};

/**
 * Advance() was called on a stepper that already finished, or that failed.
 */
class StepperExhausted : public std::logic_error {
public:
    StepperExhausted(const std::string& what)
        : std::logic_error(what)
    {
        // Intentionally left blank.
    }
};

} // namespace Qshard
