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

namespace Qshard {

/**
 * Engine and run settings. The default constructor takes the compile-time defaults from config.h; FromEnvironment()
 * layers the QSHARD_* environment variables on top (when built with ENABLE_ENV_VARS).
 */
struct QSimulatorConfig {
    /// Requested shard count, before rounding down to a power of two
    bitCapIntOcl shardCount;
    /// Registers smaller than this are never sharded
    bitLenInt minQubitsBeforeSharding;
    QPrecision precision;
    QExecutionMode executionMode;
    /// Nesting limit for gate decomposition
    size_t maxDecompositionDepth;
    /// Attach a full state copy to every StepResult
    bool captureStepStates;
    /// Use "randomSeed" as the base seed for sweeps, rather than a fresh one per run
    bool useRandomSeed;
    uint64_t randomSeed;
    /// Log engine construction and worker failures to std::cout
    bool isVerbose;

    QSimulatorConfig();

    static QSimulatorConfig FromEnvironment();
};

} // namespace Qshard
