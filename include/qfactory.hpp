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

#include "qshard_engine_cpu.hpp"
#include "qsimulator_config.hpp"

namespace Qshard {

/** Factory method to create an engine at the requested amplitude precision. */
template <typename... Ts> QShardEnginePtr CreateShardEngine(QPrecision precision, Ts... args)
{
    switch (precision) {
    case QPRECISION_SINGLE:
        return std::make_shared<QShardEngineCPU<float>>(args...);
    case QPRECISION_DOUBLE:
    default:
        return std::make_shared<QShardEngineCPU<double>>(args...);
    }
}

/** Engine for "qubitCount" qubits, with shard count, precision and execution mode taken from "config". */
inline QShardEnginePtr CreateShardEngine(const QSimulatorConfig& config, bitLenInt qubitCount)
{
    const bitCapIntOcl shards = ShardCountFor(qubitCount, config.shardCount, config.minQubitsBeforeSharding);

    return CreateShardEngine(config.precision, qubitCount, shards, config.executionMode, config.isVerbose);
}

} // namespace Qshard
