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

#include "qsimulator_config.hpp"

#include <iostream>
#include <stdexcept>
#include <stdlib.h>
#include <string>
#include <thread>

namespace Qshard {

QSimulatorConfig::QSimulatorConfig()
    : shardCount(std::thread::hardware_concurrency())
    , minQubitsBeforeSharding(QSHARD_MIN_SHARDING_QB)
#if QSHARD_DEFAULT_FPPOW < 6
    , precision(QPRECISION_SINGLE)
#else
    , precision(QPRECISION_DOUBLE)
#endif
    , executionMode(QEXEC_THREAD)
    , maxDecompositionDepth(QSHARD_MAX_DECOMPOSITION_DEPTH)
    , captureStepStates(true)
    , useRandomSeed(false)
    , randomSeed(0U)
    , isVerbose(false)
{
    if (!shardCount) {
        shardCount = 1U;
    }
}

#if ENABLE_ENV_VARS
static bool ReadUnsignedEnv(const char* name, unsigned long long& out)
{
    const char* value = getenv(name);
    if (!value) {
        return false;
    }

    try {
        size_t consumed = 0U;
        const std::string str(value);
        if (str.empty() || (str[0U] == '-')) {
            throw std::invalid_argument(str);
        }
        out = std::stoull(str, &consumed);
        if (consumed != str.size()) {
            throw std::invalid_argument(str);
        }
    } catch (const std::logic_error&) {
        std::cout << "WARNING: Invalid " << name << " value \"" << value << "\" (Falling back to default.)"
                  << std::endl;
        return false;
    }

    return true;
}
#endif

QSimulatorConfig QSimulatorConfig::FromEnvironment()
{
    QSimulatorConfig toRet;

#if ENABLE_ENV_VARS
    unsigned long long value;

    if (ReadUnsignedEnv("QSHARD_SHARD_COUNT", value)) {
        if (value) {
            toRet.shardCount = (bitCapIntOcl)value;
        } else {
            std::cout << "WARNING: QSHARD_SHARD_COUNT must be at least 1. (Falling back to default.)" << std::endl;
        }
    }

    if (ReadUnsignedEnv("QSHARD_MIN_SHARDING_QB", value)) {
        toRet.minQubitsBeforeSharding = (bitLenInt)((value < 64U) ? value : 64U);
    }

    if (ReadUnsignedEnv("QSHARD_MAX_DECOMPOSITION_DEPTH", value)) {
        toRet.maxDecompositionDepth = (size_t)value;
    }

    if (ReadUnsignedEnv("QSHARD_RANDOM_SEED", value)) {
        toRet.useRandomSeed = true;
        toRet.randomSeed = (uint64_t)value;
    }

    if (getenv("QSHARD_PRECISION")) {
        const std::string precision(getenv("QSHARD_PRECISION"));
        if (precision == "single") {
            toRet.precision = QPRECISION_SINGLE;
        } else if (precision == "double") {
            toRet.precision = QPRECISION_DOUBLE;
        } else {
            std::cout << "WARNING: Invalid QSHARD_PRECISION value \"" << precision
                      << "\", expected \"single\" or \"double\". (Falling back to default.)" << std::endl;
        }
    }

    if (getenv("QSHARD_EXECUTION_MODE")) {
        const std::string mode(getenv("QSHARD_EXECUTION_MODE"));
        if (mode == "thread") {
            toRet.executionMode = QEXEC_THREAD;
        } else if (mode == "process") {
#if ENABLE_PROCESS_SHARDS
            toRet.executionMode = QEXEC_PROCESS;
#else
            std::cout << "WARNING: QSHARD_EXECUTION_MODE=process needs a build with ENABLE_PROCESS_SHARDS. "
                         "(Falling back to thread.)"
                      << std::endl;
#endif
        } else {
            std::cout << "WARNING: Invalid QSHARD_EXECUTION_MODE value \"" << mode
                      << "\", expected \"thread\" or \"process\". (Falling back to default.)" << std::endl;
        }
    }

    toRet.isVerbose = (getenv("QSHARD_VERBOSE") != NULL);
#endif

    return toRet;
}

} // namespace Qshard
