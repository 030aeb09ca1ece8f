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

#include "amplitude_store.hpp"

#include <string>

namespace Qshard {

template <typename FP>
AmplitudeStore<FP>::AmplitudeStore(bitLenInt qBitCount, bitLenInt shardPower, bool isShared)
    : qubitCount(qBitCount)
    , shardPow(shardPower)
{
    if (qBitCount >= (bitsInByte * sizeof(bitCapIntOcl))) {
        throw std::invalid_argument("AmplitudeStore qubit count exceeds the addressable index width!");
    }
    if (shardPower > qBitCount) {
        throw std::invalid_argument("AmplitudeStore shard power cannot exceed qubit count!");
    }

    localQubitCount = qubitCount - shardPow;
    maxQPowerOcl = pow2Ocl(qubitCount);
    stateVec = std::make_shared<StateVectorArray<FP>>(maxQPowerOcl, isShared);
    SetPermutation(0U);
}

template <typename FP> void AmplitudeStore<FP>::SetPermutation(bitCapIntOcl perm)
{
    if (perm >= maxQPowerOcl) {
        throw DimensionMismatch("AmplitudeStore::SetPermutation() basis state " + std::to_string(perm) +
            " is out of range for " + std::to_string((int)qubitCount) + " qubits!");
    }

    stateVec->clear();
    stateVec->write(perm, std::complex<FP>((FP)ONE_R1_F, (FP)ZERO_R1_F));
}

template <typename FP> void AmplitudeStore<FP>::SetQuantumState(const std::vector<complex>& state)
{
    if (state.size() != maxQPowerOcl) {
        throw DimensionMismatch("AmplitudeStore::SetQuantumState() vector length " + std::to_string(state.size()) +
            " does not match 2^" + std::to_string((int)qubitCount) + "!");
    }

    stateVec->copy_in(state.data());
}

template <typename FP> std::vector<complex> AmplitudeStore<FP>::GetQuantumState()
{
    std::vector<complex> toRet(maxQPowerOcl);
    stateVec->copy_out(toRet.data());

    return toRet;
}

template <typename FP> StateShard<FP> AmplitudeStore<FP>::ShardView(bitCapIntOcl shard)
{
    if (shard >= GetShardCount()) {
        throw std::invalid_argument("AmplitudeStore::ShardView() shard index out-of-bounds!");
    }

    return StateShard<FP>(stateVec->amplitudes.get() + (shard << localQubitCount), shard, localQubitCount);
}

template <typename FP> real1_f AmplitudeStore<FP>::Norm()
{
    const unsigned numCores = stateVec->GetConcurrencyLevel();
    std::unique_ptr<real1_f[]> nrmPart(new real1_f[numCores]());
    const std::complex<FP>* amps = stateVec->amplitudes.get();
    stateVec->par_for(0U, maxQPowerOcl, [&nrmPart, amps](const bitCapIntOcl& lcv, const unsigned& cpu) {
        nrmPart[cpu] += (real1_f)norm(amps[lcv]);
    });

    real1_f nrm = ZERO_R1_F;
    for (unsigned i = 0U; i < numCores; ++i) {
        nrm += nrmPart[i];
    }

    return nrm;
}

template class AmplitudeStore<float>;
template class AmplitudeStore<double>;

} // namespace Qshard
