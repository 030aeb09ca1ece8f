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

#include <atomic>
#include <iostream>
#include <new>
#include <stdio.h>
#include <stdlib.h>

#if ENABLE_PROCESS_SHARDS
#include <sys/mman.h>
#endif

#include "catch.hpp"

#include "tests.hpp"

using namespace Qshard;

#define EPSILON 0.01f
#define REQUIRE_FLOAT(A, B)                                                                                            \
    do {                                                                                                               \
        real1_f __tmp_a = A;                                                                                           \
        real1_f __tmp_b = B;                                                                                           \
        REQUIRE(__tmp_a < (__tmp_b + EPSILON));                                                                        \
        REQUIRE(__tmp_a > (__tmp_b - EPSILON));                                                                        \
    } while (0);
#define REQUIRE_CMPLX(A, B)                                                                                            \
    do {                                                                                                               \
        complex __tmp_a = A;                                                                                           \
        complex __tmp_b = B;                                                                                           \
        REQUIRE(std::norm(__tmp_a - __tmp_b) < EPSILON);                                                               \
    } while (0);

#define C_SQRT1_2 complex(SQRT1_2_R1, ZERO_R1_F)
#define C_HALF complex(HALF_R1_F, ZERO_R1_F)

/*
 * A one qubit gate whose unitary cannot be produced
 */
class ThrowingGate : public QGate {
public:
    ThrowingGate()
        : QGate("boom", 1U)
    {
    }

    bool HasUnitary() { return true; }
    std::vector<complex> GetUnitary() { throw std::runtime_error("boom: unitary unavailable"); }
};

/*
 * A one qubit gate that throws something other than a std::exception
 */
class OddThrowGate : public QGate {
public:
    OddThrowGate()
        : QGate("odd", 1U)
    {
    }

    bool HasUnitary() { return true; }
    std::vector<complex> GetUnitary() { throw 42; }
};

/*
 * Identity, except that the second worker to ask for its unitary fails. The call counter lives in a shared
 * anonymous mapping, so forked workers count together.
 */
class FlakyGate : public QGate {
protected:
    std::atomic<int>* calls;

public:
    FlakyGate()
        : QGate("flaky", 1U)
        , calls(NULL)
    {
#if ENABLE_PROCESS_SHARDS
        void* region = mmap(NULL, sizeof(std::atomic<int>), PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
        if (region == MAP_FAILED) {
            throw std::runtime_error("FlakyGate could not map its call counter!");
        }
        calls = new (region) std::atomic<int>(0);
#else
        calls = new std::atomic<int>(0);
#endif
    }

    ~FlakyGate()
    {
#if ENABLE_PROCESS_SHARDS
        munmap(calls, sizeof(std::atomic<int>));
#else
        delete calls;
#endif
    }

    bool HasUnitary() { return true; }
    std::vector<complex> GetUnitary()
    {
        if ((*calls)++ == 1) {
            throw std::runtime_error("flaky: second caller");
        }
        return { ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, ONE_CMPLX };
    }
};

static std::vector<real1_f> Probabilities(const std::vector<complex>& state)
{
    std::vector<real1_f> toRet(state.size());
    for (size_t i = 0U; i < state.size(); ++i) {
        toRet[i] = std::norm(state[i]);
    }
    return toRet;
}

/*
 * Every kind of 1 and 2 qubit operation, over 5 qubits, including pairs where both bits select a shard once the
 * register is split 8 ways.
 */
static void ApplyScrambler(QShardEnginePtr qReg)
{
    const QGatePtr h = std::make_shared<HPowGate>();
    const QGatePtr cnot = std::make_shared<CNotPowGate>();
    const QGatePtr cz = std::make_shared<CZPowGate>();
    const real1_f c = cos(0.4);
    const real1_f s = sin(0.4);
    const QGatePtr rot = std::make_shared<MatrixGate>("rot", 1U,
        std::vector<complex>{ complex(c, ZERO_R1_F), complex(-s, ZERO_R1_F), complex(s, ZERO_R1_F),
            complex(c, ZERO_R1_F) });

    qReg->ApplyMoment({ QBoundOp(h, { 0U }), QBoundOp(h, { 1U }), QBoundOp(h, { 2U }), QBoundOp(h, { 3U }),
        QBoundOp(h, { 4U }) });
    qReg->ApplyMoment({ QBoundOp(cnot, { 4U, 0U }), QBoundOp(cz, { 3U, 1U }),
        QBoundOp(std::make_shared<YPowGate>(0.7), { 2U }) });
    qReg->ApplyMoment({ QBoundOp(cnot, { 4U, 2U }), QBoundOp(std::make_shared<XPowGate>(0.3), { 0U }),
        QBoundOp(std::make_shared<HPowGate>(0.5), { 1U }) });
    qReg->ApplyMoment({ QBoundOp(std::make_shared<SwapPowGate>(), { 1U, 3U }),
        QBoundOp(std::make_shared<CNotPowGate>(0.5), { 0U, 4U }), QBoundOp(std::make_shared<ZPowGate>(0.25), { 2U }) });
    qReg->ApplyMoment({ QBoundOp(std::make_shared<SwapPowGate>(0.5), { 2U, 3U }), QBoundOp(rot, { 4U }),
        QBoundOp(std::make_shared<CZPowGate>(0.75), { 1U, 0U }) });
    qReg->ApplyMoment({ QBoundOp(std::make_shared<CNotPowGate>(), { 3U, 4U }), QBoundOp(cnot, { 0U, 2U }) });
}

TEST_CASE("test_par_for")
{
    ParallelFor par;

    const int NUM_ENTRIES = 2000;
    std::atomic_bool hit[NUM_ENTRIES];
    std::atomic_int calls;

    calls.store(0);

    for (int i = 0; i < NUM_ENTRIES; i++) {
        hit[i].store(false);
    }

    par.par_for(0, NUM_ENTRIES, [&](const bitCapIntOcl& lcv, const unsigned& cpu) {
        bool old = true;
        old = hit[lcv].exchange(old);
        REQUIRE(old == false);
        calls++;
    });

    REQUIRE(calls.load() == NUM_ENTRIES);

    for (int i = 0; i < NUM_ENTRIES; i++) {
        REQUIRE(hit[i].load() == true);
    }
}

TEST_CASE("test_par_for_skip")
{
    ParallelFor par;

    const int NUM_ENTRIES = 2000;
    const int NUM_CALLS = 1000;

    std::atomic_bool hit[NUM_ENTRIES];
    std::atomic_int calls;

    calls.store(0);

    int skipBit = 0x4; // Skip 0b100 when counting upwards.

    for (int i = 0; i < NUM_ENTRIES; i++) {
        hit[i].store(false);
    }

    par.par_for_skip(0, NUM_ENTRIES, 4, 1, [&](const bitCapIntOcl& lcv, const unsigned& cpu) {
        bool old = true;
        old = hit[lcv].exchange(old);
        REQUIRE(old == false);
        REQUIRE((lcv & skipBit) == 0);

        calls++;
    });

    REQUIRE(calls.load() == NUM_CALLS);
}

TEST_CASE("test_par_for_mask")
{
    ParallelFor par;

    const int NUM_ENTRIES = 2000;

    std::atomic_bool hit[NUM_ENTRIES];
    std::atomic_int calls;

    const std::vector<bitCapIntOcl> skipArray{ 0x4, 0x100 }; // Skip bits 0b100000100
    int NUM_SKIP = skipArray.size();

    calls.store(0);

    for (int i = 0; i < NUM_ENTRIES; i++) {
        hit[i].store(false);
    }

    par.SetConcurrencyLevel(1);

    par.par_for_mask(0, NUM_ENTRIES, skipArray, [&](const bitCapIntOcl& lcv, const unsigned& cpu) {
        bool old = true;
        old = hit[lcv].exchange(old);
        REQUIRE(old == false);
        for (int i = 0; i < NUM_SKIP; i++) {
            REQUIRE((lcv & skipArray[i]) == 0);
        }
        calls++;
    });

    REQUIRE(calls.load() == (NUM_ENTRIES >> NUM_SKIP));
}

TEST_CASE("test_concurrency_level")
{
    ParallelFor par;
    par.SetConcurrencyLevel(0U);
    REQUIRE(par.GetConcurrencyLevel() == 1U);
    par.SetConcurrencyLevel(3U);
    REQUIRE(par.GetConcurrencyLevel() == 3U);
}

TEST_CASE("test_insert_zero_bit")
{
    REQUIRE(insertZeroBitOcl(0x0BU, 2U) == 0x13U);
    REQUIRE(insertZeroBitOcl(0x0BU, 0U) == 0x16U);
    REQUIRE(insertZeroBitOcl(0x0BU, 4U) == 0x0BU);
}

TEST_CASE("test_shard_count_for")
{
    REQUIRE(ShardCountFor(10U, 4U, 10U) == 4U);
    REQUIRE(ShardCountFor(9U, 4U, 10U) == 1U);
    // Rounded down to a power of two
    REQUIRE(ShardCountFor(10U, 6U, 2U) == 4U);
    // At least 2 local bits per shard
    REQUIRE(ShardCountFor(3U, 64U, 2U) == 2U);
    REQUIRE(ShardCountFor(4U, 64U, 2U) == 4U);
    REQUIRE(ShardCountFor(2U, 4U, 0U) == 1U);
    REQUIRE(ShardCountFor(12U, 1U, 2U) == 1U);
}

TEST_CASE("test_amplitude_store")
{
    AmplitudeStore<double> store(4U, 2U);

    REQUIRE(store.GetShardCount() == 4U);
    REQUIRE(store.GetLocalQubitCount() == 2U);
    REQUIRE_FLOAT(store.Norm(), ONE_R1_F);

    store.SetPermutation(5U);
    std::vector<complex> state = store.GetQuantumState();
    REQUIRE(state.size() == 16U);
    REQUIRE_CMPLX(state[5U], ONE_CMPLX);
    REQUIRE_CMPLX(state[0U], ZERO_CMPLX);

    // Index 5 = 0b01|01 lands at local index 1 of shard 1.
    const StateShard<double> shard = store.ShardView(1U);
    REQUIRE(shard.shardId == 1U);
    REQUIRE(shard.length == 4U);
    REQUIRE_CMPLX((complex)shard.amplitudes[1U], ONE_CMPLX);

    REQUIRE_THROWS_AS(store.SetPermutation(16U), DimensionMismatch);
    REQUIRE_THROWS_AS(store.SetQuantumState(std::vector<complex>(8U, ZERO_CMPLX)), DimensionMismatch);
    REQUIRE_THROWS_AS(store.ShardView(4U), std::invalid_argument);
}

TEST_CASE("test_amplitude_store_single_precision")
{
    AmplitudeStore<float> store(3U, 1U);

    std::vector<complex> state(8U, complex(ONE_R1_F / sqrt(8.0), ZERO_R1_F));
    state[7U] = -state[7U];
    store.SetQuantumState(state);

    REQUIRE_THAT(store.GetQuantumState(), HasAmplitudes(state));
    REQUIRE_FLOAT(store.Norm(), ONE_R1_F);
}

TEST_CASE_METHOD(QShardTestFixture, "test_engine_construction")
{
    QShardEnginePtr qReg = MakeEngine(3U);
    REQUIRE(qReg->GetQubitCount() == 3U);
    REQUIRE(qReg->GetShardCount() == ShardCountFor(3U, testShardCount, 3U));
    REQUIRE(qReg->GetPrecision() == testPrecision);
    REQUIRE(qReg->GetExecutionMode() == testExecMode);

    REQUIRE_THROWS_AS(
        CreateShardEngine(testPrecision, (bitLenInt)4U, (bitCapIntOcl)3U, testExecMode, false), std::invalid_argument);
    REQUIRE_THROWS_AS(
        CreateShardEngine(testPrecision, (bitLenInt)4U, (bitCapIntOcl)8U, testExecMode, false), std::invalid_argument);
}

TEST_CASE_METHOD(QShardTestFixture, "test_set_permutation")
{
    QShardEnginePtr qReg = MakeEngine(4U);

    qReg->SetPermutation(0x0AU);
    const std::vector<complex> state = qReg->GetQuantumState();
    for (size_t i = 0U; i < state.size(); ++i) {
        REQUIRE_CMPLX(state[i], (i == 0x0AU) ? ONE_CMPLX : ZERO_CMPLX);
    }

    REQUIRE_THROWS_AS(qReg->SetPermutation(16U), DimensionMismatch);
    REQUIRE_THROWS_AS(qReg->SetQuantumState(std::vector<complex>(15U, ZERO_CMPLX)), DimensionMismatch);
}

TEST_CASE_METHOD(QShardTestFixture, "test_x")
{
    QShardEnginePtr qReg = MakeEngine(4U);
    const QGatePtr x = std::make_shared<XPowGate>();

    qReg->ApplyMoment({ QBoundOp(x, { 0U }), QBoundOp(x, { 3U }) });
    REQUIRE_CMPLX(qReg->GetQuantumState()[0x09U], ONE_CMPLX);

    qReg->ApplyMoment({ QBoundOp(x, { 3U }) });
    REQUIRE_CMPLX(qReg->GetQuantumState()[0x01U], ONE_CMPLX);
}

TEST_CASE_METHOD(QShardTestFixture, "test_ghz_across_shards")
{
    QShardEnginePtr qReg = CreateShardEngine(testPrecision, (bitLenInt)4U, (bitCapIntOcl)4U, testExecMode, false);
    const QGatePtr cnot = std::make_shared<CNotPowGate>();

    qReg->ApplyMoment({ QBoundOp(std::make_shared<HPowGate>(), { 3U }) });
    qReg->ApplyMoment({ QBoundOp(cnot, { 3U, 2U }) });
    qReg->ApplyMoment({ QBoundOp(cnot, { 2U, 1U }) });
    qReg->ApplyMoment({ QBoundOp(cnot, { 1U, 0U }) });

    std::vector<complex> expected(16U, ZERO_CMPLX);
    expected[0x00U] = C_SQRT1_2;
    expected[0x0FU] = C_SQRT1_2;
    REQUIRE_THAT(qReg->GetQuantumState(), HasAmplitudes(expected));
}

TEST_CASE_METHOD(QShardTestFixture, "test_sharded_matches_unsharded")
{
    QShardEnginePtr single = CreateShardEngine(testPrecision, (bitLenInt)5U, (bitCapIntOcl)1U, testExecMode, false);
    ApplyScrambler(single);

    for (bitCapIntOcl shards = 2U; shards <= 8U; shards <<= 1U) {
        QShardEnginePtr sharded = CreateShardEngine(testPrecision, (bitLenInt)5U, shards, testExecMode, false);
        REQUIRE(sharded->GetShardCount() == shards);
        ApplyScrambler(sharded);
        REQUIRE_THAT(sharded->GetQuantumState(), HasAmplitudes(single->GetQuantumState()));
    }
}

TEST_CASE_METHOD(QShardTestFixture, "test_norm_preserved")
{
    QShardEnginePtr qReg = CreateShardEngine(testPrecision, (bitLenInt)5U, (bitCapIntOcl)8U, testExecMode, false);
    qReg->SetPermutation(0x13U);
    ApplyScrambler(qReg);
    REQUIRE_FLOAT(qReg->GetNorm(), ONE_R1_F);
}

TEST_CASE_METHOD(QShardTestFixture, "test_apply_moment_validation")
{
    QShardEnginePtr qReg = MakeEngine(4U);
    const QGatePtr x = std::make_shared<XPowGate>();

    REQUIRE_THROWS_AS(qReg->ApplyMoment({ QBoundOp(x, { 1U }), QBoundOp(x, { 1U }) }), std::invalid_argument);
    REQUIRE_THROWS_AS(qReg->ApplyMoment({ QBoundOp(x, { 4U }) }), std::invalid_argument);
    REQUIRE_THROWS_AS(
        qReg->ApplyMoment({ QBoundOp(std::make_shared<MeasurementGate>("m"), { 0U }) }), std::invalid_argument);

    // Rejected up front, so the register is untouched.
    REQUIRE(!qReg->IsPoisoned());
    REQUIRE_CMPLX(qReg->GetQuantumState()[0U], ONE_CMPLX);
}

TEST_CASE_METHOD(QShardTestFixture, "test_matrix_dimension_mismatch")
{
    REQUIRE_THROWS_AS(std::make_shared<MatrixGate>("bad", 1U, std::vector<complex>(3U, ONE_CMPLX)), DimensionMismatch);

    QShardEnginePtr qReg = MakeEngine(2U);
    // A gate that reports a 2 qubit unitary of the wrong size
    class ShortGate : public QGate {
    public:
        ShortGate()
            : QGate("short", 2U)
        {
        }
        bool HasUnitary() { return true; }
        std::vector<complex> GetUnitary() { return { ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX, ONE_CMPLX }; }
    };

    REQUIRE_THROWS_AS(qReg->ApplyMoment({ QBoundOp(std::make_shared<ShortGate>(), { 1U, 0U }) }), WorkerFailure);
    REQUIRE(qReg->IsPoisoned());
}

TEST_CASE_METHOD(QShardTestFixture, "test_worker_failure")
{
    QShardEnginePtr qReg = CreateShardEngine(testPrecision, (bitLenInt)4U, (bitCapIntOcl)4U, testExecMode, false);

    REQUIRE_THROWS_WITH(
        qReg->ApplyMoment({ QBoundOp(std::make_shared<ThrowingGate>(), { 3U }) }), Catch::Contains("boom"));
    REQUIRE(qReg->IsPoisoned());
    REQUIRE_THROWS_AS(qReg->GetQuantumState(), std::logic_error);
    REQUIRE_THROWS_AS(qReg->ApplyMoment({ QBoundOp(std::make_shared<XPowGate>(), { 0U }) }), std::logic_error);
}

TEST_CASE_METHOD(QShardTestFixture, "test_worker_failure_non_standard")
{
    QShardEnginePtr qReg = CreateShardEngine(testPrecision, (bitLenInt)4U, (bitCapIntOcl)4U, testExecMode, false);

    REQUIRE_THROWS_WITH(qReg->ApplyMoment({ QBoundOp(std::make_shared<OddThrowGate>(), { 3U }) }),
        Catch::Contains("non-standard exception"));
    REQUIRE(qReg->IsPoisoned());
}

TEST_CASE_METHOD(QShardTestFixture, "test_worker_failure_releases_partners")
{
    QShardEnginePtr qReg = CreateShardEngine(testPrecision, (bitLenInt)4U, (bitCapIntOcl)4U, testExecMode, false);
    REQUIRE(qReg->GetShardCount() == 4U);

    // Bit 3 selects the shard, so every healthy worker waits on its partner for an exchange.
    REQUIRE_THROWS_WITH(qReg->ApplyMoment({ QBoundOp(std::make_shared<FlakyGate>(), { 3U }) }),
        Catch::Contains("flaky: second caller"));
    REQUIRE(qReg->IsPoisoned());
    REQUIRE_THROWS_AS(qReg->GetQuantumState(), std::logic_error);
}

TEST_CASE_METHOD(QShardTestFixture, "test_prob_marginal")
{
    QShardEnginePtr qReg = MakeEngine(3U);

    // bit 1 set, bit 0 clear
    qReg->SetPermutation(0x02U);
    std::vector<real1_f> probs = qReg->ProbMarginal({ 0U, 1U });
    REQUIRE(probs.size() == 4U);
    // The first listed bit is the most significant bit of the outcome.
    REQUIRE_FLOAT(probs[1U], ONE_R1_F);
    probs = qReg->ProbMarginal({ 1U, 0U });
    REQUIRE_FLOAT(probs[2U], ONE_R1_F);

    qReg->SetPermutation(0U);
    qReg->ApplyMoment({ QBoundOp(std::make_shared<HPowGate>(), { 2U }) });
    qReg->ApplyMoment({ QBoundOp(std::make_shared<CNotPowGate>(), { 2U, 0U }) });
    probs = qReg->ProbMarginal({ 2U, 0U });
    REQUIRE_FLOAT(probs[0U], HALF_R1_F);
    REQUIRE_FLOAT(probs[1U], ZERO_R1_F);
    REQUIRE_FLOAT(probs[2U], ZERO_R1_F);
    REQUIRE_FLOAT(probs[3U], HALF_R1_F);
    probs = qReg->ProbMarginal({ 1U });
    REQUIRE_FLOAT(probs[0U], ONE_R1_F);

    REQUIRE_THROWS_AS(qReg->ProbMarginal({ 0U, 0U }), std::invalid_argument);
    REQUIRE_THROWS_AS(qReg->ProbMarginal({ 3U }), std::invalid_argument);
}

TEST_CASE_METHOD(QShardTestFixture, "test_force_m")
{
    QShardEnginePtr qReg = MakeEngine(3U);

    qReg->ApplyMoment({ QBoundOp(std::make_shared<HPowGate>(), { 0U }) });
    REQUIRE_FLOAT(qReg->ForceM({ 0U }, { true }), HALF_R1_F);

    const std::vector<complex> state = qReg->GetQuantumState();
    REQUIRE_FLOAT(std::norm(state[1U]), ONE_R1_F);
    REQUIRE_FLOAT(qReg->GetNorm(), ONE_R1_F);

    REQUIRE_THROWS_AS(qReg->ForceM({ 0U }, { false }), DegenerateMeasurement);
    REQUIRE_THROWS_AS(qReg->ForceM({ 0U, 1U }, { true }), std::invalid_argument);
}

TEST_CASE_METHOD(QShardTestFixture, "test_m")
{
    QShardEnginePtr qReg = MakeEngine(3U);

    qReg->SetPermutation(0x05U);
    const std::vector<bool> result = qReg->M({ 2U, 1U, 0U }, *rng);
    REQUIRE(result.size() == 3U);
    REQUIRE(result[0U]);
    REQUIRE(!result[1U]);
    REQUIRE(result[2U]);

    qReg->ApplyMoment({ QBoundOp(std::make_shared<HPowGate>(), { 1U }) });
    const bool first = qReg->M({ 1U }, *rng)[0U];
    for (int i = 0; i < 10; ++i) {
        REQUIRE(qReg->M({ 1U }, *rng)[0U] == first);
    }
}

TEST_CASE_METHOD(QShardTestFixture, "test_degenerate_measurement")
{
    QShardEnginePtr qReg = MakeEngine(3U);
    qReg->SetQuantumState(std::vector<complex>(8U, ZERO_CMPLX));
    REQUIRE_THROWS_AS(qReg->M({ 0U }, *rng), DegenerateMeasurement);
}

TEST_CASE("test_param_resolver")
{
    std::map<std::string, real1_f> values;
    values["x"] = 0.25;
    const ParamResolver resolver(values);

    REQUIRE(resolver.Contains("x"));
    REQUIRE(!resolver.Contains("y"));
    REQUIRE_FLOAT(resolver.Lookup("x"), 0.25);
    REQUIRE_THROWS_AS(resolver.Lookup("y"), UnresolvedSymbol);

    const QParam scaled("x", 2.0);
    REQUIRE(scaled.IsSymbol());
    REQUIRE_THROWS_AS(scaled.GetValue(), UnresolvedSymbol);
    REQUIRE_FLOAT(scaled.Resolve(resolver).GetValue(), HALF_R1_F);
    REQUIRE_FLOAT(QParam(0.75).Resolve(ParamResolver()).GetValue(), 0.75);
    REQUIRE_FLOAT((QParam("x") * -ONE_R1_F).Resolve(resolver).GetValue(), -0.25);
}

TEST_CASE("test_sweeps")
{
    const QSweep points = SweepPoints("x", { 0.0, 0.5, 1.0 });
    REQUIRE(points.size() == 3U);
    REQUIRE_FLOAT(points[1U].Lookup("x"), HALF_R1_F);

    const QSweep line = SweepLinspace("y", 0.0, 1.0, 5U);
    REQUIRE(line.size() == 5U);
    REQUIRE_FLOAT(line[1U].Lookup("y"), 0.25);
    REQUIRE_FLOAT(line[4U].Lookup("y"), ONE_R1_F);
    REQUIRE(SweepLinspace("y", 0.0, 1.0, 0U).empty());

    const QSweep product = SweepProduct(points, line);
    REQUIRE(product.size() == 15U);
    // The right-hand sweep varies fastest.
    REQUIRE_FLOAT(product[1U].Lookup("x"), ZERO_R1_F);
    REQUIRE_FLOAT(product[1U].Lookup("y"), 0.25);
    REQUIRE_FLOAT(product[5U].Lookup("x"), HALF_R1_F);

    REQUIRE_THROWS_AS(SweepProduct(points, points), std::invalid_argument);
}

TEST_CASE("test_eigen_pow_gates")
{
    QGatePtr x = std::make_shared<XPowGate>();
    std::vector<complex> u = x->GetUnitary();
    REQUIRE_CMPLX(u[0U], ZERO_CMPLX);
    REQUIRE_CMPLX(u[1U], ONE_CMPLX);
    REQUIRE_CMPLX(u[2U], ONE_CMPLX);
    REQUIRE_CMPLX(u[3U], ZERO_CMPLX);

    // S = Z^0.5
    u = std::make_shared<ZPowGate>(0.5)->GetUnitary();
    REQUIRE_CMPLX(u[0U], ONE_CMPLX);
    REQUIRE_CMPLX(u[3U], I_CMPLX);

    u = std::make_shared<HPowGate>()->GetUnitary();
    REQUIRE_CMPLX(u[0U], C_SQRT1_2);
    REQUIRE_CMPLX(u[1U], C_SQRT1_2);
    REQUIRE_CMPLX(u[3U], -C_SQRT1_2);

    // sqrt(X) squared is X.
    std::shared_ptr<EigenPowGate> sqrtX = std::make_shared<XPowGate>(0.5);
    const std::vector<complex> half = sqrtX->GetUnitary();
    REQUIRE_CMPLX(half[0U] * half[1U] + half[1U] * half[3U], ONE_CMPLX);
    REQUIRE_CMPLX(half[0U] * half[0U] + half[1U] * half[2U], ZERO_CMPLX);

    u = std::make_shared<CNotPowGate>()->GetUnitary();
    REQUIRE(u.size() == 16U);
    REQUIRE_CMPLX(u[0U], ONE_CMPLX);
    REQUIRE_CMPLX(u[5U], ONE_CMPLX);
    REQUIRE_CMPLX(u[11U], ONE_CMPLX);
    REQUIRE_CMPLX(u[14U], ONE_CMPLX);
    REQUIRE_CMPLX(u[10U], ZERO_CMPLX);

    u = std::make_shared<SwapPowGate>()->GetUnitary();
    REQUIRE_CMPLX(u[6U], ONE_CMPLX);
    REQUIRE_CMPLX(u[9U], ONE_CMPLX);
    REQUIRE_CMPLX(u[5U], ZERO_CMPLX);

    REQUIRE(sqrtX->GetName() == "X**0.5");
    REQUIRE(std::make_shared<XPowGate>(QParam("t"))->GetName() == "X**t");
    REQUIRE(std::make_shared<XPowGate>()->GetName() == "X");
    REQUIRE_THROWS_AS(std::make_shared<XPowGate>(QParam("t"))->GetUnitary(), UnresolvedSymbol);
}

TEST_CASE("test_gate_inverse")
{
    QGatePtr t = std::make_shared<ZPowGate>(0.25);
    const std::vector<complex> u = t->GetUnitary();
    const std::vector<complex> uInv = t->Inverse()->GetUnitary();
    REQUIRE_CMPLX(u[3U] * uInv[3U], ONE_CMPLX);

    const QGatePtr m = std::make_shared<MatrixGate>(
        "iswap_ish", 1U, std::vector<complex>{ ZERO_CMPLX, I_CMPLX, I_CMPLX, ZERO_CMPLX });
    const std::vector<complex> mInv = m->Inverse()->GetUnitary();
    REQUIRE_CMPLX(mInv[1U], -I_CMPLX);
    REQUIRE_CMPLX(mInv[2U], -I_CMPLX);

    REQUIRE_THROWS_AS(std::make_shared<MeasurementGate>("m")->Inverse(), UnsupportedOperation);
}

TEST_CASE("test_pauli")
{
    REQUIRE(PauliCycleIndex(PauliX) == 0);
    REQUIRE(PauliCycleIndex(PauliZ) == 2);
    REQUIRE_THROWS_AS(PauliCycleIndex(PauliI), std::invalid_argument);

    REQUIRE(PauliByIndex(4) == PauliY);
    REQUIRE(PauliByIndex(-1) == PauliZ);
    REQUIRE(PauliByRelativeIndex(PauliZ, 1) == PauliX);
    REQUIRE(PauliByRelativeIndex(PauliX, -1) == PauliZ);

    REQUIRE(PauliRelativeIndex(PauliX, PauliY) == -1);
    REQUIRE(PauliRelativeIndex(PauliY, PauliX) == 1);
    REQUIRE(PauliRelativeIndex(PauliZ, PauliZ) == 0);

    REQUIRE(PauliThird(PauliX, PauliY) == PauliZ);
    REQUIRE(PauliThird(PauliZ, PauliY) == PauliX);
    REQUIRE(PauliThird(PauliY, PauliY) == PauliY);

    REQUIRE(PauliCycleLess(PauliX, PauliY));
    REQUIRE(PauliCycleLess(PauliZ, PauliX));
    REQUIRE(!PauliCycleLess(PauliY, PauliX));

    REQUIRE(PauliCommutes(PauliX, PauliX));
    REQUIRE(!PauliCommutes(PauliX, PauliZ));

    const std::vector<complex> y = MakePauliGate(PauliY)->GetUnitary();
    REQUIRE_CMPLX(y[1U], -I_CMPLX);
    REQUIRE_CMPLX(y[2U], I_CMPLX);
    const std::vector<complex> id = MakePauliGate(PauliI)->GetUnitary();
    REQUIRE_CMPLX(id[0U], ONE_CMPLX);
    REQUIRE_CMPLX(id[3U], ONE_CMPLX);
}

TEST_CASE("test_operation_validation")
{
    const QGatePtr cz = std::make_shared<CZPowGate>();
    const Qubit a("a");
    const Qubit b("b");

    REQUIRE_THROWS_AS(QOperation(cz, { a }), std::invalid_argument);
    REQUIRE_THROWS_AS(QOperation(cz, { a, a }), std::invalid_argument);
    REQUIRE_THROWS_AS(QOperation(QGatePtr(), { a }), std::invalid_argument);
    REQUIRE(QOperation(cz, { a, b }).qubits.size() == 2U);
}

TEST_CASE("test_circuit_structure")
{
    const Qubit a("a");
    const Qubit b("b");
    const QGatePtr h = std::make_shared<HPowGate>();

    QCircuit circuit;
    circuit.AppendOperation(QOperation(h, { a }));
    circuit.AppendOperation(QOperation(h, { b }));
    // Shares "a" with the open moment
    circuit.AppendOperation(QOperation(std::make_shared<CZPowGate>(), { a, b }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("ab", 2U), { a, b }));

    REQUIRE(circuit.GetMomentCount() == 3U);
    REQUIRE(circuit.GetMoments()[0U].operations.size() == 2U);
    REQUIRE(circuit.GetQubits().size() == 2U);
    REQUIRE(circuit.GetMeasurementKeys() == std::vector<std::string>{ "ab" });
    REQUIRE(!circuit.IsParameterized());

    QMoment overlapping;
    overlapping.AppendOperation(QOperation(h, { a }));
    overlapping.AppendOperation(QOperation(std::make_shared<XPowGate>(), { a }));
    REQUIRE_THROWS_AS(overlapping.Validate(), std::invalid_argument);

    QCircuit twice;
    twice.AppendOperation(QOperation(std::make_shared<MeasurementGate>("k"), { a }));
    twice.AppendOperation(QOperation(std::make_shared<MeasurementGate>("k"), { b }));
    REQUIRE_THROWS_AS(twice.GetMeasurementKeys(), std::invalid_argument);
}

TEST_CASE("test_qubit_order")
{
    const Qubit a("a");
    const Qubit b("b");
    const Qubit c("c");
    const QubitSet used{ c, a, b };

    std::vector<Qubit> ordered = QubitOrder().OrderFor(used);
    REQUIRE(ordered == std::vector<Qubit>({ a, b, c }));

    ordered = QubitOrder(std::vector<Qubit>{ c }).OrderFor(used);
    REQUIRE(ordered == std::vector<Qubit>({ c, a, b }));

    QubitLess reversed = [](const Qubit& l, const Qubit& r) { return l.GetId() > r.GetId(); };
    ordered = QubitOrder(reversed).OrderFor(used);
    REQUIRE(ordered == std::vector<Qubit>({ c, b, a }));

    // Listed qubits stay, even when unused.
    ordered = QubitOrder(std::vector<Qubit>{ Qubit("z") }).OrderFor(used);
    REQUIRE(ordered.size() == 4U);

    const QubitBitMap bitMap = QubitOrder::BitMapFor({ a, b, c });
    REQUIRE(bitMap.at(a) == 2U);
    REQUIRE(bitMap.at(c) == 0U);

    REQUIRE_THROWS_AS(QubitOrder(std::vector<Qubit>{ a, a }), std::invalid_argument);
}

TEST_CASE("test_expand")
{
    const Qubit a("a");
    const Qubit b("b");
    const Qubit c("c");

    const std::vector<QOperation> expanded =
        GateApplicator::Expand(QOperation(std::make_shared<CCXPowGate>(), { a, b, c }), 8U);
    REQUIRE(expanded.size() > 3U);
    for (const QOperation& op : expanded) {
        REQUIRE(op.gate->HasUnitary());
        REQUIRE(op.gate->GetQubitCount() <= 2U);
    }

    REQUIRE_THROWS_AS(
        GateApplicator::Expand(QOperation(std::make_shared<QGate>("opaque", 1U), { a }), 8U), UnsupportedOperation);
    REQUIRE_THROWS_AS(GateApplicator::Expand(QOperation(std::make_shared<MatrixGate>("big", 3U,
                                                             std::vector<complex>(64U, ZERO_CMPLX)),
                                                 { a, b, c }),
                          8U),
        UnsupportedOperation);

    std::shared_ptr<DecomposedGate> loop;
    loop = std::make_shared<DecomposedGate>(
        "loop", 1U, [&loop](const std::vector<Qubit>& q) { return std::vector<QOperation>{ QOperation(loop, q) }; });
    REQUIRE_THROWS_AS(GateApplicator::Expand(QOperation(loop, { a }), 8U), DecompositionCycle);

    QubitBitMap bitMap;
    bitMap[a] = 0U;
    REQUIRE_THROWS_AS(GateApplicator::Bind(QOperation(std::make_shared<XPowGate>(), { b }), bitMap),
        std::invalid_argument);
}

TEST_CASE_METHOD(QShardTestFixture, "test_ccz_ccx")
{
    const Qubit a("a");
    const Qubit b("b");
    const Qubit c("c");
    QSimulator sim(config);

    QCircuit ccz;
    ccz.AppendOperation(QOperation(std::make_shared<CCZPowGate>(), { a, b, c }));

    const std::vector<complex> uniform(8U, complex(ONE_R1_F / sqrt(8.0), ZERO_R1_F));
    std::vector<complex> expected(uniform);
    expected[7U] = -expected[7U];
    TrialResult result = sim.Simulate(ccz, ParamResolver(), QubitOrder(), QInitialState(uniform));
    REQUIRE_THAT(*(result.finalState), HasAmplitudes(expected));

    QCircuit ccx;
    ccx.AppendOperation(QOperation(std::make_shared<CCXPowGate>(), { a, b, c }));

    result = sim.Simulate(ccx, ParamResolver(), QubitOrder(), QInitialState((bitCapIntOcl)0x06U));
    REQUIRE_FLOAT(std::norm((*result.finalState)[7U]), ONE_R1_F);

    result = sim.Simulate(ccx, ParamResolver(), QubitOrder(), QInitialState((bitCapIntOcl)0x04U));
    REQUIRE_FLOAT(std::norm((*result.finalState)[4U]), ONE_R1_F);
}

TEST_CASE_METHOD(QShardTestFixture, "test_decomposed_gates_on_shard_bits")
{
    const Qubit a("a");
    const Qubit b("b");
    const Qubit c("c");
    const Qubit d("d");
    QSimulator sim(config);

    // "c" first, so the target is the most significant bit, and selects a shard once the register is split.
    const QubitOrder targetHigh(std::vector<Qubit>{ c, a, b, d });

    QCircuit ccz;
    ccz.AppendOperation(QOperation(std::make_shared<CCZPowGate>(HALF_R1_F), { a, b, c }));
    ccz.AppendOperation(QOperation(std::make_shared<HPowGate>(), { d }));

    const std::vector<complex> uniform(16U, complex(ONE_R1_F / 4, ZERO_R1_F));
    std::vector<complex> expected(uniform);
    expected[14U] *= complex(ZERO_R1_F, ONE_R1_F);
    expected[15U] *= complex(ZERO_R1_F, ONE_R1_F);

    TrialResult result = sim.Simulate(ccz, ParamResolver(), targetHigh, QInitialState(uniform));
    std::vector<complex> afterH(16U, ZERO_CMPLX);
    for (size_t i = 0U; i < 16U; i += 2U) {
        // "d" is bit 0.
        afterH[i] = (expected[i] + expected[i + 1U]) * (real1_f)SQRT1_2_R1;
        afterH[i + 1U] = (expected[i] - expected[i + 1U]) * (real1_f)SQRT1_2_R1;
    }
    REQUIRE_THAT(*(result.finalState), HasAmplitudes(afterH));

    QCircuit ccx;
    ccx.AppendOperation(QOperation(std::make_shared<CCXPowGate>(), { a, b, c }));

    // a = b = 1 is 0x06 under this order, and flipping "c" adds 0x08.
    result = sim.Simulate(ccx, ParamResolver(), targetHigh, QInitialState((bitCapIntOcl)0x06U));
    REQUIRE_FLOAT(std::norm((*result.finalState)[14U]), ONE_R1_F);

    result = sim.Simulate(ccx, ParamResolver(), targetHigh, QInitialState((bitCapIntOcl)0x0EU));
    REQUIRE_FLOAT(std::norm((*result.finalState)[6U]), ONE_R1_F);

    result = sim.Simulate(ccx, ParamResolver(), targetHigh, QInitialState((bitCapIntOcl)0x04U));
    REQUIRE_FLOAT(std::norm((*result.finalState)[4U]), ONE_R1_F);
}

TEST_CASE_METHOD(QShardTestFixture, "test_ccx_sampling")
{
    const Qubit a("a");
    const Qubit b("b");
    const Qubit c("c");
    const Qubit d("d");

    QCircuit circuit;
    circuit.AppendMoment(QMoment({ QOperation(std::make_shared<XPowGate>(), { a }),
        QOperation(std::make_shared<XPowGate>(), { b }), QOperation(std::make_shared<HPowGate>(), { d }) }));
    // The decomposition of CCX shares bits between its steps, and runs beside an unrelated operation.
    circuit.AppendMoment(QMoment({ QOperation(std::make_shared<CCXPowGate>(), { a, b, c }),
        QOperation(std::make_shared<ZPowGate>(), { d }) }));
    circuit.AppendMoment(QMoment({ QOperation(std::make_shared<MeasurementGate>("abc", 3U), { a, b, c }),
        QOperation(std::make_shared<MeasurementGate>("d"), { d }) }));

    QSimulator sim(config);
    const size_t repetitions = 100U;
    const std::vector<QubitOrder> orders{ QubitOrder(), QubitOrder(std::vector<Qubit>{ c, d, a, b }) };
    for (const QubitOrder& order : orders) {
        const std::vector<TrialResult> results = sim.Run(circuit, ParamResolver(), repetitions, order);
        REQUIRE(results.size() == repetitions);

        int dCount = 0;
        for (const TrialResult& trial : results) {
            REQUIRE(trial.measurements.at("abc") == std::vector<bool>({ true, true, true }));
            if (trial.measurements.at("d")[0U]) {
                ++dCount;
            }
        }
        REQUIRE(dCount > 20);
        REQUIRE(dCount < 80);
    }
}

TEST_CASE_METHOD(QShardTestFixture, "test_single_qubit_inverse_parameters")
{
    const std::vector<complex> initial{ complex(0.6, ZERO_R1_F), complex(ZERO_R1_F, 0.8) };
    const std::vector<QGatePtr> gates{ std::make_shared<XPowGate>(0.37), std::make_shared<YPowGate>(0.37),
        std::make_shared<ZPowGate>(0.37), std::make_shared<HPowGate>(0.37) };

    QShardEnginePtr qReg = MakeEngine(1U);
    for (const QGatePtr& gate : gates) {
        qReg->SetQuantumState(initial);
        qReg->ApplyMoment({ QBoundOp(gate, { 0U }) });
        qReg->ApplyMoment({ QBoundOp(gate->Inverse(), { 0U }) });
        REQUIRE_THAT(qReg->GetQuantumState(), HasAmplitudes(initial));
    }
}

TEST_CASE_METHOD(QShardTestFixture, "test_circuit_inverse")
{
    const Qubit a("a");
    const Qubit b("b");
    const Qubit c("c");
    const Qubit d("d");

    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<HPowGate>(), { a }));
    circuit.AppendOperation(QOperation(std::make_shared<HPowGate>(), { c }));
    circuit.AppendOperation(QOperation(std::make_shared<CNotPowGate>(), { a, d }));
    circuit.AppendOperation(QOperation(std::make_shared<XPowGate>(0.3), { b }));
    circuit.AppendOperation(QOperation(std::make_shared<CZPowGate>(0.5), { c, b }));
    circuit.AppendOperation(QOperation(std::make_shared<CCZPowGate>(), { a, b, c }));
    circuit.AppendOperation(QOperation(std::make_shared<SwapPowGate>(0.5), { d, a }));

    QCircuit roundTrip(circuit);
    const QCircuit inverse = circuit.Inverse();
    for (const QMoment& moment : inverse.GetMoments()) {
        roundTrip.AppendMoment(moment);
    }

    const TrialResult result = QSimulator(config).Simulate(roundTrip);
    std::vector<complex> expected(16U, ZERO_CMPLX);
    expected[0U] = ONE_CMPLX;
    REQUIRE_THAT(*(result.finalState), HasAmplitudes(expected));
}

TEST_CASE_METHOD(QShardTestFixture, "test_qubit_order_in_simulation")
{
    const Qubit qFlip("q_flip");
    const Qubit qStay("q_stay");

    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<XPowGate>(), { qFlip }));

    QSimulator sim(config);
    TrialResult result = sim.Simulate(circuit, ParamResolver(), QubitOrder(std::vector<Qubit>{ qFlip, qStay }));
    REQUIRE_THAT(*(result.finalState), HasAmplitudes({ ZERO_CMPLX, ZERO_CMPLX, ONE_CMPLX, ZERO_CMPLX }));

    result = sim.Simulate(circuit, ParamResolver(), QubitOrder(std::vector<Qubit>{ qStay, qFlip }));
    REQUIRE_THAT(*(result.finalState), HasAmplitudes({ ZERO_CMPLX, ONE_CMPLX, ZERO_CMPLX, ZERO_CMPLX }));
}

TEST_CASE_METHOD(QShardTestFixture, "test_sqrtx_cz_sqrtx")
{
    const Qubit a("a");
    const Qubit b("b");
    const QGatePtr sqrtX = std::make_shared<XPowGate>(0.5);

    QCircuit circuit;
    circuit.AppendMoment(QMoment({ QOperation(sqrtX, { a }), QOperation(sqrtX, { b }) }));
    circuit.AppendMoment(QMoment({ QOperation(std::make_shared<CZPowGate>(), { a, b }) }));
    circuit.AppendMoment(QMoment({ QOperation(sqrtX, { a }), QOperation(sqrtX, { b }) }));

    QSimulator sim(config);
    const std::vector<real1_f> probs = Probabilities(*(sim.Simulate(circuit).finalState));
    for (size_t i = 0U; i < 4U; ++i) {
        REQUIRE_FLOAT(probs[i], 0.25);
    }

    circuit.AppendMoment(QMoment({ QOperation(std::make_shared<MeasurementGate>("a"), { a }),
        QOperation(std::make_shared<MeasurementGate>("b"), { b }) }));

    const size_t repetitions = 1000U;
    const std::vector<TrialResult> results = sim.Run(circuit, ParamResolver(), repetitions);
    REQUIRE(results.size() == repetitions);

    int counts[4U] = { 0, 0, 0, 0 };
    for (const TrialResult& trial : results) {
        const int outcome = (trial.measurements.at("a")[0U] ? 2 : 0) | (trial.measurements.at("b")[0U] ? 1 : 0);
        counts[outcome]++;
    }
    for (size_t i = 0U; i < 4U; ++i) {
        REQUIRE(counts[i] > 180);
        REQUIRE(counts[i] < 320);
    }
}

TEST_CASE_METHOD(QShardTestFixture, "test_sweep_order")
{
    const Qubit q("q");

    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<XPowGate>(QParam("x")), { q }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("m"), { q }));
    REQUIRE(circuit.IsParameterized());

    const std::vector<TrialResult> results =
        QSimulator(config).RunSweep(circuit, SweepPoints("x", { 0.0, 0.5, 1.0 }), 2U);
    REQUIRE(results.size() == 6U);

    for (size_t i = 0U; i < results.size(); ++i) {
        REQUIRE(results[i].context.resolverIndex == (i >> 1U));
        REQUIRE(results[i].context.repetition == (i & 1U));
        REQUIRE(results[i].measurements.at("m").size() == 1U);
    }
    REQUIRE_FLOAT(results[2U].context.params.Lookup("x"), HALF_R1_F);

    REQUIRE(!results[0U].measurements.at("m")[0U]);
    REQUIRE(!results[1U].measurements.at("m")[0U]);
    REQUIRE(results[4U].measurements.at("m")[0U]);
    REQUIRE(results[5U].measurements.at("m")[0U]);
}

TEST_CASE_METHOD(QShardTestFixture, "test_sweep_edges")
{
    const Qubit a("a");
    const Qubit b("b");

    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<XPowGate>(), { b }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("ab", 2U), { a, b }));

    SweepRunner runner(config);
    REQUIRE(runner.GetBaseSeed() == config.randomSeed);

    std::vector<TrialResult> results = runner.Run(circuit, QSweep(), 3U);
    REQUIRE(results.size() == 3U);
    for (const TrialResult& trial : results) {
        REQUIRE(trial.context.resolverIndex == 0U);
        REQUIRE(trial.measurements.at("ab") == std::vector<bool>({ false, true }));
        REQUIRE(!trial.finalState);
    }

    REQUIRE(runner.Run(circuit, SweepPoints("x", { 0.0, 1.0 }), 0U).empty());

    results = runner.Run(circuit, QSweep(), 1U, QubitOrder(), QInitialState(), true);
    REQUIRE(results[0U].finalState);
    REQUIRE_FLOAT(std::norm((*results[0U].finalState)[1U]), ONE_R1_F);
}

TEST_CASE_METHOD(QShardTestFixture, "test_sweep_reproducible")
{
    const Qubit a("a");
    const Qubit b("b");

    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<HPowGate>(QParam("t")), { a }));
    circuit.AppendOperation(QOperation(std::make_shared<HPowGate>(), { b }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("ab", 2U), { a, b }));

    const QSweep sweep = SweepLinspace("t", 0.5, 1.0, 3U);
    const std::vector<TrialResult> first = QSimulator(config).RunSweep(circuit, sweep, 8U);
    const std::vector<TrialResult> second = QSimulator(config).RunSweep(circuit, sweep, 8U);

    REQUIRE(first.size() == second.size());
    for (size_t i = 0U; i < first.size(); ++i) {
        REQUIRE(first[i].measurements == second[i].measurements);
    }
}

TEST_CASE("test_derive_seed")
{
    const uint64_t seed = SweepRunner::DeriveSeed(42U, 0U, 0U);
    REQUIRE(seed == SweepRunner::DeriveSeed(42U, 0U, 0U));
    REQUIRE(seed != SweepRunner::DeriveSeed(42U, 0U, 1U));
    REQUIRE(seed != SweepRunner::DeriveSeed(42U, 1U, 0U));
    REQUIRE(seed != SweepRunner::DeriveSeed(43U, 0U, 0U));
    REQUIRE(SweepRunner::DeriveSeed(42U, 1U, 2U) != SweepRunner::DeriveSeed(42U, 2U, 1U));
}

TEST_CASE_METHOD(QShardTestFixture, "test_remeasure_agrees")
{
    const Qubit q("q");

    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<HPowGate>(), { q }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("first"), { q }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("second"), { q }));

    const std::vector<TrialResult> results = QSimulator(config).Run(circuit, ParamResolver(), 50U);
    for (const TrialResult& trial : results) {
        REQUIRE(trial.measurements.at("first") == trial.measurements.at("second"));
    }
}

TEST_CASE_METHOD(QShardTestFixture, "test_moment_stepper")
{
    const Qubit q("q");

    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("before"), { q }));
    circuit.AppendOperation(QOperation(std::make_shared<XPowGate>(), { q }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("after"), { q }));

    MomentStepperPtr stepper = QSimulator(config).SimulateMoments(circuit);
    REQUIRE(stepper->GetStatus() == STEPPER_READY);
    REQUIRE(stepper->GetQubits().size() == 1U);

    StepResult step = stepper->Advance();
    REQUIRE(step.momentIndex == 0U);
    REQUIRE(step.measurements.size() == 1U);
    REQUIRE(!step.measurements.at("before")[0U]);

    step = stepper->Advance();
    REQUIRE(step.momentIndex == 1U);
    // Only what this moment measured
    REQUIRE(step.measurements.empty());
    REQUIRE(step.state);
    REQUIRE_THAT(*(step.state), HasAmplitudes({ ZERO_CMPLX, ONE_CMPLX }));
    REQUIRE(stepper->GetMomentIndex() == 2U);

    step = stepper->Advance();
    REQUIRE(step.measurements.size() == 1U);
    REQUIRE(step.measurements.at("after")[0U]);
    REQUIRE(stepper->IsDone());

    REQUIRE_THROWS_AS(stepper->Advance(), StepperExhausted);
}

TEST_CASE_METHOD(QShardTestFixture, "test_moment_stepper_set_state")
{
    const Qubit q("q");

    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<XPowGate>(), { q }));
    circuit.AppendOperation(QOperation(std::make_shared<MeasurementGate>("m"), { q }));

    config.captureStepStates = false;
    MomentStepperPtr stepper = QSimulator(config).SimulateMoments(circuit);
    StepResult step = stepper->Advance();
    REQUIRE(!step.state);
    REQUIRE_THAT(stepper->GetState(), HasAmplitudes({ ZERO_CMPLX, ONE_CMPLX }));

    stepper->SetState((bitCapIntOcl)0U);
    step = stepper->Advance();
    REQUIRE(!step.measurements.at("m")[0U]);

    REQUIRE_THROWS_AS(stepper->SetState(std::vector<complex>(4U, ZERO_CMPLX)), DimensionMismatch);
}

TEST_CASE_METHOD(QShardTestFixture, "test_moment_stepper_empty_circuit")
{
    MomentStepperPtr stepper =
        QSimulator(config).SimulateMoments(QCircuit(), ParamResolver(), QubitOrder(std::vector<Qubit>{ Qubit("q") }));

    REQUIRE(stepper->IsDone());
    REQUIRE_THAT(stepper->GetState(), HasAmplitudes({ ONE_CMPLX, ZERO_CMPLX }));
    REQUIRE_THROWS_AS(stepper->Advance(), StepperExhausted);
}

TEST_CASE_METHOD(QShardTestFixture, "test_moment_stepper_failure")
{
    const Qubit q("q");

    QCircuit unresolved;
    unresolved.AppendOperation(QOperation(std::make_shared<ZPowGate>(QParam("phi")), { q }));

    // Never resolved, so the stepper meets the symbol itself.
    MomentStepper stepper(unresolved, QubitOrder(), config, std::make_shared<qshard_rand_gen>(1U));
    REQUIRE_THROWS_AS(stepper.Advance(), UnresolvedSymbol);
    REQUIRE(stepper.GetStatus() == STEPPER_FAILED);
    REQUIRE_THROWS_AS(stepper.Advance(), StepperExhausted);
    REQUIRE_THROWS_AS(stepper.GetState(), std::logic_error);

    REQUIRE_THROWS_AS(QSimulator(config).Simulate(unresolved), UnresolvedSymbol);

    QCircuit failing;
    failing.AppendOperation(QOperation(std::make_shared<ThrowingGate>(), { q }));
    MomentStepperPtr failingStepper = QSimulator(config).SimulateMoments(failing);
    REQUIRE_THROWS_AS(failingStepper->Advance(), WorkerFailure);
    REQUIRE(failingStepper->GetStatus() == STEPPER_FAILED);

    QCircuit overlapping;
    overlapping.AppendMoment(QMoment({ QOperation(std::make_shared<XPowGate>(), { q }),
        QOperation(std::make_shared<HPowGate>(), { q }) }));
    REQUIRE_THROWS_AS(QSimulator(config).Simulate(overlapping), std::invalid_argument);

    QCircuit duplicateKeys;
    duplicateKeys.AppendOperation(QOperation(std::make_shared<MeasurementGate>("k"), { q }));
    duplicateKeys.AppendOperation(QOperation(std::make_shared<MeasurementGate>("k"), { q }));
    REQUIRE_THROWS_AS(QSimulator(config).SimulateMoments(duplicateKeys), std::invalid_argument);
}

TEST_CASE_METHOD(QShardTestFixture, "test_initial_state_mismatch")
{
    QCircuit circuit;
    circuit.AppendOperation(QOperation(std::make_shared<HPowGate>(), { Qubit("q") }));

    QSimulator sim(config);
    REQUIRE_THROWS_AS(sim.Simulate(circuit, ParamResolver(), QubitOrder(), QInitialState(std::vector<complex>(3U))),
        DimensionMismatch);
    REQUIRE_THROWS_AS(
        sim.Simulate(circuit, ParamResolver(), QubitOrder(), QInitialState((bitCapIntOcl)2U)), DimensionMismatch);
}

TEST_CASE_METHOD(QShardTestFixture, "test_decomposition_depth_limit")
{
    const Qubit q("q");
    std::shared_ptr<DecomposedGate> loop;
    loop = std::make_shared<DecomposedGate>(
        "loop", 1U, [&loop](const std::vector<Qubit>& qb) { return std::vector<QOperation>{ QOperation(loop, qb) }; });

    QCircuit circuit;
    circuit.AppendOperation(QOperation(loop, { q }));

    config.maxDecompositionDepth = 4U;
    REQUIRE_THROWS_AS(QSimulator(config).Simulate(circuit), DecompositionCycle);
}

#if ENABLE_ENV_VARS
TEST_CASE("test_config_environment")
{
    const QSimulatorConfig defaults;

    setenv("QSHARD_SHARD_COUNT", "8", 1);
    setenv("QSHARD_PRECISION", "single", 1);
    setenv("QSHARD_RANDOM_SEED", "1234", 1);
    setenv("QSHARD_MAX_DECOMPOSITION_DEPTH", "7", 1);
    QSimulatorConfig config = QSimulatorConfig::FromEnvironment();
    REQUIRE(config.shardCount == 8U);
    REQUIRE(config.precision == QPRECISION_SINGLE);
    REQUIRE(config.useRandomSeed);
    REQUIRE(config.randomSeed == 1234U);
    REQUIRE(config.maxDecompositionDepth == 7U);

    setenv("QSHARD_SHARD_COUNT", "banana", 1);
    setenv("QSHARD_PRECISION", "quad", 1);
    setenv("QSHARD_RANDOM_SEED", "-5", 1);
    setenv("QSHARD_MAX_DECOMPOSITION_DEPTH", "7x", 1);
    config = QSimulatorConfig::FromEnvironment();
    REQUIRE(config.shardCount == defaults.shardCount);
    REQUIRE(config.precision == defaults.precision);
    REQUIRE(!config.useRandomSeed);
    REQUIRE(config.maxDecompositionDepth == defaults.maxDecompositionDepth);

    setenv("QSHARD_SHARD_COUNT", "0", 1);
    REQUIRE(QSimulatorConfig::FromEnvironment().shardCount == defaults.shardCount);

    unsetenv("QSHARD_SHARD_COUNT");
    unsetenv("QSHARD_PRECISION");
    unsetenv("QSHARD_RANDOM_SEED");
    unsetenv("QSHARD_MAX_DECOMPOSITION_DEPTH");
}
#endif
