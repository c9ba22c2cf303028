#include <gtest/gtest.h>
#include "protocol/KeyGenerator.hpp"
#include "protocol/Measurement.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Random.hpp"
#include <cmath>
#include <memory>

using namespace keystone;

namespace {

// Flips every encoded bit in transit, keeping the basis.
class BitFlipChannel : public IQuantumChannel {
public:
    std::string name() const override { return "bit_flip"; }
    std::vector<QubitState> transmit(const std::vector<QubitState>& qubits) override {
        std::vector<QubitState> out;
        out.reserve(qubits.size());
        for (const auto& q : qubits) out.emplace_back(q.basis(), static_cast<Bit>(q.bit() ^ 1));
        return out;
    }
};

class DroppingChannel : public IQuantumChannel {
public:
    std::string name() const override { return "dropping"; }
    std::vector<QubitState> transmit(const std::vector<QubitState>& qubits) override {
        return std::vector<QubitState>(qubits.begin(), qubits.begin() + qubits.size() / 2);
    }
};

bool is_binary(const std::string& s) {
    return s.find_first_not_of("01") == std::string::npos;
}

SiftedPair sifted_pair(const BitSequence& a, const BitSequence& b) {
    SiftedPair p;
    p.sender = a;
    p.receiver = b;
    for (std::size_t i = 0; i < a.size(); ++i) p.kept_indices.push_back(i);
    return p;
}

} // namespace

class MeasurementModes : public ::testing::TestWithParam<MeasurementMode> {};

TEST_P(MeasurementModes, MatchingBasisIsDeterministic) {
    RandomSource rng(7);
    Measurement meter(rng, GetParam());
    for (Basis basis : {Basis::Z, Basis::X}) {
        for (Bit bit : {Bit(0), Bit(1)}) {
            QubitState q(basis, bit);
            for (int i = 0; i < 2000; ++i) {
                ASSERT_EQ(meter.measure(q, basis), bit);
            }
        }
    }
}

TEST_P(MeasurementModes, MismatchedBasisIsFairCoin) {
    const int n = 20000;
    const double sigma = std::sqrt(n * 0.25);
    RandomSource rng(20240611);
    Measurement meter(rng, GetParam());
    for (Basis prepared : {Basis::Z, Basis::X}) {
        const Basis other = prepared == Basis::Z ? Basis::X : Basis::Z;
        for (Bit bit : {Bit(0), Bit(1)}) {
            QubitState q(prepared, bit);
            int ones = 0;
            for (int i = 0; i < n; ++i) ones += meter.measure(q, other);
            EXPECT_NEAR(ones, n / 2.0, 4.0 * sigma) << "prepared=" << basis_symbol(prepared) << " bit=" << int(bit);
        }
    }
}

INSTANTIATE_TEST_SUITE_P(BothRealizations, MeasurementModes,
                         ::testing::Values(MeasurementMode::Direct, MeasurementMode::StateVector));

TEST(Encoder, PreparesOneQubitPerBit) {
    RandomSource rng(1);
    Encoder enc(rng);
    auto batch = enc.prepare(64);
    ASSERT_EQ(batch.bits.size(), 64u);
    ASSERT_EQ(batch.bases.size(), 64u);
    ASSERT_EQ(batch.qubits.size(), 64u);
    for (std::size_t i = 0; i < 64; ++i) {
        EXPECT_EQ(batch.qubits[i].basis(), batch.bases[i]);
        EXPECT_EQ(batch.qubits[i].bit(), batch.bits[i]);
        EXPECT_LE(batch.bits[i], 1);
    }
    EXPECT_TRUE(enc.prepare(0).qubits.empty());
}

TEST(Sifter, KeepsOnlyMatchingBasesInOrder) {
    BitSequence a_bits = {1, 0, 1, 1, 0};
    BasisSequence a_bases = {Basis::Z, Basis::X, Basis::X, Basis::Z, Basis::Z};
    BitSequence b_bits = {1, 1, 1, 0, 0};
    BasisSequence b_bases = {Basis::Z, Basis::Z, Basis::X, Basis::X, Basis::Z};

    auto s = Sifter::sift(a_bits, a_bases, b_bits, b_bases);
    EXPECT_EQ(s.kept_indices, (std::vector<std::size_t>{0, 2, 4}));
    EXPECT_EQ(s.sender, (BitSequence{1, 1, 0}));
    EXPECT_EQ(s.receiver, (BitSequence{1, 1, 0}));
}

TEST(Sifter, RejectsLengthMismatch) {
    BitSequence bits = {1, 0};
    BasisSequence bases = {Basis::Z};
    EXPECT_THROW(Sifter::sift(bits, bases, bits, bases), errors::CatalogError);
}

TEST(EavesdropperCheck, IdenticalSequencesPass) {
    EavesdropperCheck check(0.5);
    BitSequence key = {1, 0, 0, 1, 1, 0, 1};
    auto r = check.run(sifted_pair(key, key));
    EXPECT_TRUE(r.passed);
    EXPECT_EQ(r.prefix_length, 3u);
    EXPECT_EQ(r.mismatches, 0u);
    EXPECT_EQ(r.final_key, (BitSequence{1, 1, 0, 1}));
    EXPECT_EQ(r.final_key.size(), key.size() - key.size() / 2);
}

TEST(EavesdropperCheck, PrefixMismatchFails) {
    EavesdropperCheck check(0.5);
    auto r = check.run(sifted_pair({1, 0, 1, 1, 0, 0}, {1, 1, 1, 1, 0, 0}));
    EXPECT_FALSE(r.passed);
    EXPECT_EQ(r.mismatches, 1u);
    EXPECT_NEAR(r.error_rate, 1.0 / 3.0, 1e-12);
    EXPECT_TRUE(r.final_key.empty());
}

TEST(EavesdropperCheck, MismatchOutsidePrefixIsNotDisclosed) {
    EavesdropperCheck check(0.5);
    auto r = check.run(sifted_pair({1, 0, 1, 1}, {1, 0, 0, 0}));
    EXPECT_TRUE(r.passed);
    EXPECT_EQ(r.final_key, (BitSequence{1, 1}));
}

TEST(EavesdropperCheck, EmptySiftedKeyPassesWithEmptyKey) {
    EavesdropperCheck check(0.5);
    auto r = check.run(SiftedPair{});
    EXPECT_TRUE(r.passed);
    EXPECT_EQ(r.prefix_length, 0u);
    EXPECT_EQ(r.error_rate, 0.0);
    EXPECT_TRUE(r.final_key.empty());
}

TEST(EavesdropperCheck, RejectsFractionOutOfRange) {
    EXPECT_THROW(EavesdropperCheck(1.0), errors::CatalogError);
    EXPECT_THROW(EavesdropperCheck(-0.1), errors::CatalogError);
}

TEST(KeyGenerator, TenBitRequestUsesFortyQubits) {
    KeyGenerator gen;
    EXPECT_EQ(gen.num_bits_for(10), 40u);

    RandomSource rng(99);
    auto run = gen.run(10, rng);
    EXPECT_EQ(run.num_bits, 40u);
    EXPECT_EQ(run.encoded.bits.size(), 40u);
    EXPECT_EQ(run.measured.bases.size(), 40u);
    ASSERT_TRUE(has_key(run.outcome));
    const auto& key = std::get<FinalKey>(run.outcome).bits;
    EXPECT_TRUE(is_binary(key));
    EXPECT_LT(key.size(), 40u);
    EXPECT_EQ(key.size(), run.sifted.size() - run.check.prefix_length);
    EXPECT_EQ(run.state, GeneratorState::Success);
}

TEST(KeyGenerator, SiftedBitsComeFromTheSamePositions) {
    KeyGenerator gen;
    RandomSource rng(5);
    auto run = gen.run(64, rng);
    ASSERT_EQ(run.sifted.sender.size(), run.sifted.receiver.size());
    ASSERT_EQ(run.sifted.kept_indices.size(), run.sifted.size());

    std::size_t matches = 0;
    for (std::size_t i = 0; i < run.num_bits; ++i) {
        if (run.encoded.bases[i] == run.measured.bases[i]) ++matches;
    }
    EXPECT_EQ(matches, run.sifted.size());
    for (std::size_t k = 0; k < run.sifted.size(); ++k) {
        const auto idx = run.sifted.kept_indices[k];
        EXPECT_EQ(run.encoded.bases[idx], run.measured.bases[idx]);
        EXPECT_EQ(run.sifted.sender[k], run.encoded.bits[idx]);
        EXPECT_EQ(run.sifted.receiver[k], run.measured.bits[idx]);
        if (k > 0) EXPECT_LT(run.sifted.kept_indices[k - 1], idx);
    }
}

TEST(KeyGenerator, CleanChannelNeverAborts) {
    ProtocolConfig cfg;
    cfg.measurement_mode = MeasurementMode::StateVector;
    KeyGenerator gen(cfg);
    RandomSource rng(11);
    for (int len = 1; len <= 40; ++len) {
        auto outcome = gen.generate(len, rng);
        ASSERT_TRUE(has_key(outcome)) << "len=" << len;
        EXPECT_TRUE(is_binary(std::get<FinalKey>(outcome).bits));
    }
}

TEST(KeyGenerator, TamperedChannelIsDetected) {
    KeyGenerator gen(ProtocolConfig{}, std::make_shared<BitFlipChannel>());
    RandomSource rng(3);
    auto run = gen.run(32, rng);
    ASSERT_FALSE(has_key(run.outcome));
    const auto& abort = std::get<AbortSignal>(run.outcome);
    EXPECT_EQ(abort.code, errors::E3100_EAVESDROPPER_DETECTED);
    EXPECT_EQ(abort.reason, "There was an eavesdropper!");
    EXPECT_EQ(run.state, GeneratorState::Aborted);
    EXPECT_EQ(run.check.mismatches, run.check.prefix_length);
    EXPECT_DOUBLE_EQ(run.check.error_rate, 1.0);

    auto report = run.report();
    EXPECT_EQ(report["outcome"], "aborted");
    EXPECT_EQ(report["key_length"], 0);
    EXPECT_FALSE(report.contains("key"));
}

TEST(KeyGenerator, ChannelMustPreserveLength) {
    KeyGenerator gen(ProtocolConfig{}, std::make_shared<DroppingChannel>());
    EXPECT_THROW(gen.generate(8), errors::CatalogError);
}

TEST(KeyGenerator, SeededRunsAreReproducible) {
    ProtocolConfig cfg;
    cfg.seed = 1234;
    KeyGenerator gen(cfg);
    auto a = gen.generate(48);
    auto b = gen.generate(48);
    ASSERT_TRUE(has_key(a));
    ASSERT_TRUE(has_key(b));
    EXPECT_EQ(std::get<FinalKey>(a).bits, std::get<FinalKey>(b).bits);
}

TEST(KeyGenerator, RejectsNonPositiveLength) {
    KeyGenerator gen;
    EXPECT_THROW(gen.generate(0), errors::CatalogError);
    EXPECT_THROW(gen.generate(-3), errors::CatalogError);
}

TEST(KeyGenerator, RejectsOversizeLengthBeforeAllocating) {
    KeyGenerator gen;
    try {
        gen.generate(2000000000);
        FAIL() << "expected a CatalogError";
    } catch (const errors::CatalogError& e) {
        EXPECT_EQ(e.code(), errors::E3000_INVALID_ARGUMENT);
    }

    ProtocolConfig cfg;
    cfg.max_key_length = 8;
    KeyGenerator small(cfg);
    EXPECT_EQ(small.num_bits_for(8), 32u);
    EXPECT_THROW(small.num_bits_for(9), errors::CatalogError);
}

TEST(KeyGenerator, ConfigurableOversamplingAndFraction) {
    ProtocolConfig cfg;
    cfg.oversampling_factor = 8;
    cfg.check_fraction = 0.25;
    KeyGenerator gen(cfg);
    RandomSource rng(8);
    auto run = gen.run(16, rng);
    EXPECT_EQ(run.num_bits, 128u);
    EXPECT_EQ(run.check.prefix_length, run.sifted.size() / 4);

    auto report = run.report();
    EXPECT_EQ(report["num_bits"], 128);
    EXPECT_EQ(report["state"], "success");
    EXPECT_EQ(report["key_length"].get<std::size_t>(), std::get<FinalKey>(run.outcome).size());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
