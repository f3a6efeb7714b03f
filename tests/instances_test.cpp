#include "error.hpp"
#include "instances.hpp"

#include <gtest/gtest.h>
#include <thread>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>

using namespace zkplayground;

namespace {

typedef libff::alt_bn128_pp ppT;
typedef libff::Fr<ppT> FieldT;
typedef libff::G1<ppT> G1;

class CommitInstancesTest : public ::testing::Test {
protected:
    // n = 8 rows, one of them blinding: 6 usable rows
    CommitInstancesTest()
        : params(kzg_params<ppT>::unsafe_setup_with_s(3, FieldT(42)))
        , vk(evaluation_domain<FieldT>(3), 1, 1)
    {
    }

    static instance_column<ppT> column_of(size_t length, long first)
    {
        instance_column<ppT> column;
        for (size_t i = 0; i < length; i++)
            column.emplace_back(FieldT(first + long(i)));
        return column;
    }

    error_code commit_error(const std::vector<instance_set<ppT>>& instances) const
    {
        try {
            commit_instances(params, vk, instances);
        } catch (const plonk_error& e) {
            return e.code();
        }
        return error_code::ok;
    }

    kzg_params<ppT> params;
    verifying_key<ppT> vk;
};

TEST_F(CommitInstancesTest, CommitsSmallColumn)
{
    std::vector<instance_set<ppT>> instances(1);
    instances[0].push_back({ FieldT(3), FieldT(5) });

    const auto commitments = commit_instances(params, vk, instances);
    ASSERT_EQ(1u, commitments.size());
    ASSERT_EQ(1u, commitments[0].size());

    // with s known the commitment is [3 L_0(s) + 5 L_1(s)]G1
    const std::vector<FieldT> lagrange = vk.domain().evaluate_all_lagrange_polynomials(FieldT(42));
    const G1 expected = (FieldT(3) * lagrange[0] + FieldT(5) * lagrange[1]) * G1::one();
    EXPECT_EQ(expected, commitments[0][0]);
}

TEST_F(CommitInstancesTest, RejectsColumnLongerThanUsableRows)
{
    std::vector<instance_set<ppT>> instances(1);
    instances[0].push_back(column_of(7, 1));

    EXPECT_EQ(error_code::instance_too_large, commit_error(instances));
}

TEST_F(CommitInstancesTest, AcceptsColumnFillingUsableRows)
{
    std::vector<instance_set<ppT>> instances(1);
    instances[0].push_back(column_of(6, 1));

    const auto commitments = commit_instances(params, vk, instances);
    ASSERT_EQ(1u, commitments.size());
    EXPECT_EQ(1u, commitments[0].size());
}

TEST_F(CommitInstancesTest, RejectsColumnCountMismatch)
{
    std::vector<instance_set<ppT>> instances(1);
    instances[0].push_back({ FieldT(1) });
    instances[0].push_back({ FieldT(2) });

    EXPECT_EQ(error_code::invalid_instances, commit_error(instances));
}

TEST_F(CommitInstancesTest, ShapeIsCheckedBeforeCapacity)
{
    // first set is oversized, second set has the wrong shape
    std::vector<instance_set<ppT>> instances(2);
    instances[0].push_back(column_of(7, 1));
    instances[1].push_back({ FieldT(1) });
    instances[1].push_back({ FieldT(2) });

    EXPECT_EQ(error_code::invalid_instances, commit_error(instances));
}

TEST_F(CommitInstancesTest, FailsWholeBatchOnOneOversizedColumn)
{
    std::vector<instance_set<ppT>> instances(3);
    instances[0].push_back(column_of(2, 1));
    instances[1].push_back(column_of(7, 1));
    instances[2].push_back(column_of(2, 1));

    EXPECT_EQ(error_code::instance_too_large, commit_error(instances));
}

TEST_F(CommitInstancesTest, EmptyBatchYieldsNoCommitments)
{
    const std::vector<instance_set<ppT>> instances;
    EXPECT_TRUE(commit_instances(params, vk, instances).empty());
}

TEST_F(CommitInstancesTest, EmptyColumnCommitsToIdentity)
{
    std::vector<instance_set<ppT>> instances(1);
    instances[0].push_back(instance_column<ppT>());

    const auto commitments = commit_instances(params, vk, instances);
    EXPECT_TRUE(commitments[0][0].is_zero());
}

TEST_F(CommitInstancesTest, MatchesExplicitlyPaddedCommitment)
{
    const instance_column<ppT> column = column_of(4, 7);

    std::vector<instance_set<ppT>> instances(1);
    instances[0].push_back(column);
    const auto commitments = commit_instances(params, vk, instances);

    std::vector<FieldT> padded(column);
    padded.resize(params.n(), FieldT::zero());
    const G1 expected = params.commit_lagrange(vk.domain().lagrange_from_vec(padded), blind<FieldT>::default_blind());

    EXPECT_EQ(expected, commitments[0][0]);
}

TEST_F(CommitInstancesTest, PreservesSetAndColumnOrder)
{
    const verifying_key<ppT> two_columns(evaluation_domain<FieldT>(3), 2, 1);

    std::vector<instance_set<ppT>> instances(2);
    instances[0].push_back(column_of(1, 10));
    instances[0].push_back(column_of(2, 20));
    instances[1].push_back(column_of(3, 30));
    instances[1].push_back(column_of(4, 40));

    const auto commitments = commit_instances(params, two_columns, instances);
    ASSERT_EQ(2u, commitments.size());
    for (size_t s = 0; s < instances.size(); s++) {
        ASSERT_EQ(2u, commitments[s].size());
        for (size_t c = 0; c < instances[s].size(); c++) {
            std::vector<instance_set<ppT>> single(1);
            single[0].push_back(instances[s][c]);
            single[0].push_back(instance_column<ppT>());

            EXPECT_EQ(commit_instances(params, two_columns, single)[0][0], commitments[s][c])
                << "set " << s << ", column " << c;
        }
    }
    EXPECT_FALSE(commitments[0][0] == commitments[0][1]);
}

TEST_F(CommitInstancesTest, IsDeterministic)
{
    std::vector<instance_set<ppT>> instances(2);
    instances[0].push_back(column_of(5, 100));
    instances[1].push_back(column_of(3, 200));

    const auto first = commit_instances(params, vk, instances);
    const auto second = commit_instances(params, vk, instances);
    EXPECT_EQ(first, second);
}

TEST_F(CommitInstancesTest, ReturnsAffinePoints)
{
    std::vector<instance_set<ppT>> instances(1);
    instances[0].push_back(column_of(3, 1));

    const auto commitments = commit_instances(params, vk, instances);
    EXPECT_TRUE(commitments[0][0].is_special());
}

TEST_F(CommitInstancesTest, RejectsKeyFromAnotherDomain)
{
    const verifying_key<ppT> larger(evaluation_domain<FieldT>(4), 1, 1);

    std::vector<instance_set<ppT>> instances(1);
    instances[0].push_back(column_of(2, 1));

    EXPECT_THROW(commit_instances(params, larger, instances), plonk_error);
}

TEST_F(CommitInstancesTest, ConcurrentCallersMatchSequentialResults)
{
    // profiling left at libff's defaults, as a plain library caller would
    const bool saved_info = libff::inhibit_profiling_info;
    const bool saved_counters = libff::inhibit_profiling_counters;
    libff::inhibit_profiling_info = false;
    libff::inhibit_profiling_counters = false;

    const size_t num_threads = 4;
    std::vector<std::vector<instance_set<ppT>>> batches(num_threads);
    std::vector<std::vector<std::vector<G1>>> expected(num_threads);
    for (size_t t = 0; t < num_threads; ++t) {
        batches[t].resize(3);
        for (size_t s = 0; s < batches[t].size(); ++s)
            batches[t][s].push_back(column_of(1 + (t + s) % 6, long(100 * t + 10 * s)));
    }

    testing::internal::CaptureStdout();
    for (size_t t = 0; t < num_threads; ++t)
        expected[t] = commit_instances(params, vk, batches[t]);

    std::vector<std::vector<std::vector<G1>>> results(num_threads);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, &batches, &results]() {
            for (int round = 0; round < 8; ++round)
                results[t] = commit_instances(params, vk, batches[t]);
        });
    }
    for (std::thread& thread : threads)
        thread.join();
    const std::string output = testing::internal::GetCapturedStdout();

    libff::inhibit_profiling_info = saved_info;
    libff::inhibit_profiling_counters = saved_counters;

    for (size_t t = 0; t < num_threads; ++t)
        EXPECT_EQ(expected[t], results[t]) << "thread " << t;
    EXPECT_EQ("", output);
}

TEST(CommitInstancesCapacityTest, FollowsKeyUsableRows)
{
    const kzg_params<ppT> params = kzg_params<ppT>::unsafe_setup_with_s(4, FieldT(42));
    // 16 rows, 5 blinding factors: 10 usable rows
    const verifying_key<ppT> vk(evaluation_domain<FieldT>(4), 1, 5);
    ASSERT_EQ(10u, vk.usable_rows());

    std::vector<instance_set<ppT>> fits(1);
    fits[0].push_back(instance_column<ppT>(10, FieldT(3)));
    EXPECT_EQ(1u, commit_instances(params, vk, fits).size());

    std::vector<instance_set<ppT>> overflows(1);
    overflows[0].push_back(instance_column<ppT>(11, FieldT(3)));
    try {
        commit_instances(params, vk, overflows);
        FAIL() << "11 values committed into 10 usable rows";
    } catch (const plonk_error& e) {
        EXPECT_EQ(error_code::instance_too_large, e.code());
    }
}

TEST(KeygenTest, StaysQuietWhenProfilingIsInhibited)
{
    ASSERT_TRUE(libff::inhibit_profiling_info);

    constraint_system_shape cs;
    cs.advice_column(2);
    cs.instance_column();

    testing::internal::CaptureStdout();
    const kzg_params<ppT> params = kzg_params<ppT>::unsafe_setup_with_s(4, FieldT(42));
    keygen_vk(params, cs);
    EXPECT_EQ("", testing::internal::GetCapturedStdout());
}

TEST(KeygenTest, DerivesBlindingFactorsFromShape)
{
    const kzg_params<ppT> params = kzg_params<ppT>::unsafe_setup_with_s(4, FieldT(42));

    constraint_system_shape cs;
    cs.advice_column(2);
    cs.advice_column(1);
    cs.instance_column();

    const verifying_key<ppT> vk = keygen_vk(params, cs);
    EXPECT_EQ(1u, vk.num_instance_columns());
    EXPECT_EQ(5u, vk.blinding_factors());
    EXPECT_EQ(10u, vk.usable_rows());
    EXPECT_EQ(16u, vk.domain().n());
}

TEST(KeygenTest, RejectsDomainBelowMinimumRows)
{
    const kzg_params<ppT> params = kzg_params<ppT>::unsafe_setup_with_s(2, FieldT(42));

    constraint_system_shape cs;
    cs.advice_column(2);
    cs.instance_column();

    try {
        keygen_vk(params, cs);
        FAIL() << "keygen_vk accepted a 4-row domain";
    } catch (const plonk_error& e) {
        EXPECT_EQ(error_code::not_enough_rows, e.code());
    }
}

TEST(KeygenTest, WritesShape)
{
    const verifying_key<ppT> vk(evaluation_domain<FieldT>(3), 2, 5);
    const std::vector<uint8_t> expected = { 0, 0, 0, 3, 0, 0, 0, 2, 0, 0, 0, 5 };
    EXPECT_EQ(expected, vk.write());
}

} // namespace
