#include "test_pch.h"
#include "mocks.h"
#include "core/chain_matrix.h"

using namespace mcdiag::core;
using namespace mcdiagtest;

TEST_SUITE("chain_matrix") {
TEST_CASE("construct_and_shape") {
    chain_matrix m(vector<vector<double>>{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
    TS_ASSERT_EQUALS(m.n_chains(), 2u);
    TS_ASSERT_EQUALS(m.n_draws(), 3u);
    TS_ASSERT_EQUALS(m.size(), 6u);
    TS_ASSERT_DELTA(m(1, 2), 6.0, 1e-15);
    TS_ASSERT(m.is_finite());
    TS_ASSERT(!m.is_constant());
    TS_ASSERT(constant_chains(3, 10, 2.5).is_constant());

    TS_ASSERT_THROWS(chain_matrix(arma::mat(0, 5)), invalid_shape);
    TS_ASSERT_THROWS(chain_matrix(arma::mat(2, 1, arma::fill::zeros)), invalid_shape);
    TS_ASSERT_THROWS(chain_matrix(vector<vector<double>>{}), invalid_shape);
    TS_ASSERT_THROWS(chain_matrix(vector<vector<double>>{{1.0, 2.0}, {1.0}}), invalid_shape);
}

TEST_CASE("from_flat_is_chain_major") {
    auto m = chain_matrix::from_flat({0.0, 1.0, 2.0, 3.0, 4.0, 5.0}, 2);
    TS_ASSERT_EQUALS(m.n_chains(), 2u);
    TS_ASSERT_EQUALS(m.n_draws(), 3u);
    TS_ASSERT_DELTA(m(0, 2), 2.0, 1e-15);
    TS_ASSERT_DELTA(m(1, 0), 3.0, 1e-15);
    auto f = flatten(m);
    for (size_t i = 0; i < f.size(); ++i)
        TS_ASSERT_DELTA(f[i], double(i), 1e-15);
    TS_ASSERT_THROWS(chain_matrix::from_flat({1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0}, 2), invalid_shape);
    TS_ASSERT_THROWS(chain_matrix::from_flat({1.0, 2.0}, 0), invalid_shape);
    TS_ASSERT_THROWS(chain_matrix::from_flat({1.0, 2.0, 3.0}, 3), invalid_shape);// one draw pr. chain
}

TEST_CASE("split_chains_odd_length_drops_last_draw") {
    vector<double> v(14);
    for (size_t i = 0; i < v.size(); ++i) v[i] = double(i);
    auto m = chain_matrix::from_flat(v, 2);// chains 0..6 and 7..13
    auto s = split_chains(m);
    TS_ASSERT_EQUALS(s.n_chains(), 4u);
    TS_ASSERT_EQUALS(s.n_draws(), 3u);
    // first halves, then second halves
    double expected[4][3] = {{0, 1, 2}, {7, 8, 9}, {3, 4, 5}, {10, 11, 12}};
    for (size_t i = 0; i < 4; ++i)
        for (size_t j = 0; j < 3; ++j)
            TS_ASSERT_DELTA(s(i, j), expected[i][j], 1e-15);
    auto all = flatten(s);
    TS_ASSERT(std::find(all.begin(), all.end(), 6.0) == all.end());
    TS_ASSERT(std::find(all.begin(), all.end(), 13.0) == all.end());
}

TEST_CASE("split_chains_even_length") {
    auto s = split_chains(linspace_chains(3, 500));
    TS_ASSERT_EQUALS(s.n_chains(), 6u);
    TS_ASSERT_EQUALS(s.n_draws(), 250u);
    TS_ASSERT_EQUALS(s.size(), 1500u);
    TS_ASSERT_THROWS(split_chains(sequence_chain(3)), invalid_shape);
    TS_ASSERT_EQUALS(split_chains(sequence_chain(5)).n_draws(), 2u);
}

TEST_CASE("chain_mean_and_variance") {
    chain_matrix m(vector<vector<double>>{{1.0, 2.0, 3.0, 4.0}, {2.0, 4.0, 6.0, 8.0}});
    auto mu = chain_mean(m);
    TS_ASSERT_EQUALS(mu.size(), 2u);
    TS_ASSERT_DELTA(mu[0], 2.5, 1e-12);
    TS_ASSERT_DELTA(mu[1], 5.0, 1e-12);
    auto var = chain_variance(m);
    TS_ASSERT_DELTA(var[0], 5.0/3.0, 1e-12);
    TS_ASSERT_DELTA(var[1], 20.0/3.0, 1e-12);
}

TEST_CASE("batch_means") {
    auto b = batch(sequence_chain(9), 2);// the 9th draw does not fill a batch
    TS_ASSERT_EQUALS(b.size(), 4u);
    TS_ASSERT_DELTA(b[0], 1.5, 1e-12);
    TS_ASSERT_DELTA(b[3], 7.5, 1e-12);
    // batches run across chain boundaries, chain by chain
    chain_matrix m(vector<vector<double>>{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
    auto b2 = batch(m, 2);
    TS_ASSERT_EQUALS(b2.size(), 3u);
    TS_ASSERT_DELTA(b2[1], 3.5, 1e-12);
    TS_ASSERT_EQUALS(batch(m, 6).size(), 1u);
    TS_ASSERT_EQUALS(batch(m, 1).size(), 6u);
    TS_ASSERT_THROWS(batch(m, 0), invalid_shape);
    TS_ASSERT_THROWS(batch(m, 7), invalid_shape);
}
}
