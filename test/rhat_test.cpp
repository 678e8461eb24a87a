#include "test_pch.h"
#include "mocks.h"
#include "core/rhat.h"

using namespace mcdiag::core;
using namespace mcdiagtest;

TEST_SUITE("rhat") {
TEST_CASE("split_rhat_hand_computed") {
    // halves (1,2) and (3,4): W=0.5, B=2*var(1.5,3.5)=4, V=0.5*0.5+4/2=2.25
    TS_ASSERT_DELTA(rhat(sequence_chain(4)), std::sqrt(4.5), 1e-12);
    // identity on the same two halves as separate chains
    chain_matrix two(vector<vector<double>>{{1.0, 2.0}, {3.0, 4.0}});
    TS_ASSERT_DELTA(rhat(two, rhat_method::identity), std::sqrt(4.5), 1e-12);
    TS_ASSERT_DELTA(rhat_core(two), std::sqrt(4.5), 1e-12);
}

TEST_CASE("constant_chains_are_degenerate") {
    auto m = constant_chains(4, 100, 3.0);
    TS_ASSERT_THROWS(rhat(m), degenerate_chain);
    TS_ASSERT_THROWS(rhat(m, rhat_method::rank), degenerate_chain);
    TS_ASSERT_THROWS(rhat(m, rhat_method::identity), degenerate_chain);
    // each chain constant, but at different values
    chain_matrix stuck(vector<vector<double>>{{1.0, 1.0, 1.0, 1.0}, {2.0, 2.0, 2.0, 2.0}});
    TS_ASSERT_THROWS(rhat(stuck), degenerate_chain);
}

TEST_CASE("draws_symmetric_about_the_median") {
    // |x-median| is 0.5 everywhere, while every split chain still varies
    chain_matrix m(vector<vector<double>>{{0.0, 1.0, 0.0, 1.0}, {1.0, 0.0, 1.0, 0.0}});
    TS_ASSERT_DELTA(rhat(m), std::sqrt(0.5), 1e-12);
    const double r_z = rhat(m, rhat_method::z_scale);
    TS_ASSERT_DELTA(r_z, std::sqrt(0.5), 1e-12);
    TS_ASSERT_DELTA(rhat(m, rhat_method::rank), r_z, 1e-12);
    TS_ASSERT_THROWS(rhat(m, rhat_method::folded), degenerate_chain);
}

TEST_CASE("rhat_invariant_to_shift_and_scale") {
    auto m = ar1_chains(4, 400, 0.6, 21);
    const arma::mat& x = m.draws();
    chain_matrix shifted(arma::mat(x + 100.0));
    chain_matrix scaled(arma::mat(x*3.5));
    const double r = rhat(m);
    TS_ASSERT_DELTA(rhat(shifted), r, 1e-9);
    TS_ASSERT_DELTA(rhat(scaled), r, 1e-9);
    const double r_rank = rhat(m, rhat_method::rank);
    TS_ASSERT_DELTA(rhat(shifted, rhat_method::rank), r_rank, 1e-6);
    TS_ASSERT_DELTA(rhat(scaled, rhat_method::rank), r_rank, 1e-6);
}

TEST_CASE("rhat_of_independent_draws_is_close_to_one") {
    auto m = uniform_chains(2, 500, 2017);
    TS_ASSERT(rhat(m) < 1.01);
    TS_ASSERT(rhat(m, rhat_method::rank) < 1.01);
    TS_ASSERT(rhat(m, rhat_method::identity) < 1.01);
    TS_ASSERT(rhat(m) > 0.99);
}

TEST_CASE("rhat_of_unmixed_linear_chains_is_large") {
    auto m = linspace_chains(2, 500);
    TS_ASSERT(rhat(m) > 2.0);
    TS_ASSERT(rhat(m, rhat_method::rank) > 2.0);
    TS_ASSERT(rhat(m, rhat_method::z_scale) > 2.0);
}

TEST_CASE("rhat_detects_chains_in_different_regions") {
    arma::mat x = normal_chains(4, 1000, 77).draws();
    x.row(3) += 3.0;// one chain stuck in another mode
    chain_matrix m(x);
    TS_ASSERT(rhat(m) > 1.1);
    TS_ASSERT(rhat(m, rhat_method::rank) > 1.1);
}

TEST_CASE("folded_rhat_detects_scale_differences") {
    arma::mat x = normal_chains(4, 1000, 99).draws();
    x.row(0) *= 4.0;// same location, different scale
    chain_matrix m(x);
    TS_ASSERT(rhat(m, rhat_method::folded) > rhat(m, rhat_method::z_scale));
    TS_ASSERT(rhat(m, rhat_method::rank) >= rhat(m, rhat_method::folded));
}

TEST_CASE("rhat_errors") {
    TS_ASSERT_THROWS(rhat(sequence_chain(3)), invalid_shape);
    TS_ASSERT_THROWS(rhat(sequence_chain(10), rhat_method::identity), invalid_shape);
    arma::mat x = normal_chains(2, 50, 1).draws();
    x(0, 0) = std::numeric_limits<double>::infinity();
    TS_ASSERT(std::isnan(rhat(chain_matrix(x))));
    TS_ASSERT(std::isnan(rhat(chain_matrix(x), rhat_method::rank)));
}

TEST_CASE("method_names") {
    for (auto mth : {rhat_method::rank, rhat_method::split, rhat_method::folded, rhat_method::z_scale, rhat_method::identity})
        TS_ASSERT(rhat_method_from_string(to_string(mth)) == mth);
    TS_ASSERT_THROWS(rhat_method_from_string("gelman"), std::invalid_argument);
}
}
