#pragma once
///	This file is part of mcdiag.
///
///	mcdiag is free software: you can redistribute it and/or modify it under the terms of
/// the GNU Lesser General Public License as published by the Free Software Foundation,
/// either version 3 of the License, or (at your option) any later version.
///
///	mcdiag is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
/// without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
/// PURPOSE. See the GNU Lesser General Public License for more details.
///
///	You should have received a copy of the GNU Lesser General Public License along with
/// mcdiag, usually located under the mcdiag root directory in two files named COPYING.txt
/// and COPYING_LESSER.txt.	If not, see <http://www.gnu.org/licenses/>.
///
///  Theory is found in: Vehtari, A. et al: Rank-normalization, folding, and localization:
///  An improved R-hat for assessing convergence of MCMC. Bayesian Analysis 16(2) 2021,
///  and Geyer, C. J.: Practical Markov chain Monte Carlo. Stat. Science 7(4) 1992.
///
#ifdef MCDIAG_NO_PCH
#include <vector>
#include <armadillo>
#endif // MCDIAG_NO_PCH

#include "chain_matrix.h"

namespace mcdiag {
    namespace core {
        using namespace std;

        /** \brief the joint multi-chain autocorrelation estimate rho_t, t=0..n_draws-1
         *
         * rho_t = 1 - (W - mean_acov_t)/var_plus, where W is the mean within-chain variance
         * and var_plus mixes in the between-chain variance of the chain means.
         * The mixing lets chains that have not yet mixed show up as
         * high autocorrelation, so the estimate has to be done jointly across chains.
         */
        struct autocorrelation_profile {
            vector<double> rho;///< rho[t] for lag t, rho[0]==1.0
            size_t n_chains=0;///< M of the source matrix
            size_t n_draws=0;///< N of the source matrix
            size_t total_draws() const { return n_chains*n_draws; }
        };

        /** \brief biased autocovariance of one chain for lags 0..n-1
         *
         * acov_t = 1/n sum_{i<n-t} (x_i-xbar)(x_{i+t}-xbar), computed by zero-padded fft, O(n log n)
         */
        arma::vec autocovariance(const arma::vec& x);

        /** \brief estimate the joint autocorrelation profile of all chains in m */
        autocorrelation_profile autocorrelation(const chain_matrix& m);

        /** \brief integrated autocorrelation time tau from the profile
         *
         * Uses Geyer's initial positive sequence on the paired lags
         * P_k = rho_2k + rho_2k+1, stopping at the first non-positive pair,
         * followed by Geyer's initial monotone sequence on the retained pairs.
         * tau = -1 + 2*sum(P_k).
         *
         * tau is clamped from below to 1/log10(M*N), so the ess stays finite
         * for a non-positive first pair, while antithetic chains may still give ess > M*N.
         *
         * \return tau, or nan if the profile contains nan or has less than two lags
         */
        double integrated_time(const autocorrelation_profile& p);
    }
}
