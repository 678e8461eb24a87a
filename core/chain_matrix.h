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
#ifdef MCDIAG_NO_PCH
#include <vector>
#include <string>
#include <armadillo>
#endif // MCDIAG_NO_PCH

#include "diagnostics_error.h"

namespace mcdiag {
    namespace core {
        using namespace std;

        /** \brief chain_matrix holds the draws of one scalar parameter from M chains, N draws each
         *
         * Stored as an armadillo matrix with one row pr. chain, so .row(i) is chain i and
         * .col(j) is draw j across all chains.
         * The matrix is immutable after construction, all transforms
         * (split_chains, z_scale etc.) returns a new chain_matrix.
         *
         * \note invariant: n_chains() >= 1 and n_draws() >= 2
         */
        class chain_matrix {
            arma::mat x;///< n_chains x n_draws
            void validate() const;
        public:
            /** construct from an armadillo matrix, rows are chains, cols are draws
             * \throw invalid_shape if less than one chain or less than two draws
             */
            explicit chain_matrix(arma::mat draws);

            /** construct from a vector of chains, each chain a vector of draws
             * \throw invalid_shape if empty, ragged, or chains shorter than two draws
             */
            explicit chain_matrix(const vector<vector<double>>& chains);

            /** construct from chain-major flat draws, like numpy's reshape(n_chains,-1)
             *
             * \param flat_draws draws of chain 0, then chain 1 etc.
             * \param n_chains number of chains, must divide flat_draws.size()
             * \throw invalid_shape if n_chains is zero or do not divide the number of draws
             */
            static chain_matrix from_flat(const vector<double>& flat_draws, size_t n_chains);

            size_t n_chains() const { return (size_t)x.n_rows; }
            size_t n_draws() const { return (size_t)x.n_cols; }
            size_t size() const { return (size_t)x.n_elem; }
            const arma::mat& draws() const { return x; }
            double operator()(size_t chain, size_t draw) const { return x.at(chain, draw); }

            ///< true if every draw is a finite number
            bool is_finite() const { return x.is_finite(); }
            ///< true if max-min of all draws is below double resolution (1e-15)
            bool is_constant() const;
        };

        /** \brief split each chain in two halves, giving (2M, N/2)
         *
         * Row i (i<M) is the first half of chain i, row M+i the second half.
         * With odd N the last draw of each chain is dropped.
         *
         * \throw invalid_shape if the halves would have less than two draws, N<4
         */
        chain_matrix split_chains(const chain_matrix& m);

        ///< per chain mean, size n_chains()
        vector<double> chain_mean(const chain_matrix& m);

        ///< per chain sample variance (n-1 denominator), size n_chains()
        vector<double> chain_variance(const chain_matrix& m);

        ///< all draws, chain by chain, the order used for batching
        vector<double> flatten(const chain_matrix& m);

        /** \brief means of consecutive batches of flatten(m)
         *
         * Trailing draws that do not fill a complete batch are not used.
         *
         * \param batch_size number of draws pr. batch, 1..m.size()
         * \return vector of m.size()/batch_size batch means
         * \throw invalid_shape if batch_size is zero or larger than number of draws
         */
        vector<double> batch(const chain_matrix& m, size_t batch_size);
    }
}
