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
#include <string>
#include <vector>
#endif // MCDIAG_NO_PCH

#include "chain_matrix.h"
#include "autocorrelation.h"

namespace mcdiag {
    namespace core {
        using namespace std;

        /** \brief which transform of the draws the ess is computed for
         *
         * Each variant is a pre-transform of the draws composed with the
         * same core estimator, see ess_prepare().
         */
        enum class ess_variant {
            bulk,    ///< rank normalized split chains, efficiency in the center of the distribution
            tail,    ///< min of the 5% and 95% quantile ess
            mean,    ///< split chains, efficiency of the mean estimate
            sd,      ///< split chains of squared deviations
            median,  ///< split chains of the indicator x<=median
            mad,     ///< rank normalized indicator of |x-median| <= mad
            z_scale, ///< rank normalized split chains (same as bulk)
            folded,  ///< rank normalized split chains of |x-median|
            identity,///< the draws as is, no splitting
            quantile,///< split chains of the indicator x<=quantile(probability)
            local    ///< split chains of the indicator quantile(local_lower)<=x<=quantile(local_upper)
        };

        string to_string(ess_variant v);
        /** \throw std::invalid_argument for unknown names */
        ess_variant ess_variant_from_string(const string& name);

        /** \brief parameters for the ess variants, where the values have reasonable defaults
         */
        struct ess_parameter {
            double tail_probability=0.05;///< tail uses quantiles (p, 1-p)
            double probability=0.5;///< for the quantile variant
            double local_lower=0.25;///< lower quantile for the local variant
            double local_upper=0.75;///< upper quantile for the local variant
            bool relative=false;///< if true, return ess/(M*N)
            ess_parameter() {}
            ess_parameter(double tail_probability, double probability=0.5, double local_lower=0.25, double local_upper=0.75, bool relative=false)
                :tail_probability(tail_probability), probability(probability), local_lower(local_lower), local_upper(local_upper), relative(relative) {}
        };

        /** \brief the core estimator, ess = M*N/tau on exactly the matrix given
         *
         * If all draws are equal (to double resolution), the ess is M*N.
         * \return ess, or nan if the draws are not finite
         */
        double ess_core(const chain_matrix& m, bool relative=false);

        /** \brief the transformed matrices that the core estimator is applied to for variant v
         *
         * ess(m,v) is the minimum of ess_core over the returned matrices (only tail returns two).
         */
        vector<chain_matrix> ess_prepare(const chain_matrix& m, ess_variant v, const ess_parameter& p);

        /** \brief effective sample size of m for the variant v
         *
         * Deterministic, no side effects.
         *
         * \param m chain matrix, needs at least 4 draws pr. chain
         * \param v variant, bulk is the default as used by summaries
         * \param p variant probabilities, and relative flag
         * \return the ess, nan if m contains non-finite draws
         * \throw invalid_shape if m has less than 4 draws pr. chain
         * \throw std::invalid_argument if probabilities in p are outside (0..1) for the variant
         */
        double ess(const chain_matrix& m, ess_variant v=ess_variant::bulk, const ess_parameter& p=ess_parameter());
    }
}
