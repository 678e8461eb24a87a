#pragma once
#ifdef MCDIAG_NO_PCH
#include <vector>
#include <armadillo>
#endif // MCDIAG_NO_PCH

#include "chain_matrix.h"

namespace mcdiag {
    namespace core {
        using namespace std;

        /// http://en.wikipedia.org/wiki/Percentile NIST definitions, we use R7, as R, numpy and excel
        /// http://www.itl.nist.gov/div898/handbook/prc/section2/prc262.htm
        /// \param sorted_samples ascending, non-empty
        /// \param p probability in [0..1]
        double quantile_sorted(const vector<double>& sorted_samples, double p);

        /** \brief quantile of all draws of m, using R7 interpolation
         * \throw std::invalid_argument if p outside [0..1]
         */
        double quantile(const chain_matrix& m, double p);

        ///< median of all draws, same as quantile(m,0.5)
        double median(const chain_matrix& m);

        /** \brief average ranks (1..n, ties get the mean rank) of all draws, same shape as m */
        arma::mat rank_average(const chain_matrix& m);

        /** \brief rank normalization (normal scores) of all draws
         *
         * Each draw is replaced by the standard normal quantile of its
         * back-transformed rank (r-3/8)/(S+1/4), S = m.size() (Blom's offset).
         * Ties give equal scores, a constant input gives all zeros.
         */
        chain_matrix z_scale(const chain_matrix& m);

        ///< |x - median(x)|, the folded draws used for tail/scale diagnostics
        chain_matrix fold(const chain_matrix& m);

        ///< (x - mean(x))^2
        chain_matrix squared_deviation(const chain_matrix& m);

        ///< indicator 1.0 where x <= limit, otherwise 0.0
        chain_matrix indicator_below(const chain_matrix& m, double limit);

        ///< indicator 1.0 where lower <= x <= upper, otherwise 0.0
        chain_matrix indicator_within(const chain_matrix& m, double lower, double upper);
    }
}
