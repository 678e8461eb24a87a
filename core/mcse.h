#pragma once
#ifdef MCDIAG_NO_PCH
#include <cstddef>
#endif // MCDIAG_NO_PCH

#include "chain_matrix.h"

namespace mcdiag {
    namespace core {

        ///< number of trailing draws of flatten(m) that mcse(m,n_batches) leaves out
        size_t dropped_draws(const chain_matrix& m, size_t n_batches);

        /** \brief Monte Carlo standard error by batch means
         *
         * The draws are concatenated chain by chain (flatten) and partitioned into
         * n_batches contiguous batches of m.size()/n_batches draws. The remaining
         * dropped_draws(m,n_batches) trailing draws are not used (logged at debug level).
         *
         * \return sd(batch means)/sqrt(n_batches), sd with n-1 denominator, or nan for non-finite draws
         * \throw invalid_shape if n_batches < 2 or n_batches > m.size()
         */
        double mcse(const chain_matrix& m, size_t n_batches);

        /** \brief mcse of the mean estimate, sd/sqrt(ess mean) */
        double mcse_mean(const chain_matrix& m);

        /** \brief mcse of the sd estimate, using the ess of the squared deviations */
        double mcse_sd(const chain_matrix& m);

        /** \brief mcse of the prob quantile estimate
         *
         * Uses the ess of the quantile indicator to form a Beta distribution for the
         * order statistic, and returns half the width of its +-1 sigma interval mapped to the sorted draws.
         * \throw std::invalid_argument if prob outside (0..1)
         */
        double mcse_quantile(const chain_matrix& m, double prob);
    }
}
