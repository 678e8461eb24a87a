#pragma once
#ifdef MCDIAG_NO_PCH
#include <string>
#include <vector>
#include <utility>
#endif // MCDIAG_NO_PCH

#include "chain_matrix.h"
#include "rhat.h"

namespace mcdiag {
    namespace core {
        using namespace std;

        /** \brief parameters for summarize, where the values have reasonable defaults */
        struct summary_parameter {
            double hdi_probability=0.94;///< probability mass of the highest density interval
            rhat_method method=rhat_method::rank;///< method used for the r_hat column
            double rhat_threshold=1.01;///< r_hat above this is logged as a convergence warning
            int ncore=-1;///< number of worker threads, -1: hardware_concurrency, <2: run in calling thread
            summary_parameter() {}
            summary_parameter(double hdi_probability, rhat_method method=rhat_method::rank, double rhat_threshold=1.01, int ncore=-1)
                :hdi_probability(hdi_probability), method(method), rhat_threshold(rhat_threshold), ncore(ncore) {}
        };

        /** \brief one row of diagnostics for one scalar parameter */
        struct summary_row {
            string name;
            double mean=0.0;
            double sd=0.0;///< n-1 denominator
            double hdi_low=0.0;
            double hdi_high=0.0;
            double mcse_mean=0.0;
            double mcse_sd=0.0;
            double ess_bulk=0.0;
            double ess_tail=0.0;
            double r_hat=0.0;///< nan if the chains are degenerate
        };

        /** \brief highest density interval, the narrowest interval containing floor(prob*n)+1 sorted draws
         * \throw std::invalid_argument if prob outside (0..1)
         */
        pair<double, double> hdi(const chain_matrix& m, double prob);

        /** \brief compute the summary row for one parameter
         *
         * Degenerate chains gives r_hat=nan and a logged warning,
         * r_hat above p.rhat_threshold is logged as a warning.
         * \throw invalid_shape if less than 4 draws pr. chain
         */
        summary_row summarize(const string& name, const chain_matrix& m, const summary_parameter& p=summary_parameter());

        /** \brief compute summary rows for a list of parameters, in the order given
         *
         * The parameters are independent, so they are distributed on p.ncore threads
         * using std::async. The result is the same as for a serial run.
         * If any of the computations throws, all threads are joined before the exception is rethrown.
         */
        vector<summary_row> summarize(const vector<pair<string, chain_matrix>>& parameters, const summary_parameter& p=summary_parameter());
    }
}
