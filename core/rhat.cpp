#include "core_pch.h"
#include "rhat.h"
#include "draw_transform.h"

namespace mcdiag {
    namespace core {

        namespace {
            struct method_name { rhat_method m; const char* name; };
            const method_name method_names[] = {
                {rhat_method::rank, "rank"}, {rhat_method::split, "split"}, {rhat_method::folded, "folded"},
                {rhat_method::z_scale, "z_scale"}, {rhat_method::identity, "identity"}
            };

            bool all_chains_constant(const arma::mat& x) {
                for (arma::uword i = 0; i < x.n_rows; ++i)
                    if (x.row(i).max() != x.row(i).min())
                        return false;
                return true;
            }

            /** the folded term, where zero within-chain variance of the folded draws is reported as such */
            double folded_rhat(const chain_matrix& m) {
                const chain_matrix folded = z_scale(split_chains(fold(m)));
                if (all_chains_constant(folded.draws()))
                    throw degenerate_chain("rhat(folded): |x-median| has zero within-chain variance");
                return rhat_core(folded);
            }
        }

        string to_string(rhat_method m) {
            for (const auto& mn : method_names)
                if (mn.m == m) return mn.name;
            throw std::invalid_argument("rhat_method: unknown value");
        }

        rhat_method rhat_method_from_string(const string& name) {
            for (const auto& mn : method_names)
                if (name == mn.name) return mn.m;
            throw std::invalid_argument(string("rhat_method: unknown method '") + name + "'");
        }

        double rhat_core(const chain_matrix& cm) {
            if (cm.n_chains() < 2)
                throw invalid_shape(string("rhat: need at least two chains, got ") + std::to_string(cm.n_chains()));
            if (!cm.is_finite())
                return std::numeric_limits<double>::quiet_NaN();
            const arma::mat& x = cm.draws();
            if (all_chains_constant(x))
                throw degenerate_chain("rhat: zero within-chain variance, all chains are constant");
            // Follow Gelman & Rubin's symbolism, n is the chain length
            const double n = double(cm.n_draws());
            const arma::vec chain_mean = arma::mean(x, 1);
            const arma::vec chain_var = arma::var(x, 0, 1);// Unbiased population variance estimates
            const double w = arma::mean(chain_var);// Mean of chain variances, W in Gelman & Rubin
            const double b = n*arma::var(chain_mean);// n * var of chain means, B in Gelman & Rubin
            if (!(w > 0.0))
                throw degenerate_chain("rhat: zero within-chain variance");
            const double v_hat = w*(n - 1.0)/n + b/n;// Estimated target variance Eq 3 in Gelman & Rubin
            return std::sqrt(v_hat/w);
        }

        double rhat(const chain_matrix& m, rhat_method method) {
            if (method == rhat_method::identity)
                return rhat_core(m);
            if (m.n_draws() < 4)
                throw invalid_shape(string("rhat: need at least 4 draws pr. chain, got ") + std::to_string(m.n_draws()));
            if (!m.is_finite())
                return std::numeric_limits<double>::quiet_NaN();
            switch (method) {
            case rhat_method::split:
                return rhat_core(split_chains(m));
            case rhat_method::z_scale:
                return rhat_core(z_scale(split_chains(m)));
            case rhat_method::folded:
                return folded_rhat(m);
            case rhat_method::rank: {
                const double r_z = rhat_core(z_scale(split_chains(m)));
                try {
                    return std::max(r_z, folded_rhat(m));
                } catch (const degenerate_chain&) {
                    return r_z;// draws symmetric about the median, only the location term is defined
                }
            }
            case rhat_method::identity:
                return rhat_core(m);
            }
            throw std::invalid_argument("rhat: unknown method");
        }
    }
}
