#include "core_pch.h"
#include "autocorrelation.h"

namespace mcdiag {
    namespace core {

        arma::vec autocovariance(const arma::vec& x) {
            const arma::uword n = x.n_elem;
            arma::uword n_fft = 1;
            while (n_fft < 2*n) n_fft <<= 1;// zero-pad to avoid circular wrap-around
            const arma::vec xc = x - arma::mean(x);
            arma::cx_vec f = arma::fft(xc, n_fft);
            f = f % arma::conj(f);
            const arma::vec acov = arma::real(arma::ifft(f));
            return acov.head(n)/double(n);
        }

        autocorrelation_profile autocorrelation(const chain_matrix& m) {
            const size_t n_chains = m.n_chains();
            const size_t n_draws = m.n_draws();
            const double n = double(n_draws);
            arma::mat acov(n_chains, n_draws);
            for (size_t i = 0; i < n_chains; ++i)
                acov.row(i) = autocovariance(m.draws().row(i).t()).t();
            const arma::rowvec mean_acov = arma::mean(acov, 0);
            const double mean_var = mean_acov[0]*n/(n - 1.0);// W
            double var_plus = mean_var*(n - 1.0)/n;
            if (n_chains > 1)
                var_plus += arma::var(arma::vec(arma::mean(m.draws(), 1)));// between-chain part, B/N
            autocorrelation_profile r;
            r.n_chains = n_chains;
            r.n_draws = n_draws;
            r.rho.resize(n_draws);
            r.rho[0] = 1.0;
            for (size_t t = 1; t < n_draws; ++t)
                r.rho[t] = 1.0 - (mean_var - mean_acov[t])/var_plus;
            return r;
        }

        double integrated_time(const autocorrelation_profile& p) {
            const auto& rho = p.rho;
            if (rho.size() < 2)
                return std::numeric_limits<double>::quiet_NaN();
            const long n = (long)rho.size();
            vector<double> r(n, 0.0);
            double rho_even = 1.0;
            double rho_odd = rho[1];
            r[0] = rho_even;
            r[1] = rho_odd;
            // Geyer's initial positive sequence
            long t = 1;
            while (t < n - 3 && (rho_even + rho_odd) > 0.0) {
                rho_even = rho[t + 1];
                rho_odd = rho[t + 2];
                if ((rho_even + rho_odd) >= 0.0) {
                    r[t + 1] = rho_even;
                    r[t + 2] = rho_odd;
                }
                t += 2;
            }
            const long max_t = t - 2;
            if (rho_even > 0.0)
                r[max_t + 1] = rho_even;// keep the first even lag after the cut
            // Geyer's initial monotone sequence
            for (t = 1; t <= max_t - 2; t += 2) {
                if ((r[t + 1] + r[t + 2]) > (r[t - 1] + r[t])) {
                    r[t + 1] = (r[t - 1] + r[t])/2.0;
                    r[t + 2] = r[t + 1];
                }
            }
            for (auto x : r)
                if (std::isnan(x))
                    return std::numeric_limits<double>::quiet_NaN();
            double tau = -1.0 + r[max_t + 1];
            for (long k = 0; k <= max_t; ++k)
                tau += 2.0*r[k];
            return std::max(tau, 1.0/std::log10(double(p.total_draws())));
        }
    }
}
