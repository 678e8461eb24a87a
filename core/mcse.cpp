#include "core_pch.h"
#include "mcse.h"
#include "effective_sample_size.h"
#include "diagnostics_log.h"

namespace mcdiag {
    namespace core {

        size_t dropped_draws(const chain_matrix& m, size_t n_batches) {
            if (n_batches == 0)
                return m.size();
            return m.size() - n_batches*(m.size()/n_batches);
        }

        double mcse(const chain_matrix& m, size_t n_batches) {
            if (n_batches < 2 || n_batches > m.size())
                throw invalid_shape(string("mcse: n_batches must be in 2..") + std::to_string(m.size()) + ", got " + std::to_string(n_batches));
            if (!m.is_finite())
                return std::numeric_limits<double>::quiet_NaN();
            const size_t batch_size = m.size()/n_batches;
            const size_t n_dropped = dropped_draws(m, n_batches);
            if (n_dropped > 0)
                diagnostics_log() << dlib::LDEBUG << "mcse: " << n_batches << " batches of " << batch_size << " draws, dropping the last " << n_dropped << " of " << m.size() << " draws";
            auto means = batch(m, batch_size);
            means.resize(n_batches);// batch() fills as many batches as possible
            dlib::running_stats<double> rs;
            for (auto x : means)
                rs.add(x);
            return rs.stddev()/std::sqrt(double(n_batches));
        }

        double mcse_mean(const chain_matrix& m) {
            if (!m.is_finite())
                return std::numeric_limits<double>::quiet_NaN();
            const double sd = arma::stddev(arma::vectorise(m.draws()));
            return sd/std::sqrt(ess(m, ess_variant::mean));
        }

        double mcse_sd(const chain_matrix& m) {
            if (!m.is_finite())
                return std::numeric_limits<double>::quiet_NaN();
            const double e = ess(m, ess_variant::sd);
            const double sd = arma::stddev(arma::vectorise(m.draws()));
            const double fac_mcse_sd = std::sqrt(std::exp(1.0)*std::pow(1.0 - 1.0/e, e - 1.0) - 1.0);
            return sd*fac_mcse_sd;
        }

        double mcse_quantile(const chain_matrix& m, double prob) {
            if (!(prob > 0.0 && prob < 1.0))
                throw std::invalid_argument(string("mcse_quantile: prob must be in (0..1), got ") + std::to_string(prob));
            if (!m.is_finite())
                return std::numeric_limits<double>::quiet_NaN();
            ess_parameter p;
            p.probability = prob;
            const double e = ess(m, ess_variant::quantile, p);
            if (!std::isfinite(e))
                return std::numeric_limits<double>::quiet_NaN();
            const boost::math::beta_distribution<double> order_stat(e*prob + 1.0, e*(1.0 - prob) + 1.0);
            const double ppf_low = boost::math::quantile(order_stat, 0.1586553);// +-1 sigma of a standard normal
            const double ppf_high = boost::math::quantile(order_stat, 0.8413447);
            auto v = flatten(m);
            sort(begin(v), end(v));
            const double s = double(v.size());
            const size_t i_low = size_t(std::floor(std::max(ppf_low*s - 1.0, 0.0)));
            const size_t i_high = size_t(std::ceil(std::max(std::min(ppf_high*s - 1.0, s - 1.0), 0.0)));
            return (v[i_high] - v[i_low])/2.0;
        }
    }
}
