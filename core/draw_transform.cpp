#include "core_pch.h"
#include "draw_transform.h"

namespace mcdiag {
    namespace core {

        double quantile_sorted(const vector<double>& samples, double p) {
            const size_t n_samples = samples.size();
            const double eps = 1e-30;
            // use Hyndman and fam R7 definition, excel, R, and python
            double nd = 1.0 + (n_samples - 1)*p;
            size_t n = size_t(nd);
            double delta = nd - n;
            --n;//0 based index
            if (n == 0 && delta <= eps) return samples.front();
            if (n >= n_samples - 1) return samples.back();
            if (delta < eps) //direct hit on the index, use just one.
                return samples[n];
            auto lower = samples[n];
            auto upper = samples[n + 1];
            return lower + delta*(upper - lower);
        }

        double quantile(const chain_matrix& m, double p) {
            if (!(p >= 0.0 && p <= 1.0))
                throw std::invalid_argument(string("quantile: probability must be in [0..1], got ") + std::to_string(p));
            auto v = flatten(m);
            sort(begin(v), end(v));
            return quantile_sorted(v, p);
        }

        double median(const chain_matrix& m) {
            return quantile(m, 0.5);
        }

        arma::mat rank_average(const chain_matrix& m) {
            const arma::mat& x = m.draws();
            const size_t n = x.n_elem;
            vector<size_t> ix(n);
            iota(begin(ix), end(ix), size_t(0));
            stable_sort(begin(ix), end(ix), [&x](size_t a, size_t b) { return x[a] < x[b]; });
            arma::mat r(x.n_rows, x.n_cols);
            size_t i = 0;
            while (i < n) {
                size_t j = i + 1;
                while (j < n && x[ix[j]] == x[ix[i]])
                    ++j;
                const double avg_rank = 0.5*double(i + 1 + j);// ranks i+1..j share the mean rank
                for (size_t k = i; k < j; ++k)
                    r[ix[k]] = avg_rank;
                i = j;
            }
            return r;
        }

        chain_matrix z_scale(const chain_matrix& m) {
            const double c = 3.0/8.0;
            const double s = double(m.size());
            const boost::math::normal_distribution<double> std_normal;
            arma::mat z = rank_average(m);
            z.transform([&](double r) { return boost::math::quantile(std_normal, (r - c)/(s - 2*c + 1)); });
            return chain_matrix(std::move(z));
        }

        chain_matrix fold(const chain_matrix& m) {
            return chain_matrix(arma::mat(arma::abs(m.draws() - median(m))));
        }

        chain_matrix squared_deviation(const chain_matrix& m) {
            return chain_matrix(arma::mat(arma::square(m.draws() - arma::mean(arma::vectorise(m.draws())))));
        }

        chain_matrix indicator_below(const chain_matrix& m, double limit) {
            const arma::umat below = m.draws() <= limit;
            return chain_matrix(arma::conv_to<arma::mat>::from(below));
        }

        chain_matrix indicator_within(const chain_matrix& m, double lower, double upper) {
            const arma::umat inside = (m.draws() >= lower) % (m.draws() <= upper);
            return chain_matrix(arma::conv_to<arma::mat>::from(inside));
        }
    }
}
