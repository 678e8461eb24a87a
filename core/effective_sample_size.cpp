#include "core_pch.h"
#include "effective_sample_size.h"
#include "draw_transform.h"

namespace mcdiag {
    namespace core {

        namespace {
            struct variant_name { ess_variant v; const char* name; };
            const variant_name variant_names[] = {
                {ess_variant::bulk, "bulk"}, {ess_variant::tail, "tail"}, {ess_variant::mean, "mean"},
                {ess_variant::sd, "sd"}, {ess_variant::median, "median"}, {ess_variant::mad, "mad"},
                {ess_variant::z_scale, "z_scale"}, {ess_variant::folded, "folded"}, {ess_variant::identity, "identity"},
                {ess_variant::quantile, "quantile"}, {ess_variant::local, "local"}
            };

            void check_open_probability(double p, const char* what) {
                if (!(p > 0.0 && p < 1.0))
                    throw std::invalid_argument(string("ess: ") + what + " must be in (0..1), got " + std::to_string(p));
            }
        }

        string to_string(ess_variant v) {
            for (const auto& vn : variant_names)
                if (vn.v == v) return vn.name;
            throw std::invalid_argument("ess_variant: unknown value");
        }

        ess_variant ess_variant_from_string(const string& name) {
            for (const auto& vn : variant_names)
                if (name == vn.name) return vn.v;
            throw std::invalid_argument(string("ess_variant: unknown variant '") + name + "'");
        }

        double ess_core(const chain_matrix& m, bool relative) {
            if (!m.is_finite())
                return std::numeric_limits<double>::quiet_NaN();
            const double n_total = double(m.size());
            if (m.is_constant())
                return relative ? 1.0 : n_total;
            const double tau = integrated_time(autocorrelation(m));
            return (relative ? 1.0 : n_total)/tau;
        }

        vector<chain_matrix> ess_prepare(const chain_matrix& m, ess_variant v, const ess_parameter& p) {
            vector<chain_matrix> r;
            switch (v) {
            case ess_variant::bulk:
            case ess_variant::z_scale:
                r.push_back(z_scale(split_chains(m)));
                break;
            case ess_variant::tail: {
                check_open_probability(p.tail_probability, "tail_probability");
                const double p_low = std::min(p.tail_probability, 1.0 - p.tail_probability);
                r.push_back(split_chains(indicator_below(m, quantile(m, p_low))));
                r.push_back(split_chains(indicator_below(m, quantile(m, 1.0 - p_low))));
            } break;
            case ess_variant::mean:
                r.push_back(split_chains(m));
                break;
            case ess_variant::sd:
                r.push_back(split_chains(squared_deviation(m)));
                break;
            case ess_variant::median:
                r.push_back(split_chains(indicator_below(m, median(m))));
                break;
            case ess_variant::mad: {
                auto f = fold(m);
                r.push_back(z_scale(split_chains(indicator_below(f, median(f)))));
            } break;
            case ess_variant::folded:
                r.push_back(z_scale(split_chains(fold(m))));
                break;
            case ess_variant::identity:
                r.push_back(m);
                break;
            case ess_variant::quantile:
                check_open_probability(p.probability, "probability");
                r.push_back(split_chains(indicator_below(m, quantile(m, p.probability))));
                break;
            case ess_variant::local:
                if (!(p.local_lower >= 0.0 && p.local_lower < p.local_upper && p.local_upper <= 1.0))
                    throw std::invalid_argument(string("ess: local interval must satisfy 0<=lower<upper<=1, got ") + std::to_string(p.local_lower) + ".." + std::to_string(p.local_upper));
                r.push_back(split_chains(indicator_within(m, quantile(m, p.local_lower), quantile(m, p.local_upper))));
                break;
            }
            return r;
        }

        double ess(const chain_matrix& m, ess_variant v, const ess_parameter& p) {
            if (m.n_draws() < 4)
                throw invalid_shape(string("ess: need at least 4 draws pr. chain, got ") + std::to_string(m.n_draws()));
            if (!m.is_finite())
                return std::numeric_limits<double>::quiet_NaN();
            double r = std::numeric_limits<double>::infinity();
            for (const auto& x : ess_prepare(m, v, p)) {
                const double e = ess_core(x, p.relative);
                if (std::isnan(e))
                    return e;
                r = std::min(r, e);
            }
            return r;
        }
    }
}
