#include "core_pch.h"
#include "diagnostics_summary.h"
#include "effective_sample_size.h"
#include "mcse.h"
#include "diagnostics_log.h"

namespace mcdiag {
    namespace core {

        pair<double, double> hdi(const chain_matrix& m, double prob) {
            if (!(prob > 0.0 && prob < 1.0))
                throw std::invalid_argument(string("hdi: prob must be in (0..1), got ") + std::to_string(prob));
            if (!m.is_finite())
                return make_pair(std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN());
            auto v = flatten(m);
            sort(begin(v), end(v));
            const size_t n = v.size();
            const size_t interval_idx_inc = size_t(std::floor(prob*n));
            const size_t n_intervals = n - interval_idx_inc;
            size_t min_idx = 0;
            double min_width = std::numeric_limits<double>::infinity();
            for (size_t i = 0; i < n_intervals; ++i) {
                const double width = v[i + interval_idx_inc] - v[i];
                if (width < min_width) {
                    min_width = width;
                    min_idx = i;
                }
            }
            return make_pair(v[min_idx], v[min_idx + interval_idx_inc]);
        }

        summary_row summarize(const string& name, const chain_matrix& m, const summary_parameter& p) {
            auto& dlog = diagnostics_log();
            summary_row r;
            r.name = name;
            dlib::running_stats<double> rs;
            for (auto x : flatten(m))
                rs.add(x);
            r.mean = rs.mean();
            r.sd = rs.stddev();
            auto h = hdi(m, p.hdi_probability);
            r.hdi_low = h.first;
            r.hdi_high = h.second;
            r.ess_bulk = ess(m, ess_variant::bulk);
            r.ess_tail = ess(m, ess_variant::tail);
            r.mcse_mean = mcse_mean(m);
            r.mcse_sd = mcse_sd(m);
            try {
                r.r_hat = rhat(m, p.method);
            } catch (const degenerate_chain& e) {
                dlog << dlib::LWARN << "summarize: " << name << ": " << e.what() << ", r_hat set to nan";
                r.r_hat = std::numeric_limits<double>::quiet_NaN();
            }
            if (!m.is_finite())
                dlog << dlib::LWARN << "summarize: " << name << ": non-finite draws, diagnostics are nan";
            else if (r.r_hat > p.rhat_threshold)
                dlog << dlib::LWARN << "summarize: " << name << ": r_hat(" << to_string(p.method) << ")=" << r.r_hat << " > " << p.rhat_threshold << ", chains have not converged";
            return r;
        }

        vector<summary_row> summarize(const vector<pair<string, chain_matrix>>& parameters, const summary_parameter& p) {
            vector<summary_row> r(parameters.size());
            int ncore = p.ncore;
            if (ncore < 0) {
                ncore = (int)thread::hardware_concurrency();//in case of not available, default to 4,
                if (ncore < 2) ncore = 4;
            }
            if (ncore < 2 || parameters.size() < 2) {
                for (size_t i = 0; i < parameters.size(); ++i)
                    r[i] = summarize(parameters[i].first, parameters[i].second, p);
                return r;
            }
            /// 1. partition the parameters on ncore threads, each writing to its own slots in r
            vector<future<void>> calcs;
            const size_t n_params = parameters.size();
            const size_t thread_param_count = 1 + n_params/ncore;
            for (size_t i = 0; i < n_params;) {
                size_t n = thread_param_count;
                if (i + n > n_params) n = n_params - i;
                calcs.emplace_back(
                    async(launch::async, [&parameters, &r, &p, i, n]() {
                        for (size_t j = i; j < i + n; ++j)
                            r[j] = summarize(parameters[j].first, parameters[j].second, p);
                    })
                );
                i = i + n;
            }
            /// 2. wait for all threads before passing on any exception
            exception_ptr p_ex;
            for (auto& f : calcs) {
                try {
                    f.get();
                } catch (...) {
                    if (!p_ex)
                        p_ex = current_exception();// keep the first, in parameter order
                }
            }
            if (p_ex)
                rethrow_exception(p_ex);
            return r;
        }
    }
}
