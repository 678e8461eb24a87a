#include "core_pch.h"
#include "chain_matrix.h"

namespace mcdiag {
    namespace core {

        chain_matrix::chain_matrix(arma::mat draws) : x(std::move(draws)) {
            validate();
        }

        chain_matrix::chain_matrix(const vector<vector<double>>& chains) {
            if (chains.empty())
                throw invalid_shape("chain_matrix: need at least one chain");
            const size_t n = chains.front().size();
            x.set_size(chains.size(), n);
            for (size_t i = 0; i < chains.size(); ++i) {
                if (chains[i].size() != n)
                    throw invalid_shape(string("chain_matrix: all chains must have equal length, chain ") + std::to_string(i) + " has " + std::to_string(chains[i].size()) + " draws, expected " + std::to_string(n));
                for (size_t j = 0; j < n; ++j)
                    x.at(i, j) = chains[i][j];
            }
            validate();
        }

        chain_matrix chain_matrix::from_flat(const vector<double>& flat_draws, size_t n_chains) {
            if (n_chains == 0)
                throw invalid_shape("chain_matrix: need at least one chain");
            if (flat_draws.size() % n_chains != 0)
                throw invalid_shape(string("chain_matrix: ") + std::to_string(flat_draws.size()) + " draws can not be split evenly into " + std::to_string(n_chains) + " chains");
            const size_t n = flat_draws.size() / n_chains;
            // armadillo is column-major, so fill (n x n_chains) and transpose
            arma::mat t(flat_draws);
            t.reshape(n, n_chains);
            return chain_matrix(arma::mat(t.t()));
        }

        void chain_matrix::validate() const {
            if (x.n_rows < 1)
                throw invalid_shape("chain_matrix: need at least one chain");
            if (x.n_cols < 2)
                throw invalid_shape(string("chain_matrix: need at least two draws pr. chain, got ") + std::to_string(x.n_cols));
        }

        bool chain_matrix::is_constant() const {
            return (x.max() - x.min()) < 1e-15;
        }

        chain_matrix split_chains(const chain_matrix& m) {
            const arma::uword half = (arma::uword)(m.n_draws() / 2);
            if (half < 2)
                throw invalid_shape(string("split_chains: need at least 4 draws pr. chain, got ") + std::to_string(m.n_draws()));
            const arma::mat& x = m.draws();
            return chain_matrix(arma::mat(arma::join_cols(x.cols(0, half - 1), x.cols(half, 2 * half - 1))));
        }

        vector<double> chain_mean(const chain_matrix& m) {
            return arma::conv_to<vector<double>>::from(arma::vec(arma::mean(m.draws(), 1)));
        }

        vector<double> chain_variance(const chain_matrix& m) {
            return arma::conv_to<vector<double>>::from(arma::vec(arma::var(m.draws(), 0, 1)));
        }

        vector<double> flatten(const chain_matrix& m) {
            // row-major walk of the column-major storage
            const arma::mat t = m.draws().t();
            return vector<double>(t.begin(), t.end());
        }

        vector<double> batch(const chain_matrix& m, size_t batch_size) {
            if (batch_size == 0 || batch_size > m.size())
                throw invalid_shape(string("batch: batch_size must be in 1..") + std::to_string(m.size()) + ", got " + std::to_string(batch_size));
            const auto v = flatten(m);
            const size_t n_batches = v.size() / batch_size;
            vector<double> r; r.reserve(n_batches);
            for (size_t b = 0; b < n_batches; ++b) {
                dlib::running_stats<double> rs;
                for (size_t i = b*batch_size; i < (b + 1)*batch_size; ++i)
                    rs.add(v[i]);
                r.push_back(rs.mean());
            }
            return r;
        }
    }
}
