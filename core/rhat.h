#pragma once
///	This file is part of mcdiag.
///
///	mcdiag is free software: you can redistribute it and/or modify it under the terms of
/// the GNU Lesser General Public License as published by the Free Software Foundation,
/// either version 3 of the License, or (at your option) any later version.
///
///	mcdiag is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
/// without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
/// PURPOSE. See the GNU Lesser General Public License for more details.
///
///	You should have received a copy of the GNU Lesser General Public License along with
/// mcdiag, usually located under the mcdiag root directory in two files named COPYING.txt
/// and COPYING_LESSER.txt.	If not, see <http://www.gnu.org/licenses/>.
///
///  Theory is found in: Gelman, A. and D. B. Rubin (1992): Inference from multiple iterative
///  simulation using sequences. Stat. Science, vol 7, no 4, p. 457-472,
///  and Vehtari, A. et al (2021) for the rank normalized and folded variants.
///
#ifdef MCDIAG_NO_PCH
#include <string>
#endif // MCDIAG_NO_PCH

#include "chain_matrix.h"

namespace mcdiag {
    namespace core {
        using namespace std;

        /** \brief how the chains are prepared before the between/within variance ratio is computed */
        enum class rhat_method {
            rank,    ///< max of z_scale and folded (z_scale alone if the folded draws are constant), the recommended default for reporting
            split,   ///< split chains, the classic split R-hat
            folded,  ///< rank normalized split chains of |x-median|, sensitive to scale differences
            z_scale, ///< rank normalized split chains, sensitive to location differences
            identity ///< the chains as is, needs at least two chains
        };

        string to_string(rhat_method m);
        /** \throw std::invalid_argument for unknown names */
        rhat_method rhat_method_from_string(const string& name);

        /** \brief Gelman-Rubin potential scale reduction on the chains of m as is, no splitting
         *
         * R = sqrt(((n-1)/n*W + B/n)/W)
         *
         * \throw invalid_shape if less than two chains
         * \throw degenerate_chain if the within-chain variance W is zero
         * \return R-hat, or nan if m contains non-finite draws
         */
        double rhat_core(const chain_matrix& m);

        /** \brief convergence diagnostic R-hat for the draws of one parameter
         *
         * With the default split method, each chain is split into two halves
         * that are treated as independent chains (so a single chain can be diagnosed),
         * then rhat_core is applied.
         *
         * R-hat close to 1.0 indicates convergence, values above 1.01 is a convergence failure
         * signal that callers should surface.
         *
         * \throw invalid_shape if less than 4 draws pr. chain (identity: less than 2 chains)
         * \throw degenerate_chain if all chains are constant, and for the folded method
         *        also when |x-median| is constant within every split chain
         * \return R-hat, or nan if m contains non-finite draws
         */
        double rhat(const chain_matrix& m, rhat_method method=rhat_method::split);
    }
}
