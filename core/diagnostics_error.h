#pragma once
#ifdef MCDIAG_NO_PCH
#include <string>
#include <stdexcept>
#endif // MCDIAG_NO_PCH

namespace mcdiag {
    namespace core {

        /** \brief thrown when the chains x draws shape of the input violates the precondition
         *  of the called function, e.g. too few draws, no chains, or a batch count that
         *  does not fit the number of draws.
         */
        struct invalid_shape : std::invalid_argument {
            explicit invalid_shape(const std::string& msg) : std::invalid_argument(msg) {}
        };

        /** \brief thrown when the within-chain variance is zero, so the
         *  between/within variance ratio (R-hat) is undefined.
         */
        struct degenerate_chain : std::runtime_error {
            explicit degenerate_chain(const std::string& msg) : std::runtime_error(msg) {}
        };
    }
}
