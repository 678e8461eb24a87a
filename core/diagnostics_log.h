#pragma once
#ifdef MCDIAG_NO_PCH
#include <dlib/logger.h>
#endif // MCDIAG_NO_PCH

namespace mcdiag {
    namespace core {
        /** \brief the library logger, named "mcdiag", default level LWARN
         *
         * dlib loggers are thread-safe, so the concurrent summary tasks
         * write through the same instance.
         * Use diagnostics_log().set_level(dlib::LALL) to see batching details.
         */
        dlib::logger& diagnostics_log();
    }
}
