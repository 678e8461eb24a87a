#include "core_pch.h"
#include "diagnostics_log.h"

namespace mcdiag {
    namespace core {
        namespace {
            struct mcdiag_logger : dlib::logger {
                mcdiag_logger() : dlib::logger("mcdiag") { set_level(dlib::LWARN); }
            };
        }

        dlib::logger& diagnostics_log() {
            static mcdiag_logger dlog;// function-local, so usable from other static initializers
            return dlog;
        }
    }
}
