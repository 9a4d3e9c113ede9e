#ifndef REQ_PROBE_LOGGING_HPP
#define REQ_PROBE_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace logging {
    // Installs the process logger on stderr so stdout only carries the report.
    void init(bool verbose);

    // Returns the process logger, creating a quiet default one if init() was never called.
    spdlog::logger& get();
}  // namespace logging

#endif
