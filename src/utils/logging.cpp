#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

#include "constants.hpp"

namespace logging {
    namespace {
        constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

        std::shared_ptr<spdlog::logger>& instance() {
            static std::shared_ptr<spdlog::logger> logger;
            return logger;
        }

        std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level) {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            auto logger = std::make_shared<spdlog::logger>(constants::LOGGER_NAME, sink);
            logger->set_pattern(LOG_PATTERN);
            logger->set_level(level);
            logger->flush_on(spdlog::level::err);
            return logger;
        }
    }  // namespace

    void init(bool verbose) { instance() = make_logger(verbose ? spdlog::level::debug : spdlog::level::warn); }

    spdlog::logger& get() {
        auto& logger = instance();
        if (logger == nullptr) {
            logger = make_logger(spdlog::level::warn);
        }
        return *logger;
    }
}  // namespace logging
