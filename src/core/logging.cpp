#include "clikit/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace clikit {

spdlog::level::level_enum log_level_for(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Quiet: return spdlog::level::err;
        case Verbosity::Verbose: return spdlog::level::info;
        case Verbosity::Debug: return spdlog::level::debug;
        case Verbosity::Normal: break;
    }
    return spdlog::level::warn;
}

void configure_logging(Verbosity verbosity) {
    configure_logging(verbosity, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

void configure_logging(Verbosity verbosity, std::shared_ptr<spdlog::sinks::sink> sink) {
    auto logger = std::make_shared<spdlog::logger>("clikit", std::move(sink));
    logger->set_pattern("%^%l%$: %v");
    logger->set_level(log_level_for(verbosity));
    spdlog::set_default_logger(std::move(logger));
}

} // namespace clikit
