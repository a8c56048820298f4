#include <ojcases/logging.hpp>
#include <ojcases/report/reporter.hpp>

#include <memory>
#include <string_view>
#include <utility>

namespace ojcases {

SpdlogReporter::SpdlogReporter()
    : logger_{spdlog::default_logger()} {}

SpdlogReporter::SpdlogReporter(std::shared_ptr<spdlog::logger> logger)
    : logger_{std::move(logger)} {}

void SpdlogReporter::report(LogLevel level, std::string_view message) {
    switch (level) {
    case LogLevel::Debug:
        logger_->debug(message);
        break;
    case LogLevel::Info:
        logger_->info(message);
        break;
    case LogLevel::Warning:
        logger_->warn(message);
        break;
    case LogLevel::Error:
        logger_->error(message);
        break;
    }
}

} // namespace ojcases
