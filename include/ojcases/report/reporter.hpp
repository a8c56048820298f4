#pragma once

#include <fmt/format.h>

#include <memory>
#include <string_view>
#include <utility>

namespace spdlog {
class logger;
} // namespace spdlog

namespace ojcases {

enum class LogLevel { Debug, Info, Warning, Error };

/// Receiver of the diagnostics produced while scanning for test cases.
///
/// Scanning code never writes to a terminal itself; whoever starts a scan decides where
/// the events go by passing a Reporter in.
class Reporter
{
public:
    virtual void report(LogLevel level, std::string_view message) = 0;

    virtual ~Reporter() = default;
};

template <typename... Args>
void report_fmt(Reporter& reporter, LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
    reporter.report(level, fmt::format(fmt, std::forward<Args>(args)...));
}

/// Forwards every event to an spdlog logger
class SpdlogReporter : public Reporter
{
public:
    /// Uses spdlog's default logger
    SpdlogReporter();

    explicit SpdlogReporter(std::shared_ptr<spdlog::logger> logger);

    void report(LogLevel level, std::string_view message) override;

    ~SpdlogReporter() override = default;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace ojcases

template <>
struct fmt::formatter<::ojcases::LogLevel> : fmt::formatter<std::string_view>
{
    auto format(::ojcases::LogLevel from, fmt::format_context& ctx) const {
        std::string_view name = "unknown";
        switch (from) {
        case ::ojcases::LogLevel::Debug:
            name = "debug";
            break;
        case ::ojcases::LogLevel::Info:
            name = "info";
            break;
        case ::ojcases::LogLevel::Warning:
            name = "warning";
            break;
        case ::ojcases::LogLevel::Error:
            name = "error";
            break;
        }
        return fmt::formatter<std::string_view>::format(name, ctx);
    }
};
