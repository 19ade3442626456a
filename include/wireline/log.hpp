#pragma once

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>

namespace wireline::log {

    /// @brief The library logger ("wireline").
    /// @note Created on first use with a colour stdout sink at `warn` level
    /// unless an application installed one through set_logger().
    std::shared_ptr<spdlog::logger> logger();

    /// @brief Replace the library logger (e.g. to route into an
    /// application's sinks). Passing nullptr restores the default.
    void set_logger(std::shared_ptr<spdlog::logger> logger);

    /// @brief Change the level of the library logger.
    void set_level(spdlog::level::level_enum level);

    /// @brief Completion handler body for detached coroutines: logs an
    /// escaped std::exception at error level. Other exception types are
    /// rethrown.
    void report_exception(std::exception_ptr e, const char* where);

}  // namespace wireline::log
