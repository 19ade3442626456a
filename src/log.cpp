#include "wireline/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace wireline::log {

    namespace {
        constexpr const char* kLoggerName = "wireline";

        std::mutex& logger_mutex() {
            static std::mutex mu;
            return mu;
        }

        std::shared_ptr<spdlog::logger>& logger_slot() {
            static std::shared_ptr<spdlog::logger> slot;
            return slot;
        }

        std::shared_ptr<spdlog::logger> make_default_logger() {
            if (auto existing = spdlog::get(kLoggerName)) return existing;
            try {
                auto created = spdlog::stdout_color_mt(kLoggerName);
                created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
                created->set_level(spdlog::level::warn);
                return created;
            } catch (const spdlog::spdlog_ex&) {
                // Lost a registration race with another thread.
                return spdlog::get(kLoggerName);
            }
        }
    }  // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lk(logger_mutex());
        auto& slot = logger_slot();
        if (!slot) slot = make_default_logger();
        return slot;
    }

    void set_logger(std::shared_ptr<spdlog::logger> replacement) {
        std::lock_guard<std::mutex> lk(logger_mutex());
        logger_slot() = std::move(replacement);
    }

    void set_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

    void report_exception(std::exception_ptr e, const char* where) {
        if (!e) return;
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            logger()->error("{}: unhandled exception: {}", where, ex.what());
        }
    }

}  // namespace wireline::log
