/**
 * @file log.cpp
 * @brief Leveled diagnostic logging
 */

#include "recon/log.hpp"

#include "recon/print.hpp"

#include <cstdio>
#include <utility>

namespace recon::log {

std::string_view level_name(Level level) noexcept
{
    switch (level) {
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarn:
            return "warn";
        case Level::kError:
            return "error";
    }
    return "unknown";
}

Logger::Logger(Level threshold, Sink sink)
    : m_threshold(threshold)
    , m_sink(std::move(sink))
{}

void Logger::write(Level level, std::string_view message) const
{
    if (!enabled(level)) {
        return;
    }
    if (m_sink) {
        m_sink(level, message);
        return;
    }
    std::println(stderr, "[{}] {}", level_name(level), message);
}

}  // namespace recon::log
