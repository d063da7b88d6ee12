#pragma once

/**
 * @file log.hpp
 * @brief Leveled diagnostic logging to stderr
 */

#include <functional>
#include <string>
#include <string_view>

namespace recon::log {

enum class Level { kDebug, kInfo, kWarn, kError };

[[nodiscard]] std::string_view level_name(Level level) noexcept;

/**
 * @brief Leveled logger passed by reference to the components that report.
 *
 * Messages below the threshold are dropped. By default accepted messages are
 * written to stderr as "[level] message"; a custom sink replaces that.
 */
class Logger
{
public:
    using Sink = std::function<void(Level, std::string_view)>;

    explicit Logger(Level threshold = Level::kInfo, Sink sink = {});

    void debug(std::string_view message) const { write(Level::kDebug, message); }
    void info(std::string_view message) const { write(Level::kInfo, message); }
    void warn(std::string_view message) const { write(Level::kWarn, message); }
    void error(std::string_view message) const { write(Level::kError, message); }

    void write(Level level, std::string_view message) const;

    [[nodiscard]] bool enabled(Level level) const noexcept { return level >= m_threshold; }
    void set_threshold(Level threshold) noexcept { m_threshold = threshold; }

private:
    Level m_threshold;
    Sink m_sink;
};

}  // namespace recon::log
