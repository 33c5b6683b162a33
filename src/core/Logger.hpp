/**
 * @file Logger.hpp
 * @brief Leveled, facility-aware logging for the heatmap pipeline
 *
 * Every component writes through a Logger named after itself. All console
 * and file output goes through a single emission point guarded by a single
 * verbosity check.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace dkmz {

/**
 * @brief Verbosity levels, lower is more important
 *
 * Level 1: failures that stop a batch or a layer
 * Level 2: recoverable problems (bad color codes, skipped rows)
 * Level 3: batch progress (default)
 * Level 4: per-stage details
 * Level 5: per-layer debugging
 * Level 6: variable dumps
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Logger bound to a facility (component) name
 *
 * Identical consecutive messages are collapsed into a single
 * "The previous message occurred N times." line, which matters when many
 * rows of an input file are rejected for the same reason.
 */
class Logger {
public:
    /**
     * @brief Anonymous logger using the global default level
     */
    Logger();

    /**
     * @brief Logger for a named facility
     * @param component_name Facility name used for per-facility levels
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Logger with an explicit threshold and optional log file
     * @param level Threshold for this instance
     * @param log_file File to append to, if any
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Emit a message if its level passes the effective threshold
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) {
        current_level_ = level;
        explicit_level_ = true;
    }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Attach, replace or (with nullopt) detach the log file
     */
    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void warn(const std::string& message) const { warning(message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    /**
     * @brief Highest verbosity; flushes immediately
     */
    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending repeat summaries and both streams
     */
    void flush() const;

    // ========================================================================
    // Global configuration shared by all loggers
    // ========================================================================

    /**
     * @brief Override the threshold of one facility
     *
     * @example
     * Logger::setFacilityLevel("PngEncoder", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Threshold for facilities without an override
     */
    static void setDefaultLevel(LogLevel level);

    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Apply a level specification string
     *
     * "5" sets the default, "PngEncoder=6" sets one facility, and both forms
     * can be mixed with commas: "3,DensityGenerator=5,default=4".
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Set a file that every logger without its own file appends to
     */
    static void setGlobalLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Facility override, then instance level, then global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    bool explicit_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Repeat collapsing
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> global_file_stream_;
    static std::mutex registry_mutex_;

    static std::shared_ptr<std::ofstream> openLogFile(const std::string& path);

    void emitPendingRepeats() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace dkmz
