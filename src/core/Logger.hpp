/**
 * @file Logger.hpp
 * @brief Facility-based logging with verbosity control
 *
 * Every component owns a Logger named after itself. A process-wide registry
 * maps facility names to levels so that, for example, the selector can run
 * at TRACE while everything else stays at INFO. Messages are written to
 * stderr (stdout is reserved for tool output) and optionally appended to a
 * log file.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace gex {

/**
 * @brief Log levels
 *
 * Level 1: Errors (disrupts execution)
 * Level 2: Warnings (a record or feature was dropped)
 * Level 3: Information (high-level)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
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
 * @brief Short tag printed in front of each message ("WARN", "INFO", ...)
 */
const char* log_level_tag(LogLevel level);

/**
 * @brief Logger bound to one facility
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with facility name
     * @param component_name Facility used for level lookup and message prefix
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with explicit level and optional file output
     * @param level Threshold for this instance
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Consecutive identical messages are collapsed into a repeat count.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending repeat summaries and the output streams
     */
    void flush() const;

    // ========================================================================
    // Facility registry
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * Formats:
     * - "5" sets the default to DEBUG
     * - "BudgetedSelector=6,SpatialMerger=4" sets facility levels
     * - "3,SpatialMerger=6" mixes both; "default=N" is accepted as well
     *
     * Invalid tokens are reported on stderr and ignored.
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Route every facility logger's output to a file as well as stderr
     * @param log_file Path to append to, or nullopt to stop file output
     * @return false if the file could not be opened
     */
    static bool setSharedLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Facility level if registered, else instance level, else default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Repeat collapsing state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> shared_file_;
    static std::mutex registry_mutex_;
    static std::mutex sink_mutex_;      // stderr and log file writes

    static std::shared_ptr<std::ofstream> openLogFile(const std::string& path);

    void flushRepeats() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace gex
