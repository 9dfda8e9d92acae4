// Ticket: 0001_first_start_bootstrap

#ifndef OSC_LOG_LOG_MANAGER_HPP
#define OSC_LOG_LOG_MANAGER_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

namespace osc_log
{

/**
 * @brief Owns the application's two logging channels
 *
 * - Fallback channel: created in the constructor, always usable. Used for
 *   anything that must be reported before the managed channel exists.
 * - Managed channel: created once by init(), console output plus an optional
 *   rotating log file.
 *
 * logger() returns the managed channel once it exists and the fallback
 * channel before that, so callers racing with init() never see a null
 * logger.
 *
 * Thread Safety:
 *   All public methods are thread-safe.
 */
class LogManager
{
public:
  /**
   * @brief Configuration for the managed channel
   */
  struct Config
  {
    std::filesystem::path logDirectory;  // Where osc.log is written
    bool fileLoggingEnabled{false};
    spdlog::level::level_enum level{spdlog::level::info};
    bool consoleOutput{true};
    std::size_t maxFileSize{5 * 1024 * 1024};  // Bytes per file before rotation
    std::size_t maxFiles{3};
    std::vector<spdlog::sink_ptr> extraSinks;  // Appended to the managed logger
  };

  static constexpr const char* kManagedLoggerName = "osc";
  static constexpr const char* kFallbackLoggerName = "osc-fallback";
  static constexpr const char* kLogFileName = "osc.log";

  /**
   * @brief Create the fallback channel
   * @param fallbackSink Sink for the fallback channel; stderr when null
   */
  explicit LogManager(spdlog::sink_ptr fallbackSink = nullptr);

  // Delete copy/move (shared by reference between startup tasks)
  LogManager(const LogManager&) = delete;
  LogManager& operator=(const LogManager&) = delete;
  LogManager(LogManager&&) = delete;
  LogManager& operator=(LogManager&&) = delete;

  ~LogManager();

  /**
   * @brief Create the managed channel
   *
   * If the log file cannot be opened the managed channel is still created
   * with its console and extra sinks, and the failure is reported on the
   * fallback channel.
   *
   * @return false if the managed channel already existed (config ignored)
   */
  bool init(const Config& config);

  bool isInitialized() const;

  /**
   * @brief Whether the managed channel is writing a log file
   */
  bool fileLoggingEnabled() const;

  /**
   * @brief Path of the active log file, if file logging is on
   */
  std::optional<std::filesystem::path> logFilePath() const;

  /**
   * @brief Always-available baseline channel
   */
  std::shared_ptr<spdlog::logger> fallback() const;

  /**
   * @brief Managed channel if initialized, fallback channel otherwise
   */
  std::shared_ptr<spdlog::logger> logger() const;

  /**
   * @brief Flush both channels
   */
  void flush();

private:
  std::shared_ptr<spdlog::logger> fallback_;

  mutable std::mutex mutex_;  // Protects the members below
  std::shared_ptr<spdlog::logger> managed_;
  std::optional<std::filesystem::path> logFilePath_;
};

}  // namespace osc_log

#endif  // OSC_LOG_LOG_MANAGER_HPP
