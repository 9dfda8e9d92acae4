// Ticket: 0001_first_start_bootstrap

#include "osc-log/src/LogManager.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace osc_log
{

LogManager::LogManager(spdlog::sink_ptr fallbackSink)
{
  if (!fallbackSink)
  {
    fallbackSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }

  // Not registered with spdlog: several LogManagers may coexist (tests)
  fallback_ = std::make_shared<spdlog::logger>(kFallbackLoggerName,
                                               std::move(fallbackSink));
  fallback_->set_level(spdlog::level::trace);
}

LogManager::~LogManager()
{
  flush();
}

bool LogManager::init(const Config& config)
{
  std::scoped_lock lock{mutex_};

  if (managed_)
  {
    managed_->warn("LogManager already initialized, ignoring repeated init");
    return false;
  }

  std::vector<spdlog::sink_ptr> sinks;
  if (config.consoleOutput)
  {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }

  std::optional<std::filesystem::path> logFilePath;
  if (config.fileLoggingEnabled)
  {
    auto const path = config.logDirectory / kLogFileName;
    try
    {
      std::filesystem::create_directories(config.logDirectory);
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path.string(), config.maxFileSize, config.maxFiles));
      logFilePath = path;
    }
    catch (const std::exception& e)
    {
      fallback_->error(
        "File logging disabled, cannot open {}: {}", path.string(), e.what());
    }
  }

  sinks.insert(sinks.end(), config.extraSinks.begin(), config.extraSinks.end());

  auto logger = std::make_shared<spdlog::logger>(
    kManagedLoggerName, sinks.begin(), sinks.end());
  logger->set_level(config.level);
  logger->flush_on(spdlog::level::warn);

  managed_ = std::move(logger);
  logFilePath_ = std::move(logFilePath);
  return true;
}

bool LogManager::isInitialized() const
{
  std::scoped_lock lock{mutex_};
  return managed_ != nullptr;
}

bool LogManager::fileLoggingEnabled() const
{
  std::scoped_lock lock{mutex_};
  return logFilePath_.has_value();
}

std::optional<std::filesystem::path> LogManager::logFilePath() const
{
  std::scoped_lock lock{mutex_};
  return logFilePath_;
}

std::shared_ptr<spdlog::logger> LogManager::fallback() const
{
  return fallback_;
}

std::shared_ptr<spdlog::logger> LogManager::logger() const
{
  std::scoped_lock lock{mutex_};
  return managed_ ? managed_ : fallback_;
}

void LogManager::flush()
{
  fallback_->flush();
  if (auto managed = logger(); managed != fallback_)
  {
    managed->flush();
  }
}

}  // namespace osc_log
