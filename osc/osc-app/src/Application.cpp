// Ticket: 0001_first_start_bootstrap

#include "osc-app/src/Application.hpp"

#include <utility>

namespace osc_app
{

Application::Application(AppConfig config, spdlog::sink_ptr fallbackSink)
  : config_{std::move(config)},
    logs_{std::make_unique<osc_log::LogManager>(std::move(fallbackSink))}
{
  // Messages logged before the managed channel exists obey the same level
  logs_->fallback()->set_level(config_.logLevel);

  settings_ = std::make_unique<osc_store::SqliteSettingsStore>(
    config_.settingsDatabasePath.string(), *logs_);
  metricTypes_ = std::make_unique<osc_store::SqliteMetricTypeStore>(
    config_.metricDatabasePath.string(), *logs_);

  osc_log::LogManager::Config logConfig;
  logConfig.logDirectory = config_.logDirectory;
  logConfig.level = config_.logLevel;
  logConfig.consoleOutput = config_.consoleLogging;

  bootstrap_ = std::make_unique<osc_boot::BootstrapCoordinator>(
    *settings_, *metricTypes_, *logs_, std::move(logConfig));
}

Application::~Application()
{
  // Tasks hold references to the stores and log channels
  bootstrap_.reset();
}

void Application::start()
{
  logs_->logger()->debug("Starting bootstrap, data directory: {}",
                         config_.dataDirectory.string());
  bootstrap_->start();
}

void Application::wait()
{
  bootstrap_->wait();
}

}  // namespace osc_app
