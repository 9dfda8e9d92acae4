// Ticket: 0001_first_start_bootstrap

#ifndef OSC_APP_APPLICATION_HPP
#define OSC_APP_APPLICATION_HPP

#include <memory>

#include "osc-app/src/AppConfig.hpp"
#include "osc-boot/src/BootstrapCoordinator.hpp"
#include "osc-log/src/LogManager.hpp"
#include "osc-store/src/SqliteMetricTypeStore.hpp"
#include "osc-store/src/SqliteSettingsStore.hpp"

namespace osc_app
{

/**
 * @brief Assembles the application's long-lived services
 *
 * Builds the log channels, both SQLite stores and the bootstrap coordinator
 * from an AppConfig. Nothing touches the disk until start() is called; the
 * stores open their databases from the bootstrap tasks.
 *
 * Destruction waits for the bootstrap tasks before the stores and log
 * channels go away.
 */
class Application
{
public:
  /**
   * @param config Paths and log level
   * @param fallbackSink Sink for the fallback log channel; stderr when null.
   *        The channel is filtered at config.logLevel
   */
  explicit Application(AppConfig config,
                       spdlog::sink_ptr fallbackSink = nullptr);

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  ~Application();

  /**
   * @brief Launch the bootstrap tasks without blocking
   */
  void start();

  /**
   * @brief Block until the bootstrap tasks finish
   */
  void wait();

  const AppConfig& config() const
  {
    return config_;
  }

  osc_log::LogManager& logs()
  {
    return *logs_;
  }

  osc_store::SettingsStore& settings()
  {
    return *settings_;
  }

  osc_store::MetricTypeStore& metricTypes()
  {
    return *metricTypes_;
  }

  osc_boot::BootstrapCoordinator& bootstrap()
  {
    return *bootstrap_;
  }

private:
  AppConfig config_;
  // Destroyed in reverse order: bootstrap tasks finish first
  std::unique_ptr<osc_log::LogManager> logs_;
  std::unique_ptr<osc_store::SqliteSettingsStore> settings_;
  std::unique_ptr<osc_store::SqliteMetricTypeStore> metricTypes_;
  std::unique_ptr<osc_boot::BootstrapCoordinator> bootstrap_;
};

}  // namespace osc_app

#endif  // OSC_APP_APPLICATION_HPP
