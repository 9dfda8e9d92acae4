// Ticket: 0001_first_start_bootstrap

#ifndef OSC_BOOT_BOOTSTRAP_COORDINATOR_HPP
#define OSC_BOOT_BOOTSTRAP_COORDINATOR_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

#include "osc-data/src/MetricType.hpp"
#include "osc-log/src/LogManager.hpp"
#include "osc-store/src/MetricTypeStore.hpp"
#include "osc-store/src/SettingsStore.hpp"

namespace osc_boot
{

/**
 * @brief Runs the application's startup work on background threads
 *
 * Two independent tasks are launched by start():
 * - Logging initialization: reads isFileLoggingEnabled (false if the read
 *   fails, reported on the fallback channel) and initializes the LogManager.
 * - Default data seeding: if isFirstAppStart is set, writes the default
 *   metric types to the MetricTypeStore and only then clears the flag.
 *
 * The flag is cleared strictly after the write reports success, so an
 * interrupted or failed seed is retried on the next start. Neither task lets
 * an exception escape; failures are logged and reported through the task
 * outcomes.
 *
 * The tasks are not ordered relative to each other. Errors from the seeding
 * task go through LogManager::logger() and land on whichever channel exists
 * at that moment.
 *
 * Thread Safety:
 *   start() may be called concurrently; the tasks are launched once. A
 *   wait() that follows any start() call returns only after both tasks
 *   have finished.
 */
class BootstrapCoordinator
{
public:
  using DatasetProvider =
    std::function<std::vector<osc_data::MetricTypeDefinition>()>;

  enum class LoggingOutcome
  {
    Pending,
    Initialized,
    InitializedWithDefault,  // Settings read failed, file logging off
    Failed                   // Managed channel could not be created
  };

  enum class SeedOutcome
  {
    Pending,
    AlreadySeeded,       // Flag was clear, nothing written
    Seeded,              // Definitions written and flag cleared
    SettingsReadFailed,  // Flag unreadable, nothing written
    SeedWriteFailed,     // Store rejected the write, flag still set
    FlagWriteFailed      // Definitions written, flag still set
  };

  /**
   * @param settings Durable flag storage
   * @param metricTypes Destination of the seeded definitions
   * @param logs Log channels; initialized by the logging task
   * @param logConfig Managed channel configuration; fileLoggingEnabled is
   *        replaced by the stored setting
   * @param datasetProvider Source of the definitions to seed
   */
  BootstrapCoordinator(osc_store::SettingsStore& settings,
                       osc_store::MetricTypeStore& metricTypes,
                       osc_log::LogManager& logs,
                       osc_log::LogManager::Config logConfig,
                       DatasetProvider datasetProvider);

  /**
   * @brief Construct with the built-in default dataset
   */
  BootstrapCoordinator(osc_store::SettingsStore& settings,
                       osc_store::MetricTypeStore& metricTypes,
                       osc_log::LogManager& logs,
                       osc_log::LogManager::Config logConfig);

  /**
   * @brief Waits for both tasks to finish
   */
  ~BootstrapCoordinator();

  // Delete copy/move (thread ownership)
  BootstrapCoordinator(const BootstrapCoordinator&) = delete;
  BootstrapCoordinator& operator=(const BootstrapCoordinator&) = delete;
  BootstrapCoordinator(BootstrapCoordinator&&) = delete;
  BootstrapCoordinator& operator=(BootstrapCoordinator&&) = delete;

  /**
   * @brief Launch both tasks and return immediately
   * @return false if the tasks were already launched by an earlier call
   */
  bool start();

  /**
   * @brief Block until both launched tasks have finished
   *
   * Returns immediately if start() was never called.
   */
  void wait();

  /**
   * @brief Logging initialization task body
   *
   * Runs on the calling thread. Never throws.
   */
  LoggingOutcome runLoggingInitialization();

  /**
   * @brief Default data seeding task body
   *
   * Runs on the calling thread. Never throws.
   */
  SeedOutcome runDefaultDataSeeding();

  LoggingOutcome loggingOutcome() const;
  SeedOutcome seedOutcome() const;

private:
  osc_store::SettingsStore& settings_;
  osc_store::MetricTypeStore& metricTypes_;
  osc_log::LogManager& logs_;
  osc_log::LogManager::Config logConfig_;
  DatasetProvider datasetProvider_;

  std::atomic<LoggingOutcome> loggingOutcome_{LoggingOutcome::Pending};
  std::atomic<SeedOutcome> seedOutcome_{SeedOutcome::Pending};

  std::mutex joinMutex_;  // Guards started_ and the threads' launch and join
  bool started_{false};
  // Declared last: joined before the members above are destroyed
  std::jthread loggingThread_;
  std::jthread seedingThread_;
};

std::string_view toString(BootstrapCoordinator::LoggingOutcome outcome);
std::string_view toString(BootstrapCoordinator::SeedOutcome outcome);

}  // namespace osc_boot

#endif  // OSC_BOOT_BOOTSTRAP_COORDINATOR_HPP
