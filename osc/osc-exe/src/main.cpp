#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "osc-app/src/Application.hpp"
#include "osc-data/src/DefaultMetricTypes.hpp"

/**
 * @brief Application entry point
 *
 * Resolves the data directory, runs the first-start bootstrap and lists the
 * pinned channels that the main screen would show.
 *
 * Usage: orbit_scale [data_directory]
 */
int main(int argc, char* argv[])
{
  if (argc > 2)
  {
    std::cerr << "Usage: " << argv[0] << " [data_directory]" << "\n";
    return 1;
  }

  std::optional<std::string> dataDirectory;
  if (argc == 2)
  {
    dataDirectory = argv[1];
  }

  osc_app::AppConfig config;
  try
  {
    config = osc_app::loadAppConfig(dataDirectory);
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(config.dataDirectory, ec);
  if (ec)
  {
    std::cerr << "Error: cannot create data directory "
              << config.dataDirectory << ": " << ec.message() << "\n";
    return 1;
  }

  osc_app::Application application{config};
  application.start();

  // A GUI host would keep running here; this shell waits for the bootstrap
  application.wait();

  auto& bootstrap = application.bootstrap();
  auto logger = application.logs().logger();
  logger->info("Bootstrap finished. Logging: {}, default data: {}",
               osc_boot::toString(bootstrap.loggingOutcome()),
               osc_boot::toString(bootstrap.seedOutcome()));

  try
  {
    auto const pinned =
      osc_data::pinnedMetricTypes(application.metricTypes().selectAll());
    std::cout << "Pinned channels (" << pinned.size() << "):\n";
    for (const auto& definition : pinned)
    {
      std::cout << "  " << definition.displayOrder << "  "
                << definition.label() << " ["
                << osc_data::toString(definition.unit) << "]\n";
    }
  }
  catch (const std::exception& e)
  {
    // Seeding is retried on the next start; the main screen would be empty
    logger->error("Cannot list metric types: {}", e.what());
  }

  return 0;
}
