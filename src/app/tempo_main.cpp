/* @file tempo_main.cpp
 * @brief tempo: load a JSON run description, run every trial, print the report as JSON
 *
 * usage: tempo <config.json> [--instrument NAME]... [--method NAME]... [--dry-run] [--worker PATH]
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

// Tempo headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/ReportWriter.hpp"
#include "core/RunCoordinator.hpp"
#include "instruments/InstrumentFactory.hpp"

using namespace tempo;

namespace {

  int usage() {
    std::cerr << "usage: tempo <config.json> [--instrument NAME]... [--method NAME]... [--dry-run] "
                 "[--worker PATH]\n";
    return 64;
  }

  /// VMs without an executable run the demo worker installed next to this binary.
  std::string defaultWorker(const std::string& argv0) {
    auto slash = argv0.find_last_of('/');
    std::string dir = slash == std::string::npos ? "." : argv0.substr(0, slash);
    return dir + "/tempo_demo_worker";
  }

} // namespace

int main(int argc, char** argv) {
  if (argc < 2)
    return usage();

  std::string configPath;
  std::string workerPath = defaultWorker(argv[0]);
  core::RunOptions cli;
  bool dryRun = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--instrument" && i + 1 < argc)
      cli.instrumentNames.push_back(argv[++i]);
    else if (arg == "--method" && i + 1 < argc)
      cli.benchmarkMethodNames.push_back(argv[++i]);
    else if (arg == "--worker" && i + 1 < argc)
      workerPath = argv[++i];
    else if (arg == "--dry-run")
      dryRun = true;
    else if (configPath.empty() && arg.rfind("--", 0) != 0)
      configPath = arg;
    else
      return usage();
  }
  if (configPath.empty())
    return usage();

  try {
    nlohmann::json doc = core::ConfigLoader(configPath).load();
    core::RunConfig config = core::parseRunConfig(doc);
    if (!doc.contains("benchmark"))
      throw core::ConfigurationError("[tempo] " + configPath + " has no \"benchmark\" section");
    core::BenchmarkTarget target = core::parseBenchmarkTarget(doc.at("benchmark"));

    if (!cli.instrumentNames.empty())
      config.options.instrumentNames = cli.instrumentNames;
    if (!cli.benchmarkMethodNames.empty())
      config.options.benchmarkMethodNames = cli.benchmarkMethodNames;
    config.scheduler.dryRun = config.scheduler.dryRun || dryRun;
    if (config.vms.empty())
      config.vms.push_back(core::VmConfig{});

    io::WorkerLauncher launcher = [workerPath](const core::VmConfig& vm) {
      io::LaunchSpec spec = io::defaultLaunchSpec(vm);
      if (spec.executable.empty())
        spec.executable = workerPath;
      return spec;
    };

    auto logger = std::make_shared<core::Logger>(core::LogLevel::Info);
    core::RunCoordinator coordinator(std::move(config), std::move(target),
                                     instruments::InstrumentFactory::withBuiltins(), launcher, logger);
    coordinator.initialize();
    core::Report report = coordinator.run();

    std::cout << core::toJson(report).dump(2) << std::endl;
    return report.count(core::TrialState::Success) == report.trials().size() ? 0 : 1;
  } catch (const core::ConfigurationError& e) {
    std::cerr << "configuration error: " << e.what() << '\n';
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << '\n';
    return 1;
  }
}
