// Tempo headers
#include "core/Benchmark.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/Measurement.hpp"
#include "core/RingBuffer.hpp"
#include "core/RunCoordinator.hpp"
#include "core/WorkerPool.hpp"
#include "protocols/MessageCodec.hpp"

// Tempo fakes
#include "fakes/FakeMessageChannel.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <unistd.h>

namespace tempo::test {

  using namespace std::chrono_literals;
  using namespace tempo::core;
  using nlohmann::json;
  using ::testing::HasSubstr;

  //---Measurement---------------------------------------------------------------

  TEST(measurement, factory_enforces_invariants) {
    auto m = makeMeasurement(900.0, "ns", "runtime", 3);
    EXPECT_DOUBLE_EQ(m.perRep(), 300.0);

    EXPECT_THROW(makeMeasurement(std::numeric_limits<double>::quiet_NaN(), "ns", "d", 1), MeasurementFailure);
    EXPECT_THROW(makeMeasurement(std::numeric_limits<double>::infinity(), "ns", "d", 1), MeasurementFailure);
    EXPECT_THROW(makeMeasurement(-0.5, "ns", "d", 1), MeasurementFailure);
    EXPECT_THROW(makeMeasurement(1.0, "ns", "d", 0), MeasurementFailure);
    EXPECT_NO_THROW(makeMeasurement(0.0, "ns", "d", 1));
  }

  //---Benchmark parameters------------------------------------------------------

  TEST(benchmark, parameter_combinations_cross_product) {
    EXPECT_EQ(parameterCombinations({}).size(), 1u);

    auto combos = parameterCombinations({ { "b", { "x", "y" } }, { "a", { "1", "2", "3" } }, { "empty", {} } });
    ASSERT_EQ(combos.size(), 6u);
    EXPECT_EQ(toString(combos.front()), "a=1,b=x");
    EXPECT_EQ(toString(combos.back()), "a=3,b=y");
  }

  //---ErrorMonitor--------------------------------------------------------------

  TEST(error_monitor, forwards_each_distinct_event_once) {
    ErrorMonitor monitor;
    std::vector<RunEvent> heard;
    monitor.registerListener([&](const RunEvent& e) { heard.push_back(e); });

    monitor.notifyWarning("InstrumentSelection", "ignoring value");
    monitor.notifyWarning("InstrumentSelection", "ignoring value");
    monitor.notifyFailure("trial 3", "TIMED_OUT: deadline");

    ASSERT_EQ(heard.size(), 2u);
    EXPECT_EQ(heard[1].severity, RunEvent::Severity::Failure);
    EXPECT_EQ(monitor.events(), heard);
  }

  //---RingBuffer / Logger-------------------------------------------------------

  TEST(ring_buffer, rejects_when_full) {
    RingBuffer<int> rb(2);
    EXPECT_TRUE(rb.tryPush(1));
    EXPECT_TRUE(rb.tryPush(2));
    EXPECT_FALSE(rb.tryPush(3));
    EXPECT_EQ(rb.pop(10ms), 1);
    EXPECT_EQ(rb.pop(10ms), 2);
    EXPECT_FALSE(rb.pop(10ms));
  }

  TEST(logger, writes_quoted_csv_and_filters_by_level) {
    const auto path =
        std::filesystem::temp_directory_path() / ("tempo_logger_test_" + std::to_string(::getpid()) + ".csv");
    {
      Logger logger(LogLevel::Info);
      logger.startNewRun(path.string());
      logger.debug("Hidden", "not written");
      logger.info("TrialScheduler", "trial 1, \"alpha\"");
      logger.warn("WorkerPool", "dropping dead worker");
      logger.error("pool, vm \"fake\"", "spawn failed");
      logger.finishRun();
      EXPECT_EQ(logger.dropped(), 0u);

      logger.info("TrialScheduler", "after the run");
      EXPECT_EQ(logger.dropped(), 1u);
    }

    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    std::filesystem::remove(path);

    EXPECT_THAT(text.str(), HasSubstr("millis,level,component,message\n"));
    EXPECT_THAT(text.str(), HasSubstr(",INFO,\"TrialScheduler\",\"trial 1, \"\"alpha\"\"\""));
    EXPECT_THAT(text.str(), HasSubstr(",WARN,\"WorkerPool\",\"dropping dead worker\""));
    EXPECT_THAT(text.str(), HasSubstr(",ERROR,\"pool, vm \"\"fake\"\"\",\"spawn failed\""));
    EXPECT_THAT(text.str(), ::testing::Not(HasSubstr("after the run")));
    EXPECT_THAT(text.str(), ::testing::Not(HasSubstr("Hidden")));
  }

  //---ConfigLoader--------------------------------------------------------------

  TEST(config_loader, parses_every_section) {
    json doc = json::parse(R"({
      "instruments": { "runtime": { "class": "RuntimeInstrument", "options": { "measurements": 5 } } },
      "defaultInstruments": [ "runtime" ],
      "vms": [ { "name": "fast", "executable": "/bin/w", "args": [ "-q" ],
                 "options": { "heap": "1g" }, "supportedInstruments": [ "RuntimeInstrument" ] } ],
      "options": { "benchmarkMethods": [ "alpha" ] },
      "calibration": { "warmupPolicy": "min-duration", "minWarmupNanos": 5000, "timerResolutionNanos": 40 },
      "scheduler": { "parallelism": 4, "measurementReps": 3, "trialTimeoutMs": 2500, "dryRun": true },
      "aggregator": { "outlierPolicy": "trim", "percentiles": [ 50, 95 ] },
      "logPath": "/tmp/run.csv"
    })");

    RunConfig cfg = parseRunConfig(doc);
    ASSERT_EQ(cfg.instruments.count("runtime"), 1u);
    EXPECT_EQ(cfg.instruments.at("runtime").option("measurements"), "5");
    EXPECT_EQ(cfg.defaultInstruments, std::vector<std::string>{ "runtime" });
    ASSERT_EQ(cfg.vms.size(), 1u);
    EXPECT_EQ(cfg.vms[0].name, "fast");
    EXPECT_EQ(cfg.vms[0].options.at("heap"), "1g");
    EXPECT_FALSE(cfg.vms[0].supports("ArbitraryMeasurementInstrument"));
    EXPECT_EQ(cfg.options.benchmarkMethodNames, std::vector<std::string>{ "alpha" });
    EXPECT_EQ(cfg.calibration.warmupPolicy, WarmupPolicy::MinDuration);
    EXPECT_EQ(cfg.calibration.minWarmupNanos, 5000);
    EXPECT_EQ(cfg.calibration.timerResolutionNanos, 40);
    EXPECT_EQ(cfg.scheduler.parallelism, 4u);
    EXPECT_EQ(cfg.scheduler.measurementReps, 3);
    EXPECT_EQ(cfg.scheduler.trialTimeout, 2500ms);
    EXPECT_TRUE(cfg.scheduler.dryRun);
    EXPECT_EQ(cfg.aggregator.outlierPolicy, OutlierPolicy::Trim);
    EXPECT_EQ(cfg.aggregator.percentiles, (std::vector<double>{ 50.0, 95.0 }));
    EXPECT_EQ(cfg.logPath, "/tmp/run.csv");
  }

  TEST(config_loader, rejects_bad_values) {
    EXPECT_THROW(parseRunConfig(json::array()), ConfigurationError);
    EXPECT_THROW(parseRunConfig(json::parse(R"({"scheduler":{"parallelism":0}})")), ConfigurationError);
    EXPECT_THROW(parseRunConfig(json::parse(R"({"scheduler":{"trialTimeoutMs":0}})")), ConfigurationError);
    EXPECT_THROW(parseRunConfig(json::parse(R"({"calibration":{"warmupPolicy":"forever"}})")), ConfigurationError);
    EXPECT_THROW(parseRunConfig(json::parse(R"({"aggregator":{"percentiles":[101]}})")), ConfigurationError);
    EXPECT_THROW(parseRunConfig(json::parse(R"({"instruments":{"x":{}}})")), ConfigurationError);
    EXPECT_THROW(parseRunConfig(json::parse(R"({"scheduler":{"parallelism":"four"}})")), ConfigurationError);
    EXPECT_THROW(ConfigLoader("/nonexistent/tempo.json").load(), ConfigurationError);
  }

  TEST(config_loader, parses_benchmark_target) {
    auto target = parseBenchmarkTarget(json::parse(R"({
      "name": "Demo",
      "methods": [ { "name": "alpha", "parameterTypes": [ "int64" ] },
                   { "name": "score", "invocation": "single-shot-value" } ],
      "parameters": { "size": [ "16", "256" ] }
    })"));
    EXPECT_EQ(target.name, "Demo");
    ASSERT_EQ(target.methods.size(), 2u);
    EXPECT_EQ(target.methods[0].invocation, InvocationKind::TimedLoop);
    EXPECT_EQ(target.methods[1].invocation, InvocationKind::SingleShotValue);
    EXPECT_EQ(target.parameters.at("size").size(), 2u);

    EXPECT_THROW(parseBenchmarkTarget(json::parse(R"({"name":"X","methods":[{"name":"m","invocation":"jit"}]})")),
                 ConfigurationError);
    EXPECT_THROW(parseBenchmarkTarget(json::parse(R"({"methods":[]})")), ConfigurationError);
  }

  //---WorkerPool / WorkerLease with scripted workers----------------------------

  class WorkerPoolTest : public ::testing::Test {
  protected:
    std::unique_ptr<io::WorkerProcess> makeWorker(const VmConfig& vm) {
      ++spawns;
      if (failSpawns)
        throw WorkerStartupFailure("scripted spawn failure");
      auto chan = std::make_unique<FakeMessageChannel>();
      chan->responder = [](const std::string&) -> std::vector<std::string> {
        return { protocols::MessageCodec::toWire(protocols::StopWorkerAck{}) };
      };
      channels.push_back(chan.get());
      return std::make_unique<io::WorkerProcess>(std::move(chan), -1, vm.name, 10ms);
    }

    VmConfig vm;
    int spawns = 0;
    bool failSpawns = false;
    std::vector<FakeMessageChannel*> channels;
    WorkerPool pool{ [this](const VmConfig& v) { return makeWorker(v); }, std::make_shared<Logger>() };
  };

  TEST_F(WorkerPoolTest, released_worker_is_reused) {
    io::WorkerProcess* first = nullptr;
    {
      WorkerLease lease = pool.acquire(vm);
      ASSERT_TRUE(lease);
      first = &lease.worker();
      lease.release();
      lease.release();
      EXPECT_FALSE(lease);
    }
    EXPECT_EQ(pool.idleCount(), 1u);

    WorkerLease again = pool.acquire(vm);
    EXPECT_EQ(&again.worker(), first);
    EXPECT_EQ(pool.spawnedCount(), 1u);
    EXPECT_EQ(pool.idleCount(), 0u);
  }

  TEST_F(WorkerPoolTest, dropped_lease_destroys_worker) {
    {
      WorkerLease lease = pool.acquire(vm);
      WorkerLease moved = std::move(lease);
      EXPECT_FALSE(lease);
      EXPECT_TRUE(moved);
    }
    EXPECT_EQ(pool.idleCount(), 0u);
    ASSERT_EQ(channels.size(), 1u);

    WorkerLease next = pool.acquire(vm);
    EXPECT_EQ(pool.spawnedCount(), 2u);
  }

  TEST_F(WorkerPoolTest, dead_idle_worker_is_not_handed_out) {
    {
      WorkerLease lease = pool.acquire(vm);
      lease.release();
    }
    channels[0]->open = false;

    WorkerLease fresh = pool.acquire(vm);
    EXPECT_EQ(spawns, 2);
    EXPECT_TRUE(fresh);
    EXPECT_EQ(pool.idleCount(), 0u);
  }

  TEST_F(WorkerPoolTest, other_vm_gets_its_own_worker) {
    {
      WorkerLease lease = pool.acquire(vm);
      lease.release();
    }
    VmConfig other;
    other.name = "other";
    WorkerLease lease = pool.acquire(other);
    EXPECT_EQ(lease->vmName(), "other");
    EXPECT_EQ(pool.idleCount(), 1u);
  }

  TEST_F(WorkerPoolTest, spawn_failure_propagates_and_shutdown_discards_releases) {
    failSpawns = true;
    EXPECT_THROW(pool.acquire(vm), WorkerStartupFailure);
    failSpawns = false;

    WorkerLease lease = pool.acquire(vm);
    pool.shutdown();
    lease.release();
    EXPECT_EQ(pool.idleCount(), 0u);
  }

  //---RunCoordinator lifecycle--------------------------------------------------

  class RunCoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      config.instruments["runtime"] = InstrumentConfig{ "runtime", "RuntimeInstrument", {} };
      config.defaultInstruments = { "runtime" };
      config.vms = { VmConfig{} };
      target.name = "Demo";
      target.methods = { BenchmarkMethod{ "alpha", { "int64" }, InvocationKind::TimedLoop } };
    }

    /// Any attempt to start a worker fails the test.
    io::WorkerLauncher noSpawn = [](const VmConfig&) -> io::LaunchSpec {
      ADD_FAILURE() << "worker launched during configuration";
      return {};
    };

    RunConfig config;
    BenchmarkTarget target;
  };

  TEST_F(RunCoordinatorTest, configured_after_initialize) {
    config.vms.push_back(VmConfig{ "second" });
    RunCoordinator coordinator(config, target, instruments::InstrumentFactory::withBuiltins(), noSpawn);
    EXPECT_EQ(coordinator.state(), RunCoordinator::State::BOOT);
    coordinator.initialize();
    EXPECT_EQ(coordinator.state(), RunCoordinator::State::CONFIGURED);
    EXPECT_EQ(coordinator.trials().size(), 2u);
    EXPECT_EQ(coordinator.instruments().size(), 1u);
    EXPECT_THROW(coordinator.initialize(), std::logic_error);
  }

  TEST_F(RunCoordinatorTest, unknown_instrument_fails_before_any_spawn) {
    config.options.instrumentNames = { "allocation" };
    RunCoordinator coordinator(config, target, instruments::InstrumentFactory::withBuiltins(), noSpawn);
    EXPECT_THROW(coordinator.initialize(), InvalidCommandException);
    EXPECT_EQ(coordinator.state(), RunCoordinator::State::ERROR);
    EXPECT_THROW(coordinator.run(), std::logic_error);
  }

  TEST_F(RunCoordinatorTest, overloads_and_unknown_methods_are_configuration_errors) {
    target.methods.push_back(BenchmarkMethod{ "alpha", { "int" }, InvocationKind::TimedLoop });
    RunCoordinator overloaded(config, target, instruments::InstrumentFactory::withBuiltins(), noSpawn);
    EXPECT_THROW(overloaded.initialize(), InvalidBenchmarkException);

    target.methods.pop_back();
    config.options.benchmarkMethodNames = { "beta" };
    RunCoordinator unknown(config, target, instruments::InstrumentFactory::withBuiltins(), noSpawn);
    EXPECT_THROW(unknown.initialize(), InvalidBenchmarkException);
    EXPECT_EQ(unknown.state(), RunCoordinator::State::ERROR);
  }

  TEST_F(RunCoordinatorTest, unsupported_class_in_factory_is_invalid_command) {
    config.instruments["alloc"] = InstrumentConfig{ "alloc", "AllocationInstrument", {} };
    config.options.instrumentNames = { "alloc" };
    RunCoordinator coordinator(config, target, instruments::InstrumentFactory::withBuiltins(), noSpawn);
    try {
      coordinator.initialize();
      FAIL() << "expected InvalidCommandException";
    } catch (const InvalidCommandException& e) {
      EXPECT_THAT(e.what(), HasSubstr("AllocationInstrument not supported"));
    }
  }

} // namespace tempo::test
