// Tempo headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/ReportWriter.hpp"
#include "core/RunCoordinator.hpp"
#include "core/TrialScheduler.hpp"
#include "core/WorkerPool.hpp"
#include "instruments/ArbitraryMeasurementInstrument.hpp"
#include "instruments/InstrumentFactory.hpp"
#include "instruments/RuntimeInstrument.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <signal.h>

namespace tempo::test {

  using namespace std::chrono_literals;
  using namespace tempo::core;
  using instruments::ArbitraryMeasurementInstrument;
  using instruments::Instrument;
  using instruments::RuntimeInstrument;
  using ::testing::HasSubstr;

  /// Trials against tempo_fake_worker, built by hand so each test picks its methods.
  class SchedulerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      config.vms = { fakeVm() };
      config.scheduler.measurementReps = 3;
      config.scheduler.trialTimeout = 5000ms;
      config.scheduler.startupTimeout = 5000ms;
      config.scheduler.terminateGrace = 200ms;
      config.scheduler.spawnRetryBackoff = 10ms;

      runtime = std::make_shared<RuntimeInstrument>(std::make_shared<const InstrumentConfig>(
          InstrumentConfig{ "runtime", RuntimeInstrument::kClassName, {} }));
      value = std::make_shared<ArbitraryMeasurementInstrument>(std::make_shared<const InstrumentConfig>(
          InstrumentConfig{ "value", ArbitraryMeasurementInstrument::kClassName, {} }));
    }

    static VmConfig fakeVm() {
      VmConfig vm;
      vm.name = "fake";
      vm.executable = TEMPO_FAKE_WORKER;
      return vm;
    }

    Trial timedTrial(std::string method, protocols::Parameters params = {}) {
      return makeTrial(runtime, BenchmarkMethod{ std::move(method), { "int64" }, InvocationKind::TimedLoop },
                       std::move(params));
    }

    Trial valueTrial(std::string method) {
      return makeTrial(value, BenchmarkMethod{ std::move(method), {}, InvocationKind::SingleShotValue }, {});
    }

    Trial makeTrial(const std::shared_ptr<Instrument>& instrument, const BenchmarkMethod& method,
                    protocols::Parameters params) {
      Trial t;
      t.id = nextId++;
      t.target = instrument->createInstrumentedMethod(method);
      t.vm = std::make_shared<const VmConfig>(config.vms.front());
      t.parameters = std::move(params);
      return t;
    }

    std::vector<TrialResult> runAll(std::vector<Trial>& trials) {
      WorkerPool pool(WorkerPool::processSpawner(io::defaultLaunchSpec, config.scheduler), logger);
      return runWith(pool, trials);
    }

    std::vector<TrialResult> runWith(WorkerPool& pool, std::vector<Trial>& trials) {
      TrialScheduler scheduler(config, pool, monitor, logger);
      auto results = scheduler.run(trials);
      pool.shutdown();
      return results;
    }

    static bool processGone(std::int64_t pid) {
      return ::kill(static_cast<pid_t>(pid), 0) == -1 && errno == ESRCH;
    }

    RunConfig config;
    ErrorMonitor monitor;
    std::shared_ptr<Logger> logger = std::make_shared<Logger>();
    std::shared_ptr<Instrument> runtime;
    std::shared_ptr<Instrument> value;
    std::int64_t nextId = 1;
  };

  TEST_F(SchedulerTest, two_stable_methods_succeed_with_requested_measurements) {
    std::vector<Trial> trials{ timedTrial("stableA"), timedTrial("stableB") };
    auto results = runAll(trials);

    ASSERT_EQ(results.size(), 2u);
    for (std::size_t i = 0; i < results.size(); ++i) {
      EXPECT_EQ(results[i].trialId, trials[i].id);
      EXPECT_EQ(results[i].state, TrialState::Success) << results[i].reason;
      EXPECT_EQ(trials[i].state, TrialState::Success);
      ASSERT_EQ(results[i].measurements.size(), 3u);
      EXPECT_FALSE(results[i].partialWarmup);
    }
    // simulated clock: per-rep cost is exact
    EXPECT_DOUBLE_EQ(results[0].measurements[0].perRep(), 100.0);
    EXPECT_DOUBLE_EQ(results[1].measurements[2].perRep(), 250.0);
    EXPECT_GT(results[0].measurements[0].value, config.calibration.resolutionMargin);
    EXPECT_TRUE(monitor.events().empty());
  }

  TEST_F(SchedulerTest, parameters_reach_the_worker) {
    std::vector<Trial> trials{ timedTrial("sized", { { "size", "3" } }), timedTrial("sized", { { "size", "7" } }) };
    auto results = runAll(trials);
    ASSERT_EQ(results[0].state, TrialState::Success) << results[0].reason;
    ASSERT_EQ(results[1].state, TrialState::Success) << results[1].reason;
    EXPECT_DOUBLE_EQ(results[0].measurements[0].perRep(), 30.0);
    EXPECT_DOUBLE_EQ(results[1].measurements[0].perRep(), 70.0);
  }

  TEST_F(SchedulerTest, hanging_trial_times_out_and_worker_is_killed) {
    config.scheduler.trialTimeout = 300ms;
    std::vector<Trial> trials{ timedTrial("hang") };

    const auto start = std::chrono::steady_clock::now();
    auto results = runAll(trials);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].state, TrialState::TimedOut);
    EXPECT_TRUE(results[0].measurements.empty());
    ASSERT_GT(results[0].workerPid, 0);
    EXPECT_TRUE(processGone(results[0].workerPid));

    auto events = monitor.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].severity, RunEvent::Severity::Failure);
    EXPECT_THAT(events[0].message, HasSubstr("TIMED_OUT"));
  }

  TEST_F(SchedulerTest, crash_in_one_trial_does_not_affect_the_other) {
    config.scheduler.parallelism = 2;
    std::vector<Trial> trials{ timedTrial("crashLate"), timedTrial("stableA") };
    auto results = runAll(trials);

    EXPECT_EQ(results[0].state, TrialState::Failed);
    EXPECT_TRUE(results[0].measurements.empty());
    EXPECT_THAT(results[0].reason, HasSubstr("crashLate"));
    EXPECT_TRUE(processGone(results[0].workerPid));

    EXPECT_EQ(results[1].state, TrialState::Success) << results[1].reason;
    EXPECT_EQ(results[1].measurements.size(), 3u);
  }

  TEST_F(SchedulerTest, benchmark_exception_fails_the_trial) {
    std::vector<Trial> trials{ timedTrial("failing"), timedTrial("stableA") };
    auto results = runAll(trials);
    EXPECT_EQ(results[0].state, TrialState::Failed);
    EXPECT_THAT(results[0].reason, HasSubstr("benchmark exploded"));
    EXPECT_EQ(results[1].state, TrialState::Success) << results[1].reason;
  }

  TEST_F(SchedulerTest, worker_is_reused_after_success_unless_fresh_requested) {
    std::vector<Trial> trials{ timedTrial("stableA"), timedTrial("stableB") };
    auto results = runAll(trials);
    EXPECT_EQ(results[0].workerPid, results[1].workerPid);

    config.scheduler.freshWorkerPerTrial = true;
    std::vector<Trial> fresh{ timedTrial("stableA"), timedTrial("stableB") };
    auto freshResults = runAll(fresh);
    EXPECT_NE(freshResults[0].workerPid, freshResults[1].workerPid);
  }

  TEST_F(SchedulerTest, gc_messages_are_counted) {
    std::vector<Trial> trials{ timedTrial("gcNoisy") };
    auto results = runAll(trials);
    ASSERT_EQ(results[0].state, TrialState::Success) << results[0].reason;
    // 2 probes + 5 warmup loops + 3 measurements, one collection each
    EXPECT_EQ(results[0].gcEvents, 10);
  }

  TEST_F(SchedulerTest, value_instrument_reports_worker_values) {
    std::vector<Trial> trials{ valueTrial("valueOk"), valueTrial("valueNaN") };
    auto results = runAll(trials);

    ASSERT_EQ(results[0].state, TrialState::Success) << results[0].reason;
    ASSERT_EQ(results[0].measurements.size(), 3u);
    EXPECT_DOUBLE_EQ(results[0].measurements[0].value, 42.0);
    EXPECT_EQ(results[0].measurements[0].unit, "widgets");

    EXPECT_EQ(results[1].state, TrialState::Failed);
    EXPECT_THAT(results[1].reason, HasSubstr("non-finite"));
  }

  TEST_F(SchedulerTest, dry_run_executes_once_without_measurements) {
    config.scheduler.dryRun = true;
    std::vector<Trial> trials{ timedTrial("stableA"), timedTrial("failing") };
    auto results = runAll(trials);

    EXPECT_EQ(results[0].state, TrialState::Success) << results[0].reason;
    EXPECT_TRUE(results[0].dryRun);
    EXPECT_TRUE(results[0].measurements.empty());
    EXPECT_EQ(results[1].state, TrialState::Failed);
  }

  TEST_F(SchedulerTest, unstartable_worker_fails_after_one_retry) {
    config.vms.front().executable = "/nonexistent/tempo-worker";
    std::vector<Trial> trials{ timedTrial("stableA") };
    auto results = runAll(trials);
    EXPECT_EQ(results[0].state, TrialState::Failed);
    EXPECT_EQ(results[0].workerPid, -1);
    EXPECT_FALSE(results[0].reason.empty());
  }

  TEST_F(SchedulerTest, spawn_failure_is_retried_exactly_once) {
    int attempts = 0;
    WorkerPool pool(
        [&attempts](const VmConfig&) -> std::unique_ptr<io::WorkerProcess> {
          ++attempts;
          throw WorkerStartupFailure("scripted startup failure");
        },
        logger);
    std::vector<Trial> trials{ timedTrial("stableA") };
    auto results = runWith(pool, trials);

    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(results[0].state, TrialState::Failed);
    EXPECT_EQ(results[0].workerPid, -1);
    EXPECT_THAT(results[0].reason, HasSubstr("scripted startup failure"));
  }

  TEST_F(SchedulerTest, crash_during_calibration_fails_without_retry) {
    WorkerPool pool(WorkerPool::processSpawner(io::defaultLaunchSpec, config.scheduler), logger);
    std::vector<Trial> trials{ timedTrial("crash") };
    auto results = runWith(pool, trials);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].state, TrialState::Failed);
    EXPECT_TRUE(results[0].measurements.empty());
    EXPECT_THAT(results[0].reason, HasSubstr("crash"));
    ASSERT_GT(results[0].workerPid, 0);
    EXPECT_TRUE(processGone(results[0].workerPid));
    // one worker for the one attempt: a crashed trial is not rerun
    EXPECT_EQ(pool.spawnedCount(), 1u);
    EXPECT_EQ(monitor.events().size(), 1u);
  }

  TEST_F(SchedulerTest, unstable_loop_succeeds_with_partial_warmup) {
    config.calibration.maxWarmupLoops = 12;
    std::vector<Trial> trials{ timedTrial("unstable"), timedTrial("stableA") };
    auto results = runAll(trials);

    ASSERT_EQ(results[0].state, TrialState::Success) << results[0].reason;
    EXPECT_TRUE(results[0].partialWarmup);
    EXPECT_EQ(results[0].measurements.size(), 3u);

    ASSERT_EQ(results[1].state, TrialState::Success) << results[1].reason;
    EXPECT_FALSE(results[1].partialWarmup);
  }

  //---whole run through the coordinator---------------------------------------

  TEST(run_coordinator, end_to_end_report) {
    RunConfig config;
    config.instruments["runtime"] = InstrumentConfig{ "runtime", RuntimeInstrument::kClassName, {} };
    config.instruments["value"] = InstrumentConfig{ "value", ArbitraryMeasurementInstrument::kClassName, {} };
    config.defaultInstruments = { "runtime", "value" };
    VmConfig vm;
    vm.executable = TEMPO_FAKE_WORKER;
    config.vms = { vm };
    config.options.benchmarkMethodNames = { "stableA", "sized", "valueOk" };
    config.scheduler.parallelism = 2;
    config.scheduler.measurementReps = 4;

    BenchmarkTarget target;
    target.name = "Fake";
    target.methods = { { "stableA", { "int64" }, InvocationKind::TimedLoop },
                       { "sized", { "int64" }, InvocationKind::TimedLoop },
                       { "valueOk", {}, InvocationKind::SingleShotValue } };
    target.parameters = { { "size", { "2", "5" } } };

    RunCoordinator coordinator(config, target, instruments::InstrumentFactory::withBuiltins());
    coordinator.initialize();
    ASSERT_EQ(coordinator.trials().size(), 6u);

    Report report = coordinator.run();
    EXPECT_EQ(coordinator.state(), RunCoordinator::State::FINISHED);
    EXPECT_EQ(report.count(TrialState::Success), 6u);

    const ReportEntry* sized = report.find(TrialKey{ "sized", "runtime", { { "size", "5" } } });
    ASSERT_NE(sized, nullptr);
    ASSERT_TRUE(sized->statistics);
    EXPECT_EQ(sized->statistics->count, 4u);
    EXPECT_DOUBLE_EQ(sized->statistics->mean, 50.0);

    auto json = toJson(report);
    EXPECT_EQ(json.at("trials").size(), 6u);
    EXPECT_EQ(json.at("entries").size(), 6u);
    EXPECT_FALSE(json.at("dryRun").get<bool>());
  }

} // namespace tempo::test
