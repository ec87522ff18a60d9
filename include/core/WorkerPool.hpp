#pragma once
/** @file  WorkerPool.hpp
 *  @brief Idle worker processes, pooled per VM configuration name.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Tempo headers
#include "core/RunConfig.hpp"
#include "io/WorkerProcess.hpp"

namespace tempo {
  namespace core {

    class Logger;
    class WorkerPool;

    /**
 * @class WorkerLease
 * @brief Exclusive ownership token for one worker during one trial.
 *
 *  * Destroying an unreleased lease destroys the worker (it is never reused).
 *  * `release()` / `discard()` are idempotent; only the first call counts.
 */
    class WorkerLease {
    public:
      WorkerLease() = default;
      WorkerLease(WorkerPool* pool, std::unique_ptr<io::WorkerProcess> worker);
      ~WorkerLease();

      WorkerLease(WorkerLease&& other) noexcept;
      WorkerLease& operator=(WorkerLease&& other) noexcept;
      WorkerLease(const WorkerLease&) = delete;
      WorkerLease& operator=(const WorkerLease&) = delete;

      io::WorkerProcess& worker() const { return *worker_; }
      io::WorkerProcess* operator->() const { return worker_.get(); }
      explicit operator bool() const { return worker_ != nullptr; }

      void release(); ///< back to the pool for reuse
      void discard(); ///< terminate + reap

    private:
      WorkerPool* pool_{ nullptr };
      std::unique_ptr<io::WorkerProcess> worker_{};
    };

    /**
 * @class WorkerPool
 * @brief Hands out leases; spawns outside the lock, reuses healthy idle workers.
 *
 *  * Thread-safe (mutex-protected idle map).
 *  * The spawner is a seam so tests can inject fake workers.
 */
    class WorkerPool {
    public:
      using Spawner = std::function<std::unique_ptr<io::WorkerProcess>(const VmConfig&)>;

      WorkerPool(Spawner spawner, std::shared_ptr<Logger> logger);
      ~WorkerPool(); ///< shutdown()

      /// Spawns real processes via WorkerProcess::start.
      static Spawner processSpawner(io::WorkerLauncher launcher, const SchedulerConfig& cfg);

      /// @throws WorkerStartupFailure when a new worker cannot be started.
      WorkerLease acquire(const VmConfig& vm);

      /// Terminates every idle worker; later releases are discarded.
      void shutdown();

      std::size_t idleCount() const;
      std::size_t spawnedCount() const;

      WorkerPool(const WorkerPool&) = delete;
      WorkerPool& operator=(const WorkerPool&) = delete;

    private:
      friend class WorkerLease;
      void giveBack(std::unique_ptr<io::WorkerProcess> worker);

      Spawner spawner_;
      std::shared_ptr<Logger> logger_;
      std::map<std::string, std::vector<std::unique_ptr<io::WorkerProcess>>> idle_{};
      std::size_t spawned_{ 0 };
      bool shutdown_{ false };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace tempo
