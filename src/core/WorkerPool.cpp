/* @file WorkerPool.cpp
 * @brief pooled worker processes + RAII leases
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// Tempo headers
#include "core/Logger.hpp"
#include "core/WorkerPool.hpp"

using namespace tempo::core;
using tempo::io::WorkerProcess;

//---WorkerLease--------------------------------------------------------------

WorkerLease::WorkerLease(WorkerPool* pool, std::unique_ptr<WorkerProcess> worker)
    : pool_(pool), worker_(std::move(worker)) {}

WorkerLease::~WorkerLease() { discard(); }

WorkerLease::WorkerLease(WorkerLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)), worker_(std::move(other.worker_)) {}

WorkerLease& WorkerLease::operator=(WorkerLease&& other) noexcept {
  if (this != &other) {
    discard();
    pool_ = std::exchange(other.pool_, nullptr);
    worker_ = std::move(other.worker_);
  }
  return *this;
}

void WorkerLease::release() {
  if (!worker_)
    return;
  if (pool_)
    pool_->giveBack(std::move(worker_));
  else
    worker_.reset();
}

void WorkerLease::discard() {
  if (!worker_)
    return;
  worker_->terminate();
  worker_.reset();
}

//---WorkerPool---------------------------------------------------------------

WorkerPool::WorkerPool(Spawner spawner, std::shared_ptr<Logger> logger)
    : spawner_(std::move(spawner)), logger_(std::move(logger)) {}

WorkerPool::~WorkerPool() { shutdown(); }

WorkerPool::Spawner WorkerPool::processSpawner(io::WorkerLauncher launcher, const SchedulerConfig& cfg) {
  if (!launcher)
    launcher = io::defaultLaunchSpec;
  return [launcher = std::move(launcher), startup = cfg.startupTimeout,
          grace = cfg.terminateGrace](const VmConfig& vm) {
    return WorkerProcess::start(vm, launcher(vm), startup, grace);
  };
}

WorkerLease WorkerPool::acquire(const VmConfig& vm) {
  std::vector<std::unique_ptr<WorkerProcess>> dead;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& bucket = idle_[vm.name];
    while (!bucket.empty()) {
      auto candidate = std::move(bucket.back());
      bucket.pop_back();
      if (candidate->isAlive())
        return WorkerLease(this, std::move(candidate));
      dead.push_back(std::move(candidate));
    }
  }
  if (!dead.empty() && logger_)
    logger_->warn("WorkerPool", "dropped " + std::to_string(dead.size()) + " dead idle worker(s) of VM " + vm.name);
  dead.clear();

  // spawning takes a handshake round-trip: never under the lock
  auto worker = spawner_(vm);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++spawned_;
  }
  if (logger_)
    logger_->debug("WorkerPool", "spawned worker pid " + std::to_string(worker->pid()) + " for VM " + vm.name);
  return WorkerLease(this, std::move(worker));
}

void WorkerPool::giveBack(std::unique_ptr<WorkerProcess> worker) {
  std::unique_ptr<WorkerProcess> rejected;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutdown_ || worker->terminated())
      rejected = std::move(worker);
    else
      idle_[worker->vmName()].push_back(std::move(worker));
  }
  if (rejected)
    rejected->terminate();
}

void WorkerPool::shutdown() {
  std::map<std::string, std::vector<std::unique_ptr<WorkerProcess>>> idle;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutdown_ = true;
    idle.swap(idle_);
  }
  for (auto& [vm, workers] : idle)
    for (auto& w : workers)
      w->terminate();
}

std::size_t WorkerPool::idleCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::size_t n = 0;
  for (const auto& [vm, workers] : idle_)
    n += workers.size();
  return n;
}

std::size_t WorkerPool::spawnedCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return spawned_;
}
