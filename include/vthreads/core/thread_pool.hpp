// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <vthreads/core/errors.hpp>
#include <vthreads/core/future.hpp>
#include <vthreads/core/job.hpp>
#include <vthreads/core/json.hpp>
#include <vthreads/core/logger.hpp>
#include <vthreads/core/pool_config.hpp>
#include <vthreads/core/worker.hpp>

namespace vthreads
{
namespace core
{

/// Counters accumulated over the life of the pool.
struct PoolStats
{
  std::uint64_t submitted = 0; ///< Jobs accepted by submit()
  std::uint64_t completed = 0; ///< Jobs that returned normally
  std::uint64_t failed = 0;    ///< Jobs whose error was captured in the future
  std::uint64_t fatal = 0;     ///< Jobs whose error terminated their worker
  std::uint64_t spawned = 0;   ///< Worker threads started
  std::size_t peakLive = 0;    ///< Largest tracked worker count observed

  Json toJson() const
  {
    return Json{{"submitted", submitted}, {"completed", completed}, {"failed", failed},
                {"fatal", fatal},         {"spawned", spawned},     {"peakLive", peakLive}};
  }
};

/// An elastic pool of worker threads fed by one FIFO job queue.
///
/// The pool never has fewer than minThreads live workers after a call to
/// checkThreads() (which runs at construction and on every submission), and
/// never more than maxThreads. Between those bounds it grows only when the
/// queue holds more jobs than there are idle workers. It shrinks only when
/// workers die: through shutdown(), retireWorker(), or a fatal job error.
class ThreadPool
{
public:
  using WorkerList = std::vector<std::shared_ptr<const Worker>>;

public:
  /// Constructs the pool and starts minThreads workers.
  ///
  /// @throws std::invalid_argument if the thread bounds are inconsistent
  explicit ThreadPool(PoolConfig config = PoolConfig())
      : _config(std::move(config)), _context(std::make_shared<WorkerContext>()), _shutdown(false),
        _nameCounter(0), _submitted(0), _spawned(0), _peakLive(0)
  {
    _config.validate();
    _context->errorPolicy = _config.errorPolicy;
    _context->resolveOnFatal = _config.resolveOnFatal;
    _context->onFatalError = _config.onFatalError;

    VTHREADS_LOG_INFO("ThreadPool '" << _config.name << "' created (min=" << _config.minThreads
                                     << ", max=" << _config.maxThreads
                                     << ", daemon=" << (_config.daemon ? "yes" : "no")
                                     << ", errorPolicy=" << _config.errorPolicy.name() << ")");
    std::lock_guard<std::mutex> lock(_mutex);
    checkThreadsLocked();
  }

  /// @param name       Diagnostic label; workers are named "<name> - <n>".
  /// @param minThreads Live workers always maintained.
  /// @param maxThreads Hard upper bound on live workers.
  /// @param daemon     Detach instead of join workers on destruction.
  ThreadPool(std::string name, std::size_t minThreads, std::size_t maxThreads, bool daemon = false)
      : ThreadPool(makeConfig(std::move(name), minThreads, maxThreads, daemon))
  {
  }

  /// Shuts the pool down if needed, then joins every worker (or detaches
  /// them for a daemon pool). Jobs queued before the shutdown still run.
  ~ThreadPool()
  {
    shutdown();

    std::vector<std::shared_ptr<Worker>> workers;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      workers.swap(_workers);
    }

    for (const auto &worker : workers)
    {
      if (_config.daemon)
      {
        worker->detach();
      }
      else
      {
        worker->join();
      }
    }
    VTHREADS_LOG_DEBUG("ThreadPool '" << _config.name << "' destroyed ("
                                      << (_config.daemon ? "detached " : "joined ")
                                      << workers.size() << " workers)");
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /// Queue a call and get a future for its result. Never blocks.
  ///
  /// @throws PoolShutDown once shutdown() has been called
  template <typename F, typename... Args>
  auto submit(F &&func, Args &&...args) -> Future<std::decay_t<std::invoke_result_t<F, Args...>>>
  {
    return submitWithValue(std::any{}, std::forward<F>(func), std::forward<Args>(args)...);
  }

  /// Like submit(), but attaches \p associated to the job. While a worker
  /// runs the job, Worker::associatedValue() returns it.
  ///
  /// @throws PoolShutDown once shutdown() has been called
  template <typename F, typename... Args>
  auto submitWithValue(std::any associated, F &&func, Args &&...args)
    -> Future<std::decay_t<std::invoke_result_t<F, Args...>>>
  {
    using ResultType = std::decay_t<std::invoke_result_t<F, Args...>>;
    auto state = std::make_shared<detail::FutureState<ResultType>>();
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);

    Job job;
    job.future = state;
    job.associated = std::move(associated);
    if constexpr (std::is_void_v<ResultType>)
    {
      job.callable = [state, bound = std::move(bound)]() mutable
      {
        bound();
        state->resolve();
      };
    }
    else
    {
      job.callable = [state, bound = std::move(bound)]() mutable { state->resolve(bound()); };
    }

    enqueue(std::move(job));
    return Future<ResultType>(state);
  }

  /// Make the worker set match the elasticity rules: prune dead workers,
  /// top up to minThreads, then add one worker per queued job that has no
  /// idle worker waiting for it, up to maxThreads. Called automatically;
  /// clients rarely need it.
  ///
  /// @throws PoolShutDown once shutdown() has been called
  void checkThreads()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_shutdown)
    {
      throw PoolShutDown(_config.name);
    }
    checkThreadsLocked();
  }

  /// Refuse further submissions and queue one sentinel per live worker, so
  /// each exits after the jobs queued ahead of it. Does not wait.
  void shutdown()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_shutdown)
    {
      return;
    }
    _shutdown = true;
    pruneDeadLocked();
    for (std::size_t i = 0; i < _workers.size(); ++i)
    {
      _context->queue.push(Job::sentinel());
    }
    VTHREADS_LOG_INFO("ThreadPool '" << _config.name << "' shutting down " << _workers.size()
                                     << " workers (" << _context->queue.size()
                                     << " items queued)");
  }

  /// Queue a single sentinel. The returned future resolves once a worker
  /// has taken it and exited. A later submission may spawn a replacement
  /// if the pool drops below minThreads.
  ///
  /// @throws PoolShutDown once shutdown() has been called
  Future<void> retireWorker()
  {
    auto state = std::make_shared<detail::FutureState<void>>();
    std::lock_guard<std::mutex> lock(_mutex);
    if (_shutdown)
    {
      throw PoolShutDown(_config.name);
    }
    _context->queue.push(Job::sentinel(state));
    return Future<void>(state);
  }

  /// Block until every worker has terminated.
  ///
  /// @throws std::logic_error unless shutdown() has been called
  void join()
  {
    for (const auto &worker : snapshotForJoin())
    {
      worker->join();
    }
  }

  /// Wait at most \p timeout for every worker to terminate.
  /// @return true if no live worker remains
  /// @throws std::logic_error unless shutdown() has been called
  template <typename Rep, typename Period> bool joinFor(std::chrono::duration<Rep, Period> timeout)
  {
    auto workers = snapshotForJoin();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::any_of(workers.begin(), workers.end(),
                       [](const std::shared_ptr<Worker> &w) { return w->isAlive(); }))
    {
      if (std::chrono::steady_clock::now() >= deadline)
      {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    for (const auto &worker : workers)
    {
      worker->join();
    }
    return true;
  }

  /// Shut down, wait for every worker to die, then re-arm the pool:
  /// submissions are accepted again and minThreads fresh workers start.
  /// Jobs still queued (e.g. behind a worker killed by a fatal error) are
  /// kept in order; leftover sentinels are discarded and their futures
  /// resolved.
  void restart()
  {
    VTHREADS_LOG_INFO("ThreadPool '" << _config.name << "' restarting");
    shutdown();
    join();

    std::lock_guard<std::mutex> lock(_mutex);
    pruneDeadLocked();

    std::vector<Job> leftovers;
    Job job;
    while (_context->queue.tryPop(job))
    {
      if (job.isSentinel())
      {
        if (job.future)
        {
          job.future->resolveEmpty();
        }
      }
      else
      {
        leftovers.push_back(std::move(job));
      }
      job = Job{};
    }
    for (auto &pending : leftovers)
    {
      _context->queue.push(std::move(pending));
    }

    _shutdown = false;
    checkThreadsLocked();
    VTHREADS_LOG_INFO("ThreadPool '" << _config.name << "' restarted with " << _workers.size()
                                     << " workers, " << leftovers.size() << " jobs carried over");
  }

  /// Every tracked worker, including dead ones not yet pruned.
  WorkerList getThreads() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return WorkerList(_workers.begin(), _workers.end());
  }

  WorkerList getBusyThreads() const
  {
    return filterWorkers([](const Worker &w) { return w.isBusy(); });
  }

  WorkerList getIdleThreads() const
  {
    return filterWorkers([](const Worker &w) { return !w.isBusy(); });
  }

  WorkerList getLiveThreads() const
  {
    return filterWorkers([](const Worker &w) { return w.isAlive(); });
  }

  std::size_t getLiveThreadCount() const { return getLiveThreads().size(); }

  /// Jobs (and sentinels) waiting in the queue.
  std::size_t getPendingJobCount() const { return _context->queue.size(); }

  bool isShutDown() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _shutdown;
  }

  const std::string &name() const { return _config.name; }
  std::size_t minThreads() const { return _config.minThreads; }
  std::size_t maxThreads() const { return _config.maxThreads; }
  bool isDaemon() const { return _config.daemon; }
  const ErrorPolicy &errorPolicy() const { return _config.errorPolicy; }

  PoolStats stats() const
  {
    PoolStats s;
    s.completed = _context->completed.load(std::memory_order_relaxed);
    s.failed = _context->failed.load(std::memory_order_relaxed);
    s.fatal = _context->fatal.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(_mutex);
    s.submitted = _submitted;
    s.spawned = _spawned;
    s.peakLive = _peakLive;
    return s;
  }

  /// Diagnostic snapshot of configuration, workers and counters.
  Json toJson() const
  {
    Json workers = Json::array();
    for (const auto &worker : getThreads())
    {
      workers.push_back(worker->toJson());
    }
    return Json{{"name", _config.name},
                {"minThreads", _config.minThreads},
                {"maxThreads", _config.maxThreads},
                {"daemon", _config.daemon},
                {"errorPolicy", _config.errorPolicy.name()},
                {"shutDown", isShutDown()},
                {"pending", getPendingJobCount()},
                {"workers", std::move(workers)},
                {"stats", stats().toJson()}};
  }

private:
  static PoolConfig makeConfig(std::string name, std::size_t minThreads, std::size_t maxThreads,
                               bool daemon)
  {
    PoolConfig config;
    config.name = std::move(name);
    config.minThreads = minThreads;
    config.maxThreads = maxThreads;
    config.daemon = daemon;
    return config;
  }

  void enqueue(Job job)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_shutdown)
    {
      throw PoolShutDown(_config.name);
    }
    // Grow before queueing, so a failed spawn leaves the job unqueued.
    checkThreadsLocked(1);
    _context->queue.push(std::move(job));
    ++_submitted;
  }

  // Caller holds _mutex. \p incoming counts jobs about to be queued.
  void checkThreadsLocked(std::size_t incoming = 0)
  {
    pruneDeadLocked();
    while (_workers.size() < _config.minThreads)
    {
      addWorkerLocked();
    }
    while (idleCountLocked() < _context->queue.size() + incoming)
    {
      if (_workers.size() >= _config.maxThreads)
      {
        VTHREADS_LOG_TRACE("ThreadPool '" << _config.name << "' at maxThreads ("
                                          << _config.maxThreads << "), backlog waits");
        break;
      }
      addWorkerLocked();
    }
  }

  // Caller holds _mutex. Dead workers have left their loop, so the join
  // is immediate.
  void pruneDeadLocked()
  {
    auto it = std::remove_if(_workers.begin(), _workers.end(),
                             [](const std::shared_ptr<Worker> &w)
                             {
                               if (w->isAlive())
                               {
                                 return false;
                               }
                               w->join();
                               return true;
                             });
    _workers.erase(it, _workers.end());
  }

  // Caller holds _mutex.
  std::size_t idleCountLocked() const
  {
    return static_cast<std::size_t>(
      std::count_if(_workers.begin(), _workers.end(),
                    [](const std::shared_ptr<Worker> &w) { return !w->isBusy(); }));
  }

  // Caller holds _mutex.
  void addWorkerLocked()
  {
    auto worker = std::make_shared<Worker>(
      _nameCounter, _config.name + " - " + std::to_string(_nameCounter), _context);
    ++_nameCounter;
    worker->start();
    _workers.push_back(std::move(worker));
    ++_spawned;
    _peakLive = std::max(_peakLive, _workers.size());
    VTHREADS_LOG_DEBUG("ThreadPool '" << _config.name << "' spawned worker #" << _nameCounter - 1
                                      << " (" << _workers.size() << "/" << _config.maxThreads
                                      << ")");
  }

  WorkerList filterWorkers(const std::function<bool(const Worker &)> &predicate) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    WorkerList result;
    for (const auto &worker : _workers)
    {
      if (predicate(*worker))
      {
        result.push_back(worker);
      }
    }
    return result;
  }

  std::vector<std::shared_ptr<Worker>> snapshotForJoin() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_shutdown)
    {
      throw std::logic_error("ThreadPool '" + _config.name + "': join requires shutdown()");
    }
    return _workers;
  }

private:
  PoolConfig _config;
  std::shared_ptr<WorkerContext> _context;

  mutable std::mutex _mutex; // Guards everything below
  std::vector<std::shared_ptr<Worker>> _workers;
  bool _shutdown;
  std::size_t _nameCounter;
  std::uint64_t _submitted;
  std::uint64_t _spawned;
  std::size_t _peakLive;
};

} // namespace core
} // namespace vthreads
