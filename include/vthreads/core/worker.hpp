// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <any>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <vthreads/core/error_policy.hpp>
#include <vthreads/core/job.hpp>
#include <vthreads/core/json.hpp>
#include <vthreads/core/logger.hpp>

namespace vthreads
{
namespace core
{

/// \brief State shared by a pool and all of its workers. Workers hold it by
/// shared_ptr so that detached workers never reach into a destroyed pool.
struct WorkerContext
{
  using FatalHandler = std::function<void(const std::string &workerName, std::exception_ptr)>;

  JobQueue queue;
  ErrorPolicy errorPolicy;
  bool resolveOnFatal = false;
  FatalHandler onFatalError;

  std::atomic<std::uint64_t> completed{0}; ///< Jobs that returned normally
  std::atomic<std::uint64_t> failed{0};    ///< Jobs whose error was captured
  std::atomic<std::uint64_t> fatal{0};     ///< Jobs that killed their worker
};

/// \brief A thread that takes jobs from the pool's queue and runs them,
/// one at a time, until it receives a sentinel job.
///
/// Idle -> Running -> Idle -> ... -> Terminated. A terminated worker is never
/// restarted; the pool spawns a new one instead.
class Worker : public std::enable_shared_from_this<Worker>
{
public:
  enum class State
  {
    Idle,
    Running,
    Terminated
  };

  Worker(std::size_t id, std::string name, std::shared_ptr<WorkerContext> context)
      : _id(id), _name(std::move(name)), _context(std::move(context)), _state(State::Idle),
        _busy(false), _alive(false), _hasJob(false)
  {
  }

  ~Worker()
  {
    if (_thread.joinable())
    {
      if (_thread.get_id() == std::this_thread::get_id())
      {
        _thread.detach();
      }
      else
      {
        _thread.join();
      }
    }
  }

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  /// \brief Launch the worker thread. The thread keeps the worker alive.
  void start()
  {
    _alive.store(true, std::memory_order_release);
    _thread = std::thread([self = shared_from_this()]() { self->run(); });
    _threadId = _thread.get_id();
  }

  /// \brief Wait for the thread to finish. Safe to call from several
  /// threads; a no-op from the worker's own thread.
  void join()
  {
    std::lock_guard<std::mutex> lock(_threadMutex);
    if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
    {
      _thread.join();
    }
  }

  void detach()
  {
    std::lock_guard<std::mutex> lock(_threadMutex);
    if (_thread.joinable())
    {
      _thread.detach();
    }
  }

  std::size_t id() const { return _id; }
  const std::string &name() const { return _name; }
  std::thread::id threadId() const { return _threadId; }

  State state() const { return _state.load(std::memory_order_acquire); }
  bool isBusy() const { return _busy.load(std::memory_order_acquire); }
  bool isAlive() const { return _alive.load(std::memory_order_acquire); }

  /// \brief True while a job (or sentinel) taken from the queue is being
  /// handled.
  bool hasJob() const
  {
    std::lock_guard<std::mutex> lock(_jobMutex);
    return _hasJob;
  }

  /// \brief The associated value submitted with the current job; empty when
  /// idle or when none was given.
  std::any associatedValue() const
  {
    std::lock_guard<std::mutex> lock(_jobMutex);
    return _associated;
  }

  Json toJson() const
  {
    std::ostringstream tid;
    tid << _threadId;
    return Json{{"id", _id},
                {"name", _name},
                {"thread", tid.str()},
                {"state", stateToString(state())},
                {"busy", isBusy()},
                {"alive", isAlive()}};
  }

  static const char *stateToString(State state)
  {
    switch (state)
    {
    case State::Idle:
      return "idle";
    case State::Running:
      return "running";
    case State::Terminated:
      return "terminated";
    }
    return "unknown";
  }

private:
  void run()
  {
    VTHREADS_LOG_DEBUG("Worker '" << _name << "' started");
    try
    {
      loop();
    }
    catch (const std::exception &e)
    {
      // Only reachable through a broken invariant (e.g. AlreadyResolved).
      VTHREADS_LOG_FATAL("Worker '" << _name << "' aborted: " << e.what());
      notifyFatal(std::current_exception());
    }
    setCurrentJob(nullptr);
    _busy.store(false, std::memory_order_release);
    _state.store(State::Terminated, std::memory_order_release);
    _alive.store(false, std::memory_order_release);
    VTHREADS_LOG_DEBUG("Worker '" << _name << "' terminated");
  }

  void loop()
  {
    while (true)
    {
      _busy.store(false, std::memory_order_release);
      _state.store(State::Idle, std::memory_order_release);

      Job job;
      _context->queue.pop(job);

      _busy.store(true, std::memory_order_release);
      setCurrentJob(&job);

      if (job.isSentinel())
      {
        VTHREADS_LOG_DEBUG("Worker '" << _name << "' received sentinel");
        if (job.future)
        {
          job.future->resolveEmpty();
        }
        return;
      }

      _state.store(State::Running, std::memory_order_release);
      if (!execute(job))
      {
        return;
      }
      setCurrentJob(nullptr);
    }
  }

  /// Runs one job. Returns false if the job raised a fatal error.
  bool execute(Job &job)
  {
    try
    {
      job.callable();
      _context->completed.fetch_add(1, std::memory_order_relaxed);
      return true;
    }
    catch (...)
    {
      auto error = std::current_exception();
      if (_context->errorPolicy.isCapturable(error))
      {
        _context->failed.fetch_add(1, std::memory_order_relaxed);
        VTHREADS_LOG_TRACE("Worker '" << _name << "' captured job error: "
                                      << describeException(error));
        if (job.future)
        {
          job.future->resolveError(error);
        }
        return true;
      }

      _context->fatal.fetch_add(1, std::memory_order_relaxed);
      VTHREADS_LOG_ERROR("Worker '" << _name
                                    << "' terminated by fatal job error: " << describeException(error)
                                    << (_context->resolveOnFatal ? "" : " (future left unresolved)"));
      if (_context->resolveOnFatal && job.future)
      {
        job.future->resolveError(error);
      }
      notifyFatal(error);
      return false;
    }
  }

  void notifyFatal(std::exception_ptr error)
  {
    if (!_context->onFatalError)
    {
      return;
    }
    try
    {
      _context->onFatalError(_name, error);
    }
    catch (const std::exception &e)
    {
      VTHREADS_LOG_ERROR("Fatal error handler of worker '" << _name << "' threw: " << e.what());
    }
  }

  void setCurrentJob(const Job *job)
  {
    std::lock_guard<std::mutex> lock(_jobMutex);
    _hasJob = job != nullptr;
    _associated = job ? job->associated : std::any{};
  }

  const std::size_t _id;
  const std::string _name;
  std::shared_ptr<WorkerContext> _context;
  std::mutex _threadMutex;
  std::thread _thread;
  std::thread::id _threadId;

  std::atomic<State> _state;
  std::atomic<bool> _busy;
  std::atomic<bool> _alive;

  mutable std::mutex _jobMutex;
  bool _hasJob;
  std::any _associated;
};

} // namespace core
} // namespace vthreads
