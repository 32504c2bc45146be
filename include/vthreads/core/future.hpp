// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

#include <vthreads/core/errors.hpp>

namespace vthreads
{
namespace core
{

namespace detail
{

/// \brief Type-independent half of a future's shared state. Workers only
/// see this part: they resolve it with an error or, for sentinel jobs,
/// with no value at all.
class FutureStateBase
{
public:
  FutureStateBase() : _resolved(false) {}
  virtual ~FutureStateBase() = default;

  FutureStateBase(const FutureStateBase &) = delete;
  FutureStateBase &operator=(const FutureStateBase &) = delete;

  /// \brief Store \p error; every reader will rethrow it.
  /// \throws AlreadyResolved on a second resolution
  void resolveError(std::exception_ptr error)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      ensureUnresolved();
      _error = std::move(error);
      _resolved = true;
    }
    _cv.notify_all();
  }

  /// \brief Resolve without a value (used by sentinel jobs).
  /// \throws AlreadyResolved on a second resolution
  void resolveEmpty()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      ensureUnresolved();
      _resolved = true;
    }
    _cv.notify_all();
  }

  bool isResolved() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _resolved;
  }

  bool hasError() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _resolved && _error != nullptr;
  }

  void wait() const
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait(lock, [this]() { return _resolved; });
  }

  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> timeout) const
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cv.wait_for(lock, timeout, [this]() { return _resolved; });
  }

protected:
  void ensureUnresolved() const
  {
    if (_resolved)
    {
      throw AlreadyResolved();
    }
  }

  /// Blocks until resolved, rethrows a stored error. Returns with the lock
  /// held so the caller can read its value.
  std::unique_lock<std::mutex> waitResolved() const
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait(lock, [this]() { return _resolved; });
    if (_error)
    {
      std::rethrow_exception(_error);
    }
    return lock;
  }

  mutable std::mutex _mutex;
  mutable std::condition_variable _cv;
  bool _resolved;
  std::exception_ptr _error;
};

template <typename T> class FutureState : public FutureStateBase
{
public:
  /// \throws AlreadyResolved on a second resolution
  void resolve(T value)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      ensureUnresolved();
      _value.emplace(std::move(value));
      _resolved = true;
    }
    _cv.notify_all();
  }

  const T &get() const
  {
    auto lock = waitResolved();
    if (!_value)
    {
      throw std::logic_error("Future was resolved without a value");
    }
    return *_value;
  }

private:
  std::optional<T> _value;
};

template <> class FutureState<void> : public FutureStateBase
{
public:
  /// \throws AlreadyResolved on a second resolution
  void resolve() { resolveEmpty(); }

  void get() const { waitResolved(); }
};

} // namespace detail

/// \brief Single-assignment result handle returned by ThreadPool::submit().
///
/// Copies share one state. get() blocks until the producing job has run,
/// then returns the same cached value (or rethrows the same captured error)
/// on every call, from any number of threads.
template <typename T> class Future
{
public:
  using value_type = T;

  Future() = default;
  explicit Future(std::shared_ptr<detail::FutureState<T>> state) : _state(std::move(state)) {}

  bool valid() const { return _state != nullptr; }

  /// \brief Block until resolved; return the value or rethrow the job's
  /// error. Non-void results are returned by const reference into the
  /// shared state.
  ///
  /// The reference is valid only while some Future sharing the state is
  /// alive. Copy the value when the handle is a temporary:
  /// \code
  ///   std::string s = pool.submit(f).get();          // ok, copied
  ///   const std::string &r = pool.submit(f).get();   // dangles
  /// \endcode
  decltype(auto) get() const { return state().get(); }

  bool isResolved() const { return state().isResolved(); }

  /// \brief True once resolved with an error.
  bool hasError() const { return state().hasError(); }

  void wait() const { state().wait(); }

  /// \brief Wait at most \p timeout.
  /// \return true if the future is resolved
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> timeout) const
  {
    return state().waitFor(timeout);
  }

private:
  const detail::FutureState<T> &state() const
  {
    if (!_state)
    {
      throw std::logic_error("Future has no shared state");
    }
    return *_state;
  }

  std::shared_ptr<detail::FutureState<T>> _state;
};

} // namespace core
} // namespace vthreads
