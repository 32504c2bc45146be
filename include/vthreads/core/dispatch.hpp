// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include <vthreads/core/future.hpp>
#include <vthreads/core/thread_pool.hpp>
#include <vthreads/core/vlock.hpp>

namespace vthreads
{
namespace core
{

/// \brief A callable that runs the wrapped function on a pool.
///
/// \code
///   auto load = makeAsync(pool, [](const std::string &path) { return readFile(path); });
///   Future<std::string> contents = load("/etc/hosts");
/// \endcode
///
/// The pool must outlive the wrapper.
template <typename F> class Async
{
public:
  Async(ThreadPool &pool, F func) : _pool(&pool), _func(std::move(func)) {}

  /// Submit the call and return its Future without waiting.
  /// \throws PoolShutDown if the pool has been shut down
  template <typename... Args> auto operator()(Args &&...args) const
  {
    return _pool->submit(_func, std::forward<Args>(args)...);
  }

  ThreadPool &pool() const { return *_pool; }

private:
  ThreadPool *_pool;
  F _func;
};

template <typename F> Async<std::decay_t<F>> makeAsync(ThreadPool &pool, F &&func)
{
  return Async<std::decay_t<F>>(pool, std::forward<F>(func));
}

/// \brief A callable that runs the wrapped function while holding a VLock,
/// returning its result. The lock is released even if the function throws.
template <typename F> class Locked
{
public:
  Locked(std::shared_ptr<VLock> lock, F func) : _lock(std::move(lock)), _func(std::move(func)) {}

  template <typename... Args> decltype(auto) operator()(Args &&...args) const
  {
    std::lock_guard<VLock> guard(*_lock);
    return std::invoke(_func, std::forward<Args>(args)...);
  }

  const std::shared_ptr<VLock> &lock() const { return _lock; }

private:
  std::shared_ptr<VLock> _lock;
  F _func;
};

template <typename F> Locked<std::decay_t<F>> makeLocked(std::shared_ptr<VLock> lock, F &&func)
{
  return Locked<std::decay_t<F>>(std::move(lock), std::forward<F>(func));
}

} // namespace core
} // namespace vthreads
