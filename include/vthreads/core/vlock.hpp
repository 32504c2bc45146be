// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <vthreads/core/errors.hpp>

namespace vthreads
{
namespace core
{

/// \brief A reentrant mutual-exclusion lock whose owner and waiting threads
/// can be inspected.
///
/// The owning thread may acquire it again; each acquire must be balanced by
/// a release. Threads blocked in acquire() appear in waiting() in the order
/// they started waiting. That order is informational only: which waiter
/// wins the lock next is up to the scheduler.
///
/// Satisfies Lockable, so std::lock_guard and std::unique_lock work.
class VLock
{
public:
  VLock() : _holdCount(0) {}

  VLock(const VLock &) = delete;
  VLock &operator=(const VLock &) = delete;

  /// \brief Take the lock for the calling thread.
  /// \param blocking when false, return false instead of waiting
  /// \return true once the caller owns the lock
  bool acquire(bool blocking = true)
  {
    const auto self = std::this_thread::get_id();
    std::unique_lock<std::mutex> lock(_mutex);
    if (_owner == self)
    {
      ++_holdCount;
      return true;
    }
    if (!_owner)
    {
      take(self);
      return true;
    }
    if (!blocking)
    {
      return false;
    }

    _waiting.push_back(self);
    _cv.wait(lock, [this]() { return !_owner; });
    removeWaiter(self);
    take(self);
    return true;
  }

  /// \brief Blocking acquire that gives up after \p timeout.
  /// \return false if the lock could not be taken in time
  template <typename Rep, typename Period>
  bool acquireFor(std::chrono::duration<Rep, Period> timeout)
  {
    const auto self = std::this_thread::get_id();
    std::unique_lock<std::mutex> lock(_mutex);
    if (_owner == self)
    {
      ++_holdCount;
      return true;
    }

    _waiting.push_back(self);
    const bool free = _cv.wait_for(lock, timeout, [this]() { return !_owner; });
    removeWaiter(self);
    if (!free)
    {
      return false;
    }
    take(self);
    return true;
  }

  /// \brief Undo one acquire by the owning thread.
  /// \return true if this release freed the lock, false if the owner still
  /// holds it through an outer acquire
  /// \throws NotOwner if the calling thread does not own the lock
  bool release()
  {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_owner != std::this_thread::get_id())
    {
      throw NotOwner();
    }
    if (--_holdCount > 0)
    {
      return false;
    }
    _owner.reset();
    lock.unlock();
    _cv.notify_one();
    return true;
  }

  bool isLocked() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _owner.has_value();
  }

  std::optional<std::thread::id> owner() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _owner;
  }

  /// Threads currently blocked acquiring, oldest first.
  std::vector<std::thread::id> waiting() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _waiting;
  }

  std::size_t holdCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _holdCount;
  }

  /// e.g. "<VLock owner = 140213 waiting = [140214, 140215] >"
  std::string describe() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::ostringstream oss;
    oss << "<VLock owner = ";
    if (_owner)
    {
      oss << *_owner;
    }
    else
    {
      oss << "None";
    }
    oss << " waiting = [";
    for (std::size_t i = 0; i < _waiting.size(); ++i)
    {
      if (i > 0)
      {
        oss << ", ";
      }
      oss << _waiting[i];
    }
    oss << "] >";
    return oss.str();
  }

  // Lockable
  void lock() { acquire(true); }
  void unlock() { release(); }
  bool try_lock() { return acquire(false); }

private:
  // Caller holds _mutex.
  void take(std::thread::id self)
  {
    _owner = self;
    _holdCount = 1;
  }

  // Caller holds _mutex.
  void removeWaiter(std::thread::id self)
  {
    auto it = std::find(_waiting.begin(), _waiting.end(), self);
    if (it != _waiting.end())
    {
      _waiting.erase(it);
    }
  }

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::optional<std::thread::id> _owner;
  std::vector<std::thread::id> _waiting;
  std::size_t _holdCount;
};

} // namespace core
} // namespace vthreads
