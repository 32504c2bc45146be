// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <type_traits>
#include <unordered_map>

#include <vthreads/core/vlock.hpp>

namespace vthreads
{
namespace core
{

namespace detail
{
/// Arguments a LockRegistry can key on: a named object (an lvalue), or a
/// pointer to an object. Temporaries are rejected since their address is
/// reused by later, unrelated objects.
template <typename T>
using LockKeyArg = std::enable_if_t<
  std::is_lvalue_reference<T>::value ||
  (std::is_pointer<std::decay_t<T>>::value &&
   std::is_object<std::remove_pointer_t<std::decay_t<T>>>::value)>;
} // namespace detail

/// \brief Maps arbitrary objects, by address, to VLocks.
///
/// A lock is created the first time an object is seen and lives until
/// deleteLockFor() removes it. Handles already handed out stay valid after
/// removal, but a later lockFor() for the same object creates a new lock.
/// The lock only excludes other threads that go through the same registry.
///
/// Objects are identified by address. A pointer argument is keyed on the
/// object it points to, so `lockFor(obj)` and `lockFor(&obj)` return the
/// same lock. Temporaries do not compile.
class LockRegistry
{
public:
  LockRegistry() = default;
  LockRegistry(const LockRegistry &) = delete;
  LockRegistry &operator=(const LockRegistry &) = delete;

  /// \brief The lock for \p object, created on first use.
  template <typename T, typename = detail::LockKeyArg<T>>
  std::shared_ptr<VLock> lockFor(T &&object)
  {
    return lockForKey(keyOf(object));
  }

  /// \brief Acquire (blocking) the lock for \p object.
  template <typename T, typename = detail::LockKeyArg<T>> void lock(T &&object)
  {
    lockForKey(keyOf(object))->acquire(true);
  }

  /// \brief Release one hold on the lock for \p object. Does nothing if the
  /// object has no lock.
  /// \throws NotOwner if the lock exists and the caller does not own it
  template <typename T, typename = detail::LockKeyArg<T>> void unlock(T &&object)
  {
    std::shared_ptr<VLock> lock = find(keyOf(object));
    if (lock)
    {
      lock->release();
    }
  }

  /// \brief Forget the lock for \p object. Safe if there is none.
  template <typename T, typename = detail::LockKeyArg<T>> void deleteLockFor(T &&object)
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _locks.erase(keyOf(object));
  }

  template <typename T, typename = detail::LockKeyArg<T>> bool contains(T &&object) const
  {
    std::lock_guard<std::mutex> guard(_mutex);
    return _locks.count(keyOf(object)) != 0;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> guard(_mutex);
    return _locks.size();
  }

private:
  using Key = const void *;

  template <typename T> static Key keyOf(const T &object)
  {
    if constexpr (std::is_pointer_v<T> && std::is_object_v<std::remove_pointer_t<T>>)
    {
      return static_cast<Key>(object);
    }
    else
    {
      return static_cast<Key>(std::addressof(object));
    }
  }

  std::shared_ptr<VLock> lockForKey(Key key)
  {
    std::lock_guard<std::mutex> guard(_mutex);
    auto &slot = _locks[key];
    if (!slot)
    {
      slot = std::make_shared<VLock>();
    }
    return slot;
  }

  std::shared_ptr<VLock> find(Key key) const
  {
    std::lock_guard<std::mutex> guard(_mutex);
    auto it = _locks.find(key);
    return it == _locks.end() ? nullptr : it->second;
  }

  mutable std::mutex _mutex;
  std::unordered_map<Key, std::shared_ptr<VLock>> _locks;
};

} // namespace core
} // namespace vthreads
