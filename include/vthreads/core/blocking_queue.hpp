// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace vthreads
{
namespace core
{

/// \brief Unbounded, thread-safe FIFO with blocking pop.
///
/// Any number of producers and consumers may use the queue concurrently.
/// push() never blocks. pop() blocks while the queue is empty, until an item
/// arrives. Items are handed out strictly in push order. There is no close
/// operation: consumers are stopped by pushing an item they recognise as a
/// stop marker.
///
/// Example usage:
/// \code
///   BlockingQueue<Job> queue;
///
///   // Producer
///   queue.push(std::move(job));
///
///   // Consumer (blocks until an item is available)
///   Job next;
///   queue.pop(next);
/// \endcode
///
/// \tparam T Element type; must be move-assignable and default-constructible
template <typename T> class BlockingQueue
{
public:
  BlockingQueue() = default;

  BlockingQueue(const BlockingQueue &) = delete;
  BlockingQueue &operator=(const BlockingQueue &) = delete;
  BlockingQueue(BlockingQueue &&) = delete;
  BlockingQueue &operator=(BlockingQueue &&) = delete;

  /// \brief Append an item.
  void push(const T &item)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _queue.push_back(item);
    }
    _condNotEmpty.notify_one();
  }

  /// \brief Append an item (move version).
  void push(T &&item)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _queue.push_back(std::move(item));
    }
    _condNotEmpty.notify_one();
  }

  /// \brief Remove the oldest item, blocking while the queue is empty.
  ///
  /// \param[out] out Receives the item
  void pop(T &out)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _condNotEmpty.wait(lock, [this]() { return !_queue.empty(); });
    takeFront(out);
  }

  /// \brief Remove the oldest item without blocking.
  /// \return false if the queue is empty
  bool tryPop(T &out)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return takeFront(out);
  }

  /// \brief Number of items currently queued.
  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
  }

private:
  // Caller holds _mutex.
  bool takeFront(T &out)
  {
    if (_queue.empty())
    {
      return false;
    }
    out = std::move(_queue.front());
    _queue.pop_front();
    return true;
  }

  mutable std::mutex _mutex;
  std::condition_variable _condNotEmpty;
  std::deque<T> _queue;
};

} // namespace core
} // namespace vthreads
