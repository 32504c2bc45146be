// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>

namespace vthreads
{
namespace core
{

/// \brief Thrown by ThreadPool::submit() and friends once shutdown() has
/// been called.
class PoolShutDown : public std::runtime_error
{
public:
  explicit PoolShutDown(const std::string &poolName)
      : std::runtime_error("Thread pool '" + poolName + "' has been shut down")
  {
  }
};

/// \brief Raised by a job to signal an unrecoverable condition. The default
/// ErrorPolicy never captures it into the job's Future; it terminates the
/// worker that ran the job instead.
class FatalWorkerError : public std::runtime_error
{
public:
  explicit FatalWorkerError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Thrown when a thread releases a VLock it does not own.
class NotOwner : public std::logic_error
{
public:
  NotOwner() : std::logic_error("VLock released by a thread that does not own it") {}
};

/// \brief Thrown on a second attempt to resolve a Future.
class AlreadyResolved : public std::logic_error
{
public:
  AlreadyResolved() : std::logic_error("Future has already been resolved") {}
};

} // namespace core
} // namespace vthreads
