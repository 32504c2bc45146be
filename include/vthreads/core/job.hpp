// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <any>
#include <functional>
#include <memory>

#include <vthreads/core/blocking_queue.hpp>
#include <vthreads/core/future.hpp>

namespace vthreads
{
namespace core
{

/// \brief One unit of work as it travels through the job queue.
///
/// `callable` runs the user function and resolves `future` with its result;
/// if it throws, the worker decides what happens to the error. A job with an
/// empty `callable` is a sentinel: the worker that dequeues it resolves
/// `future` (if any) with no value and exits.
struct Job
{
  std::function<void()> callable;
  std::shared_ptr<detail::FutureStateBase> future;
  std::any associated;

  bool isSentinel() const { return !callable; }

  static Job sentinel(std::shared_ptr<detail::FutureStateBase> future = nullptr)
  {
    Job job;
    job.future = std::move(future);
    return job;
  }
};

using JobQueue = BlockingQueue<Job>;

} // namespace core
} // namespace vthreads
