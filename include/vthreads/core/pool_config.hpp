// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include <vthreads/core/config_loader.hpp>
#include <vthreads/core/error_policy.hpp>
#include <vthreads/core/logger.hpp>
#include <vthreads/core/worker.hpp>

namespace vthreads
{
namespace core
{

/// \brief Construction parameters for a ThreadPool.
struct PoolConfig
{
  std::string name = "Thread Pool";
  std::size_t minThreads = 2;
  std::size_t maxThreads = 10;
  /// Detach workers on pool destruction instead of joining them.
  bool daemon = false;
  ErrorPolicy errorPolicy;
  /// Resolve the future of a job that killed its worker with that error,
  /// instead of leaving it unresolved.
  bool resolveOnFatal = false;
  WorkerContext::FatalHandler onFatalError;

  /// \throws std::invalid_argument if the thread bounds are inconsistent
  void validate() const
  {
    if (maxThreads == 0)
    {
      throw std::invalid_argument("PoolConfig: maxThreads must be at least 1");
    }
    if (maxThreads < minThreads)
    {
      throw std::invalid_argument("PoolConfig: maxThreads (" + std::to_string(maxThreads) +
                                  ") is less than minThreads (" + std::to_string(minThreads) +
                                  ")");
    }
  }

  /// \brief Read the [pool] table. Missing keys keep their defaults.
  ///
  /// \code
  ///   [pool]
  ///   name = "Thread Pool"
  ///   min_threads = 2
  ///   max_threads = 10
  ///   daemon = false
  ///   resolve_on_fatal = false
  ///   error_policy = "standard"   # or "capture_all"
  /// \endcode
  ///
  /// \throws std::runtime_error for negative counts or an unknown policy,
  /// std::invalid_argument if the result fails validate()
  static PoolConfig fromConfig(const ConfigLoader &loader)
  {
    PoolConfig config;
    if (auto v = loader.getString("pool.name"))
    {
      config.name = *v;
    }
    if (auto v = loader.getInt("pool.min_threads"))
    {
      config.minThreads = toCount("pool.min_threads", *v);
    }
    if (auto v = loader.getInt("pool.max_threads"))
    {
      config.maxThreads = toCount("pool.max_threads", *v);
    }
    if (auto v = loader.getBool("pool.daemon"))
    {
      config.daemon = *v;
    }
    if (auto v = loader.getBool("pool.resolve_on_fatal"))
    {
      config.resolveOnFatal = *v;
    }
    if (auto v = loader.getString("pool.error_policy"))
    {
      try
      {
        config.errorPolicy = ErrorPolicy::fromName(*v);
      }
      catch (const std::invalid_argument &e)
      {
        throw std::runtime_error(std::string("pool.error_policy: ") + e.what());
      }
    }
    config.validate();
    return config;
  }

private:
  static std::size_t toCount(const char *key, int64_t value)
  {
    if (value < 0)
    {
      throw std::runtime_error(std::string(key) + " must not be negative");
    }
    return static_cast<std::size_t>(value);
  }
};

/// \brief Apply the [log] table (level, file, async, format) to the Logger.
/// \throws std::runtime_error for an unknown level
inline void configureLogging(const ConfigLoader &loader)
{
  Logger::Level level = Logger::getLevel();
  if (auto v = loader.getString("log.level"))
  {
    try
    {
      level = Logger::levelFromString(*v);
    }
    catch (const std::invalid_argument &e)
    {
      throw std::runtime_error(std::string("log.level: ") + e.what());
    }
  }
  Logger::init(level, loader.getString("log.file").value_or(""),
               loader.getBool("log.async").value_or(false));
  if (auto v = loader.getString("log.format"))
  {
    Logger::setLogFormat(*v);
  }
}

} // namespace core
} // namespace vthreads
