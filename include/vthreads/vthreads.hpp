// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/dispatch.hpp"
#include "core/errors.hpp"
#include "core/future.hpp"
#include "core/lock_registry.hpp"
#include "core/logger.hpp"
#include "core/pool_config.hpp"
#include "core/thread_pool.hpp"
#include "core/vlock.hpp"
#include <memory>
#include <string>

#define VTHREADS_VERSION_MAJOR 1
#define VTHREADS_VERSION_MINOR 0
#define VTHREADS_VERSION_PATCH 0
#define VTHREADS_VERSION_STRING "1.0.0"

#define VTHREADS_DEFAULT_CONFIG_FILE_PATH "/etc/vthreads.conf.d/vthreads.toml"

namespace vthreads
{

/// \brief Load a TOML file, apply its [log] table to the Logger and build a
/// pool from its [pool] table.
///
/// \throws std::runtime_error if the file cannot be read or holds invalid
/// values, std::invalid_argument if the thread bounds are inconsistent
inline std::unique_ptr<core::ThreadPool>
makePoolFromFile(const std::string &path = VTHREADS_DEFAULT_CONFIG_FILE_PATH)
{
  core::ConfigLoader loader(path);
  loader.load();
  core::configureLogging(loader);
  return std::make_unique<core::ThreadPool>(core::PoolConfig::fromConfig(loader));
}

} // namespace vthreads
