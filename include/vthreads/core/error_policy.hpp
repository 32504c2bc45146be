// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>

#include <vthreads/core/errors.hpp>

namespace vthreads
{
namespace core
{

/// \brief Decides, for an exception thrown by a job, whether the worker
/// captures it into the job's Future (the worker survives) or treats it as
/// fatal (the worker terminates).
class ErrorPolicy
{
public:
  using Predicate = std::function<bool(std::exception_ptr)>;

  /// \brief Capture every std::exception except FatalWorkerError.
  /// Exceptions of other types are fatal.
  ErrorPolicy() : _name("standard"), _isCapturable(&standardPredicate) {}

  ErrorPolicy(std::string name, Predicate isCapturable)
      : _name(std::move(name)), _isCapturable(std::move(isCapturable))
  {
  }

  static ErrorPolicy standard() { return ErrorPolicy(); }

  /// \brief Capture everything; no job error can kill a worker.
  static ErrorPolicy captureAll()
  {
    return ErrorPolicy("capture_all", [](std::exception_ptr) { return true; });
  }

  /// \brief "standard" or "capture_all".
  /// \throws std::invalid_argument for other names
  static ErrorPolicy fromName(const std::string &name)
  {
    if (name == "standard")
    {
      return standard();
    }
    if (name == "capture_all")
    {
      return captureAll();
    }
    throw std::invalid_argument("Unknown error policy: " + name);
  }

  bool isCapturable(std::exception_ptr error) const
  {
    return _isCapturable ? _isCapturable(error) : false;
  }

  const std::string &name() const { return _name; }

private:
  static bool standardPredicate(std::exception_ptr error)
  {
    if (!error)
    {
      return false;
    }
    try
    {
      std::rethrow_exception(error);
    }
    catch (const FatalWorkerError &)
    {
      return false;
    }
    catch (const std::exception &)
    {
      return true;
    }
    catch (...)
    {
      return false;
    }
  }

  std::string _name;
  Predicate _isCapturable;
};

/// \brief Human-readable description of an exception_ptr for log lines.
inline std::string describeException(std::exception_ptr error)
{
  if (!error)
  {
    return "<no exception>";
  }
  try
  {
    std::rethrow_exception(error);
  }
  catch (const std::exception &e)
  {
    return e.what();
  }
  catch (...)
  {
    return "<non-standard exception>";
  }
}

} // namespace core
} // namespace vthreads
