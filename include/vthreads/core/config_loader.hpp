// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <vthreads/core/logger.hpp>
#include <vthreads/parsers/minimal_toml.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vthreads
{
namespace core
{

/// \brief Loads a TOML configuration file and offers typed lookups by
/// dotted key ("pool.max_threads").
class ConfigLoader
{
public:
  /// \brief Remember \p filename; nothing is read until load() or reload().
  explicit ConfigLoader(std::string filename) : _filename(std::move(filename)), _loaded(false) {}

  /// \brief Build a loader over in-memory TOML text.
  /// \throws parsers::toml::parse_error if \p document is malformed
  static ConfigLoader fromString(const std::string &document)
  {
    ConfigLoader loader("");
    loader._table = parsers::toml::parse(document);
    loader._loaded = true;
    return loader;
  }

  /// \brief Re-read the file. On failure the table is cleared and the
  /// reason is logged.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      return true;
    }
    catch (const std::exception &e)
    {
      VTHREADS_LOG_WARN("Failed to load configuration '" << _filename << "': " << e.what());
      _table = parsers::toml::table{};
      _loaded = false;
      return false;
    }
  }

  /// \brief Return the parsed table, reading the file first if needed.
  /// \throws std::runtime_error if the file cannot be read or parsed
  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename);
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string &filename() const { return _filename; }

  const parsers::toml::table &table() const { return _table; }

  /// \brief Typed lookup. Absent keys and type mismatches yield nullopt.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    if (const auto *v = _table.find(dottedKey))
    {
      return v->as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<double> getDouble(const std::string &key) const { return get<double>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Read an array of strings.
  /// \return nullopt if the key is missing or not an array
  /// \throws std::runtime_error if an element is not a string
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    const auto *v = _table.find(key);
    if (!v || !v->is_array())
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *v->as_array())
    {
      if (const auto *s = std::get_if<std::string>(&elem))
      {
        result.push_back(*s);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded;
};

} // namespace core
} // namespace vthreads
