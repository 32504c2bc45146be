// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace vthreads
{
namespace parsers
{
namespace toml
{

/// \brief Raised for malformed input; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &what, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + what),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

using scalar = std::variant<int64_t, double, bool, std::string>;

/// \brief A parsed value: a scalar or a flat array of scalars.
class value
{
public:
  using array_type = std::vector<scalar>;

  value() = default;
  explicit value(scalar s) : _data(std::move(s)) {}
  explicit value(array_type a) : _data(std::move(a)) {}

  bool is_array() const { return std::holds_alternative<array_type>(_data); }
  bool is_integer() const { return holds<int64_t>(); }
  bool is_floating_point() const { return holds<double>(); }
  bool is_boolean() const { return holds<bool>(); }
  bool is_string() const { return holds<std::string>(); }

  /// \brief Typed read; integers widen to double, nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    const auto *s = std::get_if<scalar>(&_data);
    if (!s)
    {
      return std::nullopt;
    }
    if constexpr (std::is_same_v<T, double>)
    {
      if (const auto *i = std::get_if<int64_t>(s))
        return static_cast<double>(*i);
    }
    if (const auto *v = std::get_if<T>(s))
    {
      return *v;
    }
    return std::nullopt;
  }

  const array_type *as_array() const { return std::get_if<array_type>(&_data); }

private:
  template <typename T> bool holds() const
  {
    const auto *s = std::get_if<scalar>(&_data);
    return s && std::holds_alternative<T>(*s);
  }

  std::variant<scalar, array_type> _data;
};

/// \brief All key/value pairs of a document, keyed by full dotted path
/// ("pool.max_threads").
class table
{
public:
  using container_type = std::map<std::string, value>;
  using const_iterator = container_type::const_iterator;

  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  /// \brief True for a key path or for any table prefix of one.
  bool contains(const std::string &path) const
  {
    if (_values.count(path))
    {
      return true;
    }
    auto it = _values.lower_bound(path + ".");
    return it != _values.end() && it->first.compare(0, path.size() + 1, path + ".") == 0;
  }

  const value *find(const std::string &path) const
  {
    auto it = _values.find(path);
    return it == _values.end() ? nullptr : &it->second;
  }

  void set(const std::string &path, value v) { _values[path] = std::move(v); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

private:
  container_type _values;
};

namespace detail
{

  inline std::string trim(const std::string &s)
  {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
      ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
      --e;
    return s.substr(b, e - b);
  }

  /// Drop a trailing '#' comment that is not inside a string.
  inline std::string stripComment(const std::string &line)
  {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
      char c = line[i];
      if (quote)
      {
        if (c == '\\' && quote == '"')
          ++i;
        else if (c == quote)
          quote = 0;
      }
      else if (c == '"' || c == '\'')
      {
        quote = c;
      }
      else if (c == '#')
      {
        return line.substr(0, i);
      }
    }
    return line;
  }

  /// Bracket depth of \p text outside of strings.
  inline int bracketBalance(const std::string &text)
  {
    int depth = 0;
    char quote = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
      char c = text[i];
      if (quote)
      {
        if (c == '\\' && quote == '"')
          ++i;
        else if (c == quote)
          quote = 0;
      }
      else if (c == '"' || c == '\'')
        quote = c;
      else if (c == '[')
        ++depth;
      else if (c == ']')
        --depth;
    }
    return depth;
  }

  inline bool isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
  }

  class value_reader
  {
  public:
    value_reader(const std::string &text, std::size_t line) : _text(text), _pos(0), _line(line) {}

    value read()
    {
      skipSpace();
      value result;
      if (peek() == '[')
      {
        result = value(readArray());
      }
      else
      {
        result = value(readScalar());
      }
      skipSpace();
      if (_pos != _text.size())
      {
        fail("unexpected trailing characters");
      }
      return result;
    }

  private:
    char peek() const { return _pos < _text.size() ? _text[_pos] : '\0'; }

    void skipSpace()
    {
      while (_pos < _text.size() && std::isspace(static_cast<unsigned char>(_text[_pos])))
        ++_pos;
    }

    [[noreturn]] void fail(const std::string &what) const { throw parse_error(what, _line); }

    value::array_type readArray()
    {
      ++_pos; // '['
      value::array_type items;
      skipSpace();
      while (peek() != ']')
      {
        if (_pos >= _text.size())
          fail("unterminated array");
        items.push_back(readScalar());
        skipSpace();
        if (peek() == ',')
        {
          ++_pos;
          skipSpace();
        }
        else if (peek() != ']')
        {
          fail("expected ',' or ']' in array");
        }
      }
      ++_pos; // ']'
      return items;
    }

    scalar readScalar()
    {
      skipSpace();
      char c = peek();
      if (c == '"' || c == '\'')
        return readString(c);
      if (std::isalpha(static_cast<unsigned char>(c)))
        return readBool();
      if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
        return readNumber();
      fail("invalid value");
    }

    std::string readString(char quote)
    {
      ++_pos;
      std::string out;
      while (_pos < _text.size() && _text[_pos] != quote)
      {
        char c = _text[_pos++];
        if (c == '\\' && quote == '"' && _pos < _text.size())
        {
          char esc = _text[_pos++];
          switch (esc)
          {
          case 'n':
            out += '\n';
            break;
          case 't':
            out += '\t';
            break;
          case 'r':
            out += '\r';
            break;
          default:
            out += esc;
          }
          continue;
        }
        out += c;
      }
      if (_pos >= _text.size())
        fail("unterminated string");
      ++_pos;
      return out;
    }

    bool readBool()
    {
      std::size_t start = _pos;
      while (std::isalpha(static_cast<unsigned char>(peek())))
        ++_pos;
      std::string word = _text.substr(start, _pos - start);
      if (word == "true")
        return true;
      if (word == "false")
        return false;
      fail("invalid boolean '" + word + "'");
    }

    scalar readNumber()
    {
      std::size_t start = _pos;
      bool floating = false;
      while (_pos < _text.size())
      {
        char c = _text[_pos];
        if (c == '.' || c == 'e' || c == 'E')
          floating = true;
        else if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '_'))
          break;
        ++_pos;
      }
      std::string digits;
      for (std::size_t i = start; i < _pos; ++i)
      {
        if (_text[i] != '_')
          digits += _text[i];
      }
      try
      {
        if (floating)
          return std::stod(digits);
        return static_cast<int64_t>(std::stoll(digits));
      }
      catch (const std::exception &)
      {
        fail("invalid number '" + digits + "'");
      }
    }

    const std::string &_text;
    std::size_t _pos;
    std::size_t _line;
  };

} // namespace detail

/// \brief Parse a TOML document (tables, dotted keys, scalars and flat
/// arrays; no inline tables or arrays of tables).
/// \throws parse_error on malformed input
inline table parse(const std::string &document)
{
  table result;
  std::istringstream in(document);
  std::string raw;
  std::string section;
  std::size_t lineNo = 0;

  while (std::getline(in, raw))
  {
    ++lineNo;
    std::string line = detail::trim(detail::stripComment(raw));
    if (line.empty())
    {
      continue;
    }

    if (line.front() == '[')
    {
      if (line.size() < 2 || line.back() != ']' || line[1] == '[')
      {
        throw parse_error("malformed table header", lineNo);
      }
      section = detail::trim(line.substr(1, line.size() - 2));
      if (section.empty())
      {
        throw parse_error("empty table name", lineNo);
      }
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos)
    {
      throw parse_error("expected 'key = value'", lineNo);
    }
    std::string key = detail::trim(line.substr(0, eq));
    if (key.empty())
    {
      throw parse_error("missing key", lineNo);
    }
    for (char c : key)
    {
      if (!detail::isBareKeyChar(c))
      {
        throw parse_error("invalid key '" + key + "'", lineNo);
      }
    }

    // Arrays may span several lines.
    std::size_t startLine = lineNo;
    std::string text = detail::trim(line.substr(eq + 1));
    while (detail::bracketBalance(text) > 0 && std::getline(in, raw))
    {
      ++lineNo;
      text += ' ' + detail::trim(detail::stripComment(raw));
    }

    std::string path = section.empty() ? key : section + "." + key;
    result.set(path, detail::value_reader(text, startLine).read());
  }
  return result;
}

/// \throws std::runtime_error if the file cannot be opened, parse_error if
/// it is malformed
inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace vthreads
