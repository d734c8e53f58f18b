// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

/// \file minimal_toml.hpp
/// \brief Line-oriented parser for the TOML subset used by xdom configuration
/// files: `[dotted.section]` headers and `key = value` pairs whose values are
/// strings (basic or literal), integers, floats or booleans. Arrays, inline
/// tables and multi-line strings are rejected.

namespace xdom
{
namespace parsers
{
namespace toml
{

class table;

using value_type =
  std::variant<std::monostate, int64_t, double, bool, std::string, std::shared_ptr<table>>;

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table();
  }

  bool is_string() const { return std::holds_alternative<std::string>(_value); }

  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }

  bool is_boolean() const { return std::holds_alternative<bool>(_value); }

  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>)
    {
      if (auto *val = std::get_if<T>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  table *as_table()
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  const table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

class table
{
public:
  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }

  bool empty() const { return _values.empty(); }

  size_t size() const { return _values.size(); }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

  /// \brief Returns the child table \p key, creating it if absent.
  /// \throws std::runtime_error if \p key already holds a plain value.
  table &subtable(const std::string &key)
  {
    auto it = _values.find(key);
    if (it == _values.end())
    {
      it = _values.emplace(key, node(std::make_shared<table>())).first;
    }
    table *child = it->second.as_table();
    if (!child)
    {
      throw std::runtime_error("Key is not a table: " + key);
    }
    return *child;
  }

  /// \brief Resolves `a.b.c`; returns an empty node if any segment is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string key = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_values.find(key);
      if (it == current->_values.end())
      {
        return node();
      }
      if (dot == std::string::npos)
      {
        return it->second;
      }
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

private:
  std::unordered_map<std::string, node> _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  /// \throws std::runtime_error with the offending line number on bad input.
  table parse()
  {
    table root;
    table *current = &root;
    std::istringstream lines(_input);
    std::string line;
    while (std::getline(lines, line))
    {
      ++_line;
      std::string text = trim(stripComment(line));
      if (text.empty())
      {
        continue;
      }
      if (text.front() == '[')
      {
        if (text.back() != ']' || text.size() < 3)
        {
          fail("malformed section header");
        }
        current = &root;
        for (const auto &part : splitDotted(text.substr(1, text.size() - 2)))
        {
          current = &current->subtable(part);
        }
        continue;
      }

      std::size_t eq = text.find('=');
      if (eq == std::string::npos)
      {
        fail("expected '=' after key");
      }
      std::string key = trim(text.substr(0, eq));
      if (key.empty() || !validKey(key))
      {
        fail("invalid key");
      }
      current->insert(key, node(parseValue(trim(text.substr(eq + 1)))));
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _line{0};

  [[noreturn]] void fail(const std::string &what) const
  {
    throw std::runtime_error("TOML line " + std::to_string(_line) + ": " + what);
  }

  static std::string trim(const std::string &s)
  {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
      ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
      --e;
    return s.substr(b, e - b);
  }

  // '#' outside of a quoted string starts a comment
  static std::string stripComment(const std::string &s)
  {
    char quote = 0;
    for (std::size_t i = 0; i < s.size(); ++i)
    {
      char c = s[i];
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
        return s.substr(0, i);
      }
    }
    return s;
  }

  static bool validKey(const std::string &key)
  {
    for (char c : key)
    {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-')
        return false;
    }
    return true;
  }

  std::vector<std::string> splitDotted(const std::string &path) const
  {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.'))
    {
      part = trim(part);
      if (part.empty() || !validKey(part))
        fail("invalid section name");
      parts.push_back(part);
    }
    return parts;
  }

  value_type parseValue(const std::string &text) const
  {
    if (text.empty())
      fail("missing value");

    char c = text.front();
    if (c == '"' || c == '\'')
      return parseString(text);
    if (text == "true")
      return true;
    if (text == "false")
      return false;
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber(text);
    fail("unsupported value: " + text);
  }

  std::string parseString(const std::string &text) const
  {
    char quote = text.front();
    if (text.size() < 2 || text.back() != quote)
      fail("unterminated string");

    std::string body = text.substr(1, text.size() - 2);
    if (quote == '\'')
      return body;

    std::string out;
    for (std::size_t i = 0; i < body.size(); ++i)
    {
      if (body[i] != '\\')
      {
        out += body[i];
        continue;
      }
      if (++i >= body.size())
        fail("dangling escape");
      switch (body[i])
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
      case '\\':
      case '"':
        out += body[i];
        break;
      default:
        fail(std::string("unknown escape \\") + body[i]);
      }
    }
    return out;
  }

  value_type parseNumber(const std::string &text) const
  {
    std::string digits;
    for (char c : text)
    {
      if (c != '_')
        digits += c;
    }
    try
    {
      std::size_t used = 0;
      if (digits.find_first_of(".eE") != std::string::npos)
      {
        double d = std::stod(digits, &used);
        if (used == digits.size())
          return d;
      }
      else
      {
        long long i = std::stoll(digits, &used);
        if (used == digits.size())
          return static_cast<int64_t>(i);
      }
    }
    catch (const std::exception &)
    {
      // reported below
    }
    fail("invalid number: " + text);
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace xdom
