// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file minimal_toml.hpp
/// \brief Small TOML subset reader used for configuration files.
///
/// Supported: [dotted.sections], bare keys, basic and literal strings,
/// integers, floats, booleans, single-line and multi-line arrays, # comments.
/// Not supported: inline tables, arrays of tables, dates, multi-line strings.

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

namespace rssflow
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type val) { _values.push_back(std::move(val)); }
  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }
  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }
  const value_type &operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table() && !is_array();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// \brief Typed access. Integers convert to double on request; no other
  /// conversions are performed.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, int64_t>)
    {
      if (auto *val = std::get_if<int64_t>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      if (auto *val = std::get_if<bool>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
      if (auto *val = std::get_if<std::string>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    if (auto *val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
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
  std::size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

  /// \brief Look up "a.b.c"; returns an empty node when any part is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_values.find(part);
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

  table parse()
  {
    table root;
    table *current = &root;
    for (;;)
    {
      skipBlankAndComments();
      if (isEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        current = ensureTable(root, parseSection());
      }
      else
      {
        std::string key = parseKey();
        if (key.empty())
        {
          fail("expected key");
        }
        skipInline();
        if (peek() != '=')
        {
          fail("expected '=' after key '" + key + "'");
        }
        ++_pos;
        skipInline();
        current->insert(key, node(parseValue()));
      }
      skipInline();
      if (peek() == '#')
      {
        skipComment();
      }
      if (!isEnd() && peek() != '\n' && peek() != '\r')
      {
        fail("unexpected trailing characters");
      }
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  [[noreturn]] void fail(const std::string &what) const
  {
    throw std::runtime_error("toml: line " + std::to_string(_line) + ": " + what);
  }

  void skipInline()
  {
    while (peek() == ' ' || peek() == '\t')
      ++_pos;
  }

  void skipComment()
  {
    while (!isEnd() && peek() != '\n')
      ++_pos;
  }

  void skipBlankAndComments()
  {
    while (!isEnd())
    {
      char c = peek();
      if (c == '\n')
      {
        ++_line;
        ++_pos;
      }
      else if (std::isspace(static_cast<unsigned char>(c)))
      {
        ++_pos;
      }
      else if (c == '#')
      {
        skipComment();
      }
      else
      {
        break;
      }
    }
  }

  std::string parseSection()
  {
    ++_pos; // '['
    std::string section;
    while (!isEnd() && peek() != ']' && peek() != '\n')
      section += _input[_pos++];
    if (peek() != ']')
      fail("unterminated section header");
    ++_pos;
    return section;
  }

  std::string parseKey()
  {
    std::string key;
    while (!isEnd())
    {
      char c = peek();
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-')
        break;
      key += c;
      ++_pos;
    }
    return key;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"')
      return parseBasicString();
    if (c == '\'')
      return parseLiteralString();
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("invalid value");
  }

  std::string parseBasicString()
  {
    ++_pos;
    std::string out;
    while (!isEnd() && peek() != '"' && peek() != '\n')
    {
      char c = _input[_pos++];
      if (c != '\\')
      {
        out += c;
        continue;
      }
      if (isEnd())
        break;
      char e = _input[_pos++];
      switch (e)
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
        out += e;
        break;
      default:
        fail(std::string("unsupported escape \\") + e);
      }
    }
    if (peek() != '"')
      fail("unterminated string");
    ++_pos;
    return out;
  }

  std::string parseLiteralString()
  {
    ++_pos;
    std::size_t end = _input.find_first_of("'\n", _pos);
    if (end == std::string::npos || _input[end] != '\'')
      fail("unterminated string");
    std::string out = _input.substr(_pos, end - _pos);
    _pos = end + 1;
    return out;
  }

  value_type parseArray()
  {
    ++_pos; // '['
    auto arr = std::make_shared<array>();
    for (;;)
    {
      skipBlankAndComments();
      if (peek() == ']')
        break;
      if (isEnd())
        fail("unterminated array");
      arr->push_back(parseValue());
      skipBlankAndComments();
      if (peek() == ',')
        ++_pos;
      else if (peek() != ']')
        fail("expected ',' or ']' in array");
    }
    ++_pos;
    return arr;
  }

  bool parseBool()
  {
    if (_input.compare(_pos, 4, "true") == 0)
    {
      _pos += 4;
      return true;
    }
    if (_input.compare(_pos, 5, "false") == 0)
    {
      _pos += 5;
      return false;
    }
    fail("invalid boolean");
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        ++_pos;
        continue;
      }
      if (!std::isdigit(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.' &&
          c != 'e' && c != 'E')
        break;
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      num += c;
      ++_pos;
    }
    try
    {
      if (isFloat)
        return std::stod(num);
      return static_cast<int64_t>(std::stoll(num));
    }
    catch (const std::exception &)
    {
      fail("invalid number '" + num + "'");
    }
  }

  table *ensureTable(table &root, const std::string &path)
  {
    table *current = &root;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.'))
    {
      if (part.empty())
        fail("empty table name in [" + path + "]");
      if (!current->contains(part))
        current->insert(part, node(std::make_shared<table>()));
      current = (*current)[part].as_table();
      if (!current)
        fail("key '" + part + "' is not a table");
    }
    return current;
  }
};

inline table parse(const std::string &tomlString) { return parser(tomlString).parse(); }

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
} // namespace rssflow
