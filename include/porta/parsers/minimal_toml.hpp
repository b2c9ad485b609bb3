// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
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

namespace porta
{
namespace parsers
{
namespace toml
{

/// Subset of TOML used by Porta configuration files: comments, `[table]`
/// headers, `[[array.of.tables]]` headers, dotted keys, basic and literal
/// strings, integers (with `_` separators), floats, booleans and arrays.

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Thrown for malformed input; carries the 1-based line number.
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

class array
{
public:
  using container_type = std::vector<value_type>;

  void push_back(value_type val) { _items.push_back(std::move(val)); }
  std::size_t size() const { return _items.size(); }
  bool empty() const { return _items.empty(); }

  container_type::const_iterator begin() const { return _items.begin(); }
  container_type::const_iterator end() const { return _items.end(); }

  const value_type &operator[](std::size_t idx) const { return _items[idx]; }
  value_type &back() { return _items.back(); }

  /// True when every element is a table, i.e. the array came from
  /// `[[name]]` headers.
  bool is_table_array() const
  {
    for (const auto &item : _items)
    {
      if (!std::holds_alternative<std::shared_ptr<table>>(item))
      {
        return false;
      }
    }
    return !_items.empty();
  }

private:
  container_type _items;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  /// Typed access. Integers convert to double on request; nothing else
  /// converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *d = std::get_if<double>(&_value))
        return *d;
      if (auto *i = std::get_if<int64_t>(&_value))
        return static_cast<double>(*i);
      return std::nullopt;
    }
    else
    {
      if (auto *v = std::get_if<T>(&_value))
        return *v;
      return std::nullopt;
    }
  }

  const array *as_array() const
  {
    auto *p = std::get_if<std::shared_ptr<array>>(&_value);
    return p ? p->get() : nullptr;
  }

  array *as_array()
  {
    auto *p = std::get_if<std::shared_ptr<array>>(&_value);
    return p ? p->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&_value);
    return p ? p->get() : nullptr;
  }

  table *as_table()
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&_value);
    return p ? p->get() : nullptr;
  }

  explicit operator bool() const { return is_value(); }

  const value_type &get_value() const { return _value; }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;

  bool contains(const std::string &key) const { return _entries.count(key) != 0; }
  bool empty() const { return _entries.empty(); }
  std::size_t size() const { return _entries.size(); }

  /// \return the entry for \p key or nullptr
  const node *find(const std::string &key) const
  {
    auto it = _entries.find(key);
    return it == _entries.end() ? nullptr : &it->second;
  }

  node *find(const std::string &key)
  {
    auto it = _entries.find(key);
    return it == _entries.end() ? nullptr : &it->second;
  }

  const node &at(const std::string &key) const
  {
    auto it = _entries.find(key);
    if (it == _entries.end())
      throw std::out_of_range("Key not found: " + key);
    return it->second;
  }

  /// Resolve "a.b.c" through nested tables. Missing paths yield an empty
  /// node.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      const node *entry = current->find(dottedPath.substr(start, dot - start));
      if (!entry)
        break;
      if (dot == std::string::npos)
        return *entry;
      current = entry->as_table();
      start = dot + 1;
    }
    return node();
  }

  void insert(const std::string &key, node value) { _entries[key] = std::move(value); }

  container_type::const_iterator begin() const { return _entries.begin(); }
  container_type::const_iterator end() const { return _entries.end(); }

private:
  container_type _entries;
};

class parser
{
public:
  explicit parser(std::string input) : _text(std::move(input)) {}

  table parse()
  {
    auto root = std::make_shared<table>();
    table *current = root.get();

    skipBlank();
    while (!atEnd())
    {
      if (peek() == '[')
      {
        current = openHeader(*root);
      }
      else
      {
        readAssignment(*current);
      }
      expectLineEnd();
      skipBlank();
    }
    return *root;
  }

private:
  std::string _text;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool atEnd() const { return _pos >= _text.size(); }
  char peek(std::size_t ahead = 0) const
  {
    return _pos + ahead < _text.size() ? _text[_pos + ahead] : '\0';
  }

  char next()
  {
    char c = _text[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  [[noreturn]] void fail(const std::string &what) const { throw parse_error(what, _line); }

  void skipInline()
  {
    while (peek() == ' ' || peek() == '\t')
      ++_pos;
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!atEnd() && peek() != '\n')
        ++_pos;
    }
  }

  // Whitespace, newlines and comments.
  void skipBlank()
  {
    while (!atEnd())
    {
      char c = peek();
      if (c == '#')
        skipComment();
      else if (std::isspace(static_cast<unsigned char>(c)))
        next();
      else
        break;
    }
  }

  void expectLineEnd()
  {
    skipInline();
    skipComment();
    if (peek() == '\r')
      ++_pos;
    if (!atEnd() && peek() != '\n')
      fail(std::string("unexpected character '") + peek() + "'");
  }

  std::vector<std::string> readKeyPath(char terminator)
  {
    std::vector<std::string> parts;
    while (true)
    {
      skipInline();
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = readString();
      }
      else
      {
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-')
          part += _text[_pos++];
      }
      if (part.empty())
        fail("empty key");
      parts.push_back(std::move(part));
      skipInline();
      if (peek() == '.')
      {
        ++_pos;
        continue;
      }
      if (peek() != terminator)
        fail(std::string("expected '") + terminator + "' after key");
      return parts;
    }
  }

  // Walks (and creates) nested tables. A path segment naming an array of
  // tables descends into its last element.
  table *descend(table &root, const std::vector<std::string> &parts, std::size_t count)
  {
    table *current = &root;
    for (std::size_t i = 0; i < count; ++i)
    {
      node *entry = current->find(parts[i]);
      if (!entry)
      {
        current->insert(parts[i], node(std::make_shared<table>()));
        entry = current->find(parts[i]);
      }
      if (table *t = entry->as_table())
      {
        current = t;
      }
      else if (array *arr = entry->as_array(); arr && arr->is_table_array())
      {
        current = std::get<std::shared_ptr<table>>(arr->back()).get();
      }
      else
      {
        fail("key '" + parts[i] + "' is not a table");
      }
    }
    return current;
  }

  table *openHeader(table &root)
  {
    ++_pos;
    bool arrayOfTables = peek() == '[';
    if (arrayOfTables)
      ++_pos;

    auto parts = readKeyPath(']');
    ++_pos;
    if (arrayOfTables)
    {
      if (peek() != ']')
        fail("unterminated array-of-tables header");
      ++_pos;
      table *parent = descend(root, parts, parts.size() - 1);
      node *entry = parent->find(parts.back());
      if (!entry)
      {
        parent->insert(parts.back(), node(std::make_shared<array>()));
        entry = parent->find(parts.back());
      }
      array *arr = entry->as_array();
      if (!arr || (!arr->empty() && !arr->is_table_array()))
        fail("key '" + parts.back() + "' is not an array of tables");
      auto element = std::make_shared<table>();
      table *result = element.get();
      arr->push_back(std::move(element));
      return result;
    }
    return descend(root, parts, parts.size());
  }

  void readAssignment(table &current)
  {
    auto parts = readKeyPath('=');
    ++_pos;
    skipInline();
    table *target = descend(current, parts, parts.size() - 1);
    if (target->contains(parts.back()))
      fail("duplicate key '" + parts.back() + "'");
    target->insert(parts.back(), node(readValue()));
  }

  value_type readValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return readString();
    if (c == '[')
      return readArray();
    if (c == 't' || c == 'f')
      return readBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return readNumber();
    fail("invalid value");
  }

  std::string readString()
  {
    const char quote = _text[_pos++];
    std::string out;
    while (!atEnd() && peek() != quote)
    {
      char c = _text[_pos++];
      if (c == '\n')
        fail("newline in string");
      if (c == '\\' && quote == '"')
      {
        if (atEnd())
          break;
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
        case '"':
        case '\\':
          out += esc;
          break;
        default:
          fail(std::string("unknown escape '\\") + esc + "'");
        }
        continue;
      }
      out += c;
    }
    if (atEnd())
      fail("unterminated string");
    ++_pos;
    return out;
  }

  value_type readArray()
  {
    ++_pos;
    auto arr = std::make_shared<array>();
    skipBlank();
    while (peek() != ']')
    {
      if (atEnd())
        fail("unterminated array");
      arr->push_back(readValue());
      skipBlank();
      if (peek() == ',')
      {
        ++_pos;
        skipBlank();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    ++_pos;
    return arr;
  }

  bool readBool()
  {
    if (_text.compare(_pos, 4, "true") == 0)
    {
      _pos += 4;
      return true;
    }
    if (_text.compare(_pos, 5, "false") == 0)
    {
      _pos += 5;
      return false;
    }
    fail("invalid boolean");
  }

  value_type readNumber()
  {
    std::string digits;
    bool floating = false;
    while (!atEnd())
    {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-')
        digits += c;
      else if (c == '.' || c == 'e' || c == 'E')
      {
        floating = true;
        digits += c;
      }
      else if (c != '_')
        break;
      ++_pos;
    }
    try
    {
      std::size_t used = 0;
      value_type result =
        floating ? value_type(std::stod(digits, &used)) : value_type(int64_t(std::stoll(digits, &used)));
      if (used != digits.size())
        fail("invalid number '" + digits + "'");
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number '" + digits + "'");
    }
  }
};

inline table parse(const std::string &text) { return parser(text).parse(); }

inline table parse_file(const std::string &filename)
{
  std::ifstream in(filename);
  if (!in.is_open())
    throw std::runtime_error("Cannot open file: " + filename);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace porta
