// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <porta/core/logger.hpp>
#include <porta/parsers/minimal_toml.hpp>

namespace porta
{
namespace core
{
/// \brief Loads a TOML configuration file and offers typed, dotted-key
/// lookups into it.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed
  explicit ConfigLoader(const std::string &filename) : _filename(filename)
  {
    _table = parsers::toml::parse_file(_filename);
    _loaded = true;
  }

  /// \brief Builds a loader over in-memory TOML text. reload() is not
  /// available for such loaders.
  static ConfigLoader fromString(const std::string &tomlText)
  {
    ConfigLoader loader;
    loader._table = parsers::toml::parse(tomlText);
    loader._loaded = true;
    return loader;
  }

  /// \brief Reloads the configuration from disk. On failure the previous
  /// table is kept and false is returned.
  bool reload()
  {
    if (_filename.empty())
    {
      return false;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      return true;
    }
    catch (const std::runtime_error &e)
    {
      PORTA_LOG_WARN("ConfigLoader: reload of " << _filename << " failed: " << e.what());
      return false;
    }
  }

  bool isLoaded() const { return _loaded; }
  const std::string &filename() const { return _filename; }

  /// \brief Gets the full configuration table.
  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (!node)
    {
      return std::nullopt;
    }
    return node.as<T>();
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }
  std::optional<double> getDouble(const std::string &key) const { return get<double>(key); }
  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }
  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings from the configuration.
  /// \return std::nullopt if the key is missing or not an array
  /// \throws std::runtime_error if any element is not a string
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      auto *str = std::get_if<std::string>(&elem);
      if (!str)
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(*str);
    }
    return result;
  }

  /// \brief Gets the tables declared with `[[key]]` headers, in file order.
  /// The returned pointers stay valid as long as the loader is not reloaded.
  std::vector<const parsers::toml::table *> getTableArray(const std::string &key) const
  {
    std::vector<const parsers::toml::table *> result;
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return result;
    }
    for (const auto &elem : *arr)
    {
      if (auto *tbl = std::get_if<std::shared_ptr<parsers::toml::table>>(&elem))
      {
        result.push_back(tbl->get());
      }
    }
    return result;
  }

private:
  ConfigLoader() = default;

  std::string _filename;
  parsers::toml::table _table;
  bool _loaded{false};
};

} // namespace core
} // namespace porta
