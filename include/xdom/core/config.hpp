// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xdom/core/config_loader.hpp>
#include <xdom/core/logger.hpp>
#include <optional>
#include <string>

namespace xdom
{
namespace core
{

/// \brief Library settings read from the `[log]` and `[render]` tables of a
/// TOML file. Every field is optional; unset fields fall back to defaults
/// when applied.
struct Config
{
  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
    std::optional<std::string> format;
    std::optional<std::string> timeFormat;
  } log;
  struct RenderConfig
  {
    std::optional<bool> cdataPadding;
  } render;

  static Config fromLoader(const ConfigLoader &loader)
  {
    Config config;
    config.log.level = loader.getString("log.level");
    config.log.file = loader.getString("log.file");
    config.log.format = loader.getString("log.format");
    config.log.timeFormat = loader.getString("log.time_format");
    config.render.cdataPadding = loader.getBool("render.cdata_padding");
    return config;
  }

  /// \brief Initialises the logger from the `[log]` settings.
  void applyLogging() const
  {
    const char *DEFAULT_LOG_LEVEL = "info";
    const char *DEFAULT_LOG_FILE = "";
    const char *DEFAULT_LOG_TIME_FORMAT = "%Y-%m-%d %H:%M:%S";

    Logger::init(Logger::levelFromString(log.level.value_or(DEFAULT_LOG_LEVEL)),
                 log.file.value_or(DEFAULT_LOG_FILE),
                 log.timeFormat.value_or(DEFAULT_LOG_TIME_FORMAT));
    if (log.format)
    {
      Logger::setLogFormat(*log.format);
    }
    XDOM_LOG_DEBUG("applyLogging: log.level = " << log.level.value_or("<unset>"));
    XDOM_LOG_DEBUG("applyLogging: log.file = " << log.file.value_or("<unset>"));
  }
};

} // namespace core
} // namespace xdom
