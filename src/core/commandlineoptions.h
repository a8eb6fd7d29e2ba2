/*
 * pluginbundler
 * Copyright 2010, David Sansome <me@davidsansome.com>
 *
 * pluginbundler is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * pluginbundler is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with pluginbundler.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef COMMANDLINEOPTIONS_H
#define COMMANDLINEOPTIONS_H

#include "config.h"

#include <QtGlobal>
#include <QString>

class BundleConfig;

class CommandlineOptions {
 public:
  explicit CommandlineOptions(int argc = 0, char **argv = nullptr);

  // Environment variables used when the corresponding option is not given.
  static constexpr char kEnvBundleDir[] = "BUNDLE_DIR";
  static constexpr char kEnvPluginBin[] = "PLUGIN_BIN";
  static constexpr char kEnvQtPrefix[] = "QT_PREFIX";
  static constexpr char kEnvHostApp[] = "GIMP_APP";
  static constexpr char kEnvMacPortsPrefix[] = "MACPORTS_PREFIX";

  // Returns false on a usage error or when the help text was printed, see help_requested().
  bool Parse();

  // Overrides the values in config with every option that was given on the command line or in the environment.
  void ApplyTo(BundleConfig *config) const;

  bool help_requested() const { return help_requested_; }
  QString bundle_dir() const { return bundle_dir_; }
  QString plugin_bin() const { return plugin_bin_; }
  QString qt_prefix() const { return qt_prefix_; }
  QString host_app() const { return host_app_; }
  QString macports_prefix() const { return macports_prefix_; }
  QString config_file() const { return config_file_; }
  QString license_file() const { return license_file_; }
  QString archive() const { return archive_; }
  QString install_dir() const { return install_dir_; }
  bool verify() const { return verify_; }
  QString log_levels() const { return log_levels_; }

 private:
  // These are "invalid" characters to pass to getopt_long for options that shouldn't have a short (single character) option.
  enum LongOptions {
    BundleDir = 256,
    PluginBin,
    QtPrefix,
    HostApp,
    MacPortsPrefix,
    Config,
    Verify,
    License,
    Archive,
    Install,
    Quiet,
    Verbose,
    LogLevels,
    Version
  };

  static QString OptArgToString(const char *opt);

 private:
  int argc_;
  char **argv_;

  bool help_requested_;
  QString bundle_dir_;
  QString plugin_bin_;
  QString qt_prefix_;
  QString host_app_;
  QString macports_prefix_;
  QString config_file_;
  QString license_file_;
  QString archive_;
  QString install_dir_;
  bool verify_;
  QString log_levels_;
};

#endif  // COMMANDLINEOPTIONS_H
