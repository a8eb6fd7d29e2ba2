/*
 * pluginbundler
 * Copyright 2026, The pluginbundler authors
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

#ifndef BUNDLECONFIG_H
#define BUNDLECONFIG_H

#include "config.h"

#include <QString>
#include <QStringList>

// Everything a bundling run needs to know about the plugin, the Qt installation and the host.
class BundleConfig {
 public:
  BundleConfig();

  static constexpr char kSettingsGroup[] = "Bundle";

  QString bundle_dir;
  QString plugin_bin;
  QString qt_prefix;
  QString host_app;
  QString macports_prefix;

  QStringList frameworks;
  QStringList plugin_dirs;
  QString framework_version;

  // Relative to macports_prefix and host_app respectively.
  QStringList prefix_libraries;
  QStringList host_libraries;

  QStringList system_prefixes;

  // Reads the [Bundle] group of an INI file. Keys that are not present keep their current value.
  bool Load(const QString &filename);

  // Removes trailing slashes and duplicate separators from the path options.
  void CleanPaths();

  // Names of the command line options whose value is still empty.
  QStringList MissingRequired() const;

  QString FrameworksDir() const;
  QString PluginsDir() const;
  QString LibDir() const;
  QString QtLibDir() const;
  QString QtPluginsDir() const;
  QString FrameworkSource(const QString &name) const;
  QString FrameworkBinary(const QString &name) const;
  QString HostRPath() const;
  QString QtConfPath() const;

  QStringList ExplicitLibraries() const;

 private:
  static QString ResolvePattern(const QString &path);
};

#endif  // BUNDLECONFIG_H
