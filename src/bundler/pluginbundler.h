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

#ifndef PLUGINBUNDLER_H
#define PLUGINBUNDLER_H

#include <QSet>
#include <QString>
#include <QStringList>

#include "core/bundleconfig.h"
#include "dependencyfilter.h"

class MachOTool;

// Copies the Qt frameworks, Qt plugins and third-party libraries a plugin needs into its Frameworks directory,
// then rewrites install names, dependencies and rpaths so the plugin only loads libraries from inside the bundle.
class PluginBundler {
 public:
  explicit PluginBundler(const BundleConfig &config, MachOTool *macho_tool);

  // Runs all steps below in order, stopping at the first one that fails.
  bool Bundle();

  bool CheckInputs() const;
  bool CreateDirectories() const;
  bool CopyQtFrameworks() const;
  bool CopyQtPlugins() const;
  bool WriteQtConf() const;
  void CollectBinaries();
  bool CopyExplicitLibraries();
  bool GatherDependencies();
  void CollectLibraries();
  bool FixInstallNames() const;
  bool RemapDependencies() const;
  bool AddRPaths() const;

  // Sorted, so the order of install_name_tool invocations is reproducible.
  QStringList binaries() const;

  // Libraries copied into Frameworks/lib during this run, in copy order.
  QStringList copied_libraries() const { return copied_libraries_; }

  static constexpr char kQtConfContents[] = "[Paths]\nPlugins = Frameworks/plugins\n";

 private:
  QStringList FrameworkBinaries() const;
  QStringList PluginLibraries() const;
  QStringList BundledLibraries() const;
  bool CopyLibrary(const QString &source, const QString &destination);

 private:
  const BundleConfig config_;
  MachOTool *macho_tool_;
  DependencyFilter filter_;

  QSet<QString> binaries_;
  QStringList explicit_libraries_;
  QStringList copied_libraries_;
};

#endif  // PLUGINBUNDLER_H
