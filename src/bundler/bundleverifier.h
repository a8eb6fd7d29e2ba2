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

#ifndef BUNDLEVERIFIER_H
#define BUNDLEVERIFIER_H

#include <QString>
#include <QStringList>

#include "core/bundleconfig.h"
#include "dependencyfilter.h"

class MachOTool;

// Checks that every Mach-O file in the bundle only references libraries that exist inside the bundle,
// in the host application or in the system.
class BundleVerifier {
 public:
  explicit BundleVerifier(const BundleConfig &config, MachOTool *macho_tool);

  bool Verify();

  QStringList errors() const { return errors_; }
  QStringList checked_files() const { return checked_files_; }

 private:
  void CheckFile(const QString &filepath);
  bool ResolveRPath(const QString &library, const QString &filepath, const QStringList &rpaths) const;
  QString Expand(const QString &path, const QString &loader_dir) const;
  void AddError(const QString &error);

 private:
  const BundleConfig config_;
  MachOTool *macho_tool_;
  DependencyFilter filter_;

  QString executable_dir_;
  QStringList executable_rpaths_;
  QStringList errors_;
  QStringList checked_files_;
};

#endif  // BUNDLEVERIFIER_H
