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

#ifndef BUNDLEPACKAGER_H
#define BUNDLEPACKAGER_H

#include <QString>

#include "core/bundleconfig.h"

class CommandRunner;

// Steps that run after the bundle is complete: license, zip archive and installation into the host's plug-in directory.
class BundlePackager {
 public:
  explicit BundlePackager(const BundleConfig &config, CommandRunner *runner);

  static constexpr char kDitto[] = "ditto";
  static constexpr char kXattr[] = "xattr";
  static constexpr char kLicenseFilename[] = "COPYING";

  // A missing license file is only a warning.
  bool CopyLicense(const QString &license_file) const;

  bool CreateArchive(const QString &archive) const;

  // Copies the bundle to plugin_dir/<bundle name>, returns the installed path in installed_dir.
  bool Install(const QString &plugin_dir, QString *installed_dir = nullptr) const;

 private:
  const BundleConfig config_;
  CommandRunner *runner_;
};

#endif  // BUNDLEPACKAGER_H
