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

#include <QString>
#include <QStringList>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "core/logging.h"
#include "core/commandrunner.h"
#include "utilities/fileutils.h"
#include "bundlepackager.h"

using namespace Qt::Literals::StringLiterals;

BundlePackager::BundlePackager(const BundleConfig &config, CommandRunner *runner)
    : config_(config),
      runner_(runner) {}

bool BundlePackager::CopyLicense(const QString &license_file) const {

  if (!QFileInfo::exists(license_file)) {
    qLog(Warning) << "License file" << license_file << "not found, license file not included in bundle.";
    return true;
  }

  const QString destination = config_.bundle_dir + QLatin1Char('/') + QLatin1String(kLicenseFilename);
  if (!Utilities::CopyFile(license_file, destination)) return false;

  qLog(Info) << "Copied" << license_file << "to" << destination;

  return true;

}

bool BundlePackager::CreateArchive(const QString &archive) const {

  if (QFileInfo::exists(archive) && !QFile::remove(archive)) {
    qLog(Error) << "Could not remove existing archive" << archive;
    return false;
  }

  const QString archive_dir = QFileInfo(archive).absolutePath();
  if (!QDir().mkpath(archive_dir)) {
    qLog(Error) << "Could not create directory" << archive_dir;
    return false;
  }

  QString error;
  if (!runner_->Run(QLatin1String(kDitto), QStringList() << u"-c"_s << u"-k"_s << u"--sequesterRsrc"_s << u"--keepParent"_s << config_.bundle_dir << archive, nullptr, &error)) {
    qLog(Error) << "Could not create archive" << archive << ":" << error;
    return false;
  }

  qLog(Info) << "Archive:" << archive;

  return true;

}

bool BundlePackager::Install(const QString &plugin_dir, QString *installed_dir) const {

  const QString bundle_name = QFileInfo(config_.bundle_dir).fileName();
  const QString destination = plugin_dir + QLatin1Char('/') + bundle_name;

  if (!QDir().mkpath(plugin_dir)) {
    qLog(Error) << "Could not create plug-in directory" << plugin_dir;
    return false;
  }

  if ((QFileInfo::exists(destination) || QFileInfo(destination).isSymLink()) && !Utilities::RemoveRecursive(destination)) {
    qLog(Error) << "Could not remove previous installation" << destination;
    return false;
  }

  if (!Utilities::CopyRecursive(config_.bundle_dir, plugin_dir)) {
    qLog(Error) << "Could not copy" << config_.bundle_dir << "to" << plugin_dir;
    return false;
  }

  const QString installed_bin = destination + QLatin1Char('/') + QDir(config_.bundle_dir).relativeFilePath(config_.plugin_bin);
  if (!QFileInfo::exists(installed_bin)) {
    qLog(Error) << "Installed plugin binary" << installed_bin << "does not exist";
    return false;
  }
  if (!Utilities::MakeExecutable(installed_bin)) {
    return false;
  }

  QString error;
  if (!runner_->Run(QLatin1String(kXattr), QStringList() << u"-dr"_s << u"com.apple.quarantine"_s << destination, nullptr, &error)) {
    qLog(Warning) << "Could not remove quarantine attribute from" << destination << ":" << error;
  }

  // Forces the host to rescan its plug-ins.
  const QString pluginrc = QDir::cleanPath(plugin_dir + "/../pluginrc"_L1);
  if (QFileInfo::exists(pluginrc) && !QFile::remove(pluginrc)) {
    qLog(Warning) << "Could not remove" << pluginrc;
  }

  if (installed_dir) *installed_dir = destination;

  qLog(Info) << "Installed to:" << destination;

  return true;

}
