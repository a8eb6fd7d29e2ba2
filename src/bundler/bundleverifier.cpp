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

#include <algorithm>
#include <utility>

#include <QString>
#include <QStringList>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>

#include "core/logging.h"
#include "machotool.h"
#include "bundleverifier.h"

using namespace Qt::Literals::StringLiterals;

namespace {
constexpr char kExecutablePath[] = "@executable_path";
constexpr char kLoaderPath[] = "@loader_path";
constexpr char kRPath[] = "@rpath";
}  // namespace

BundleVerifier::BundleVerifier(const BundleConfig &config, MachOTool *macho_tool)
    : config_(config),
      macho_tool_(macho_tool),
      filter_(config),
      executable_dir_(QFileInfo(config.plugin_bin).absolutePath()) {}

bool BundleVerifier::Verify() {

  qLog(Info) << "Verifying" << config_.bundle_dir;

  errors_.clear();
  checked_files_.clear();
  executable_rpaths_.clear();

  if (!macho_tool_->RPaths(config_.plugin_bin, &executable_rpaths_)) {
    AddError(u"Could not read rpaths of %1"_s.arg(config_.plugin_bin));
  }

  QStringList files;
  QDirIterator iter(config_.bundle_dir, QDir::Files | QDir::NoSymLinks, QDirIterator::Subdirectories);
  while (iter.hasNext()) {
    files << iter.next();
  }
  std::sort(files.begin(), files.end());

  for (const QString &filepath : std::as_const(files)) {
    if (!MachOTool::IsMachOFile(filepath)) continue;
    checked_files_ << filepath;
    CheckFile(filepath);
  }

  if (errors_.isEmpty()) {
    qLog(Info) << "Checked" << checked_files_.count() << "files, bundle is self-contained";
  }

  return errors_.isEmpty();

}

void BundleVerifier::CheckFile(const QString &filepath) {

  QStringList libraries;
  if (!macho_tool_->LinkedLibraries(filepath, &libraries)) {
    AddError(u"Could not read dependencies of %1"_s.arg(filepath));
    return;
  }

  QStringList rpaths;
  if (!macho_tool_->RPaths(filepath, &rpaths)) {
    AddError(u"Could not read rpaths of %1"_s.arg(filepath));
    return;
  }

  const QString loader_dir = QFileInfo(filepath).absolutePath();

  for (const QString &library : std::as_const(libraries)) {
    if (library.startsWith(QLatin1String(kExecutablePath)) || library.startsWith(QLatin1String(kLoaderPath))) {
      const QString real_path = Expand(library, loader_dir);
      if (!QFileInfo::exists(real_path)) {
        AddError(u"%1 does not exist for %2"_s.arg(real_path, filepath));
      }
    }
    else if (library.startsWith(QLatin1String(kRPath))) {
      if (!ResolveRPath(library, filepath, rpaths)) {
        AddError(u"%1 can not be resolved for %2"_s.arg(library, filepath));
      }
    }
    else {
      const DependencyFilter::Kind kind = filter_.Classify(library);
      if (kind == DependencyFilter::Kind::System || kind == DependencyFilter::Kind::HostApplication) {
        continue;
      }
      AddError(u"%1 points to %2"_s.arg(filepath, library));
    }
  }

}

bool BundleVerifier::ResolveRPath(const QString &library, const QString &filepath, const QStringList &rpaths) const {

  const QString relative = library.mid(static_cast<qsizetype>(sizeof(kRPath) - 1));
  const QString loader_dir = QFileInfo(filepath).absolutePath();

  QStringList candidates;
  for (const QString &rpath : rpaths) {
    candidates << Expand(rpath, loader_dir) + relative;
  }
  // dyld also searches the rpaths of the executable that loaded the image.
  for (const QString &rpath : executable_rpaths_) {
    candidates << Expand(rpath, executable_dir_) + relative;
  }

  return std::any_of(candidates.begin(), candidates.end(), [](const QString &candidate) { return QFileInfo::exists(candidate); });

}

QString BundleVerifier::Expand(const QString &path, const QString &loader_dir) const {

  if (path.startsWith(QLatin1String(kLoaderPath))) {
    return loader_dir + path.mid(static_cast<qsizetype>(sizeof(kLoaderPath) - 1));
  }
  if (path.startsWith(QLatin1String(kExecutablePath))) {
    return executable_dir_ + path.mid(static_cast<qsizetype>(sizeof(kExecutablePath) - 1));
  }

  return path;

}

void BundleVerifier::AddError(const QString &error) {

  qLog(Error) << error;
  errors_ << error;

}
