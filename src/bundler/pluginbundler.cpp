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
#include <initializer_list>
#include <utility>

#include <QByteArray>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "core/logging.h"
#include "utilities/fileutils.h"
#include "machotool.h"
#include "pluginbundler.h"

using namespace Qt::Literals::StringLiterals;

PluginBundler::PluginBundler(const BundleConfig &config, MachOTool *macho_tool)
    : config_(config),
      macho_tool_(macho_tool),
      filter_(config) {}

bool PluginBundler::Bundle() {

  qLog(Info) << "Bundling" << config_.plugin_bin << "into" << config_.bundle_dir;

  if (!CheckInputs()) return false;
  if (!CreateDirectories()) return false;
  if (!CopyQtFrameworks()) return false;
  if (!CopyQtPlugins()) return false;
  if (!WriteQtConf()) return false;

  CollectBinaries();

  if (!CopyExplicitLibraries()) return false;
  if (!GatherDependencies()) return false;

  CollectLibraries();

  if (!FixInstallNames()) return false;
  if (!RemapDependencies()) return false;
  if (!AddRPaths()) return false;

  qLog(Info) << "Bundled" << binaries_.count() << "binaries," << copied_libraries_.count() << "libraries copied";

  return true;

}

bool PluginBundler::CheckInputs() const {

  if (!QFileInfo(config_.bundle_dir).isDir() || !QFileInfo::exists(config_.plugin_bin)) {
    qLog(Error) << "Missing bundle_dir or plugin_bin";
    return false;
  }

  return true;

}

bool PluginBundler::CreateDirectories() const {

  for (const QString &dir : {config_.FrameworksDir(), config_.PluginsDir(), config_.LibDir()}) {
    if (!QDir().mkpath(dir)) {
      qLog(Error) << "Could not create directory" << dir;
      return false;
    }
  }

  return true;

}

bool PluginBundler::CopyQtFrameworks() const {

  for (const QString &name : config_.frameworks) {
    const QString source = config_.FrameworkSource(name);
    const QString destination = config_.FrameworksDir() + QLatin1Char('/') + name + ".framework"_L1;
    if (!QFileInfo(source).isDir()) {
      qLog(Error) << "Missing Qt framework:" << qUtf8Printable(source);
      return false;
    }
    if ((QFileInfo::exists(destination) || QFileInfo(destination).isSymLink()) && !Utilities::RemoveRecursive(destination)) {
      qLog(Error) << "Could not remove" << destination;
      return false;
    }
    qLog(Debug) << "Copying framework" << source;
    if (!Utilities::CopyRecursive(source, config_.FrameworksDir())) {
      qLog(Error) << "Could not copy Qt framework" << source << "to" << config_.FrameworksDir();
      return false;
    }
    if (!QFileInfo::exists(config_.FrameworkBinary(name))) {
      qLog(Warning) << "Framework" << name << "has no binary at" << config_.FrameworkBinary(name);
    }
  }

  return true;

}

bool PluginBundler::CopyQtPlugins() const {

  for (const QString &subdir : config_.plugin_dirs) {
    const QString source = config_.QtPluginsDir() + QLatin1Char('/') + subdir;
    const QString destination = config_.PluginsDir() + QLatin1Char('/') + subdir;
    if (!QFileInfo(source).isDir()) {
      qLog(Debug) << "No Qt plugins in" << source;
      continue;
    }
    if ((QFileInfo::exists(destination) || QFileInfo(destination).isSymLink()) && !Utilities::RemoveRecursive(destination)) {
      qLog(Error) << "Could not remove" << destination;
      return false;
    }
    qLog(Debug) << "Copying plugins" << source;
    if (!Utilities::CopyRecursive(source, config_.PluginsDir())) {
      qLog(Error) << "Could not copy Qt plugins" << source << "to" << config_.PluginsDir();
      return false;
    }
  }

  return true;

}

bool PluginBundler::WriteQtConf() const {
  return Utilities::WriteDataToFile(config_.QtConfPath(), QByteArray(kQtConfContents));
}

void PluginBundler::CollectBinaries() {

  binaries_.insert(config_.plugin_bin);

  const QStringList framework_binaries = FrameworkBinaries();
  for (const QString &framework_binary : framework_binaries) {
    binaries_.insert(framework_binary);
  }

  const QStringList plugin_libraries = PluginLibraries();
  for (const QString &plugin_library : plugin_libraries) {
    binaries_.insert(plugin_library);
  }

}

bool PluginBundler::CopyExplicitLibraries() {

  const QStringList libraries = config_.ExplicitLibraries();
  for (const QString &source : libraries) {
    if (!QFileInfo::exists(source)) {
      qLog(Debug) << "Skipping missing library" << source;
      continue;
    }
    const QString destination = config_.LibDir() + QLatin1Char('/') + QFileInfo(source).fileName();
    if (!QFileInfo::exists(destination)) {
      if (!CopyLibrary(source, destination)) return false;
    }
    if (!explicit_libraries_.contains(destination)) {
      explicit_libraries_ << destination;
    }
  }

  return true;

}

bool PluginBundler::GatherDependencies() {

  QStringList queue = binaries();
  for (const QString &library : std::as_const(explicit_libraries_)) {
    if (!queue.contains(library)) queue << library;
  }
  QSet<QString> seen(queue.begin(), queue.end());

  while (!queue.isEmpty()) {
    const QString item = queue.takeFirst();

    QStringList dependencies;
    if (!macho_tool_->LinkedLibraries(item, &dependencies)) return false;

    for (const QString &dependency : std::as_const(dependencies)) {
      const DependencyFilter::Kind kind = filter_.Classify(dependency);
      qLog(Debug) << item << "->" << dependency << "(" << DependencyFilter::KindName(kind) << ")";
      if (kind == DependencyFilter::Kind::PrefixFramework) {
        const QString name = DependencyFilter::FrameworkName(dependency);
        if (!config_.frameworks.contains(name)) {
          qLog(Warning) << item << "depends on framework" << dependency << "which is not bundled";
        }
        continue;
      }
      if (kind != DependencyFilter::Kind::PrefixLibrary) continue;

      const QString destination = config_.LibDir() + QLatin1Char('/') + QFileInfo(dependency).fileName();
      if (QFileInfo::exists(destination)) continue;

      if (!CopyLibrary(dependency, destination)) return false;
      if (!seen.contains(destination)) {
        seen.insert(destination);
        queue << destination;
      }
    }
  }

  return true;

}

void PluginBundler::CollectLibraries() {

  const QStringList libraries = BundledLibraries();
  for (const QString &library : libraries) {
    binaries_.insert(library);
  }

}

bool PluginBundler::FixInstallNames() const {

  const QStringList libraries = BundledLibraries();
  for (const QString &library : libraries) {
    if (!macho_tool_->SetInstallName(library, DependencyFilter::LibraryInstallName(library))) return false;
  }

  for (const QString &name : config_.frameworks) {
    const QString framework_binary = config_.FrameworkBinary(name);
    if (!QFileInfo::exists(framework_binary)) continue;
    if (!macho_tool_->SetInstallName(framework_binary, filter_.FrameworkInstallName(name))) return false;
  }

  return true;

}

bool PluginBundler::RemapDependencies() const {

  const QStringList binary_list = binaries();
  for (const QString &binary : binary_list) {
    QStringList dependencies;
    if (!macho_tool_->LinkedLibraries(binary, &dependencies)) return false;

    for (const QString &dependency : std::as_const(dependencies)) {
      const DependencyFilter::Kind kind = filter_.Classify(dependency);
      if (kind == DependencyFilter::Kind::External) {
        qLog(Warning) << binary << "keeps external dependency" << dependency;
        continue;
      }
      const QString install_name = filter_.BundledInstallName(dependency);
      if (install_name.isEmpty()) continue;
      if (!macho_tool_->ChangeDependency(binary, dependency, install_name)) return false;
    }
  }

  return true;

}

bool PluginBundler::AddRPaths() const {

  if (!macho_tool_->AddRPathIfMissing(config_.plugin_bin, u"@loader_path/Frameworks"_s)) return false;
  if (!macho_tool_->AddRPathIfMissing(config_.plugin_bin, config_.HostRPath())) return false;

  const QStringList plugin_libraries = PluginLibraries();
  for (const QString &plugin_library : plugin_libraries) {
    if (!macho_tool_->AddRPathIfMissing(plugin_library, u"@loader_path/../.."_s)) return false;
    if (!macho_tool_->AddRPathIfMissing(plugin_library, u"@executable_path/../Frameworks"_s)) return false;
  }

  const QStringList framework_binaries = FrameworkBinaries();
  for (const QString &framework_binary : framework_binaries) {
    if (!macho_tool_->AddRPathIfMissing(framework_binary, u"@loader_path/../../.."_s)) return false;
  }

  return true;

}

QStringList PluginBundler::binaries() const {

  QStringList binary_list(binaries_.begin(), binaries_.end());
  std::sort(binary_list.begin(), binary_list.end());
  return binary_list;

}

QStringList PluginBundler::FrameworkBinaries() const {

  QStringList framework_binaries;
  for (const QString &name : config_.frameworks) {
    const QString framework_binary = config_.FrameworkBinary(name);
    if (QFileInfo::exists(framework_binary)) {
      framework_binaries << framework_binary;
    }
  }

  return framework_binaries;

}

QStringList PluginBundler::PluginLibraries() const {
  return Utilities::FindFiles(config_.PluginsDir(), u".dylib"_s, true);
}

QStringList PluginBundler::BundledLibraries() const {
  return Utilities::FindFiles(config_.LibDir(), u".dylib"_s, false);
}

bool PluginBundler::CopyLibrary(const QString &source, const QString &destination) {

  if (!QFileInfo::exists(source)) {
    qLog(Error) << "Library" << source << "does not exist";
    return false;
  }

  qLog(Debug) << "Copying library" << source;

  if (!Utilities::CopyFile(source, destination)) return false;

  copied_libraries_ << destination;

  return true;

}
