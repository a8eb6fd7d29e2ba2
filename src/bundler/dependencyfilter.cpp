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
#include <QFileInfo>

#include "core/bundleconfig.h"
#include "dependencyfilter.h"

using namespace Qt::Literals::StringLiterals;

namespace {
constexpr char kFrameworkSuffix[] = ".framework";
}

DependencyFilter::DependencyFilter(const BundleConfig &config)
    : host_app_(config.host_app),
      prefix_(config.macports_prefix),
      system_prefixes_(config.system_prefixes),
      framework_version_(config.framework_version) {}

DependencyFilter::Kind DependencyFilter::Classify(const QString &path) const {

  if (path.startsWith(u'@')) return Kind::Relative;

  if (!host_app_.isEmpty() && IsUnder(path, host_app_)) return Kind::HostApplication;

  for (const QString &system_prefix : system_prefixes_) {
    if (IsUnder(path, system_prefix)) return Kind::System;
  }

  if (!prefix_.isEmpty() && IsUnder(path, prefix_)) {
    if (path.contains(QLatin1String(kFrameworkSuffix) + QLatin1Char('/'))) return Kind::PrefixFramework;
    if (path.endsWith(".dylib"_L1)) return Kind::PrefixLibrary;
  }

  return Kind::External;

}

QString DependencyFilter::BundledInstallName(const QString &path) const {

  switch (Classify(path)) {
    case Kind::PrefixFramework:{
      const QString name = FrameworkName(path);
      if (name.isEmpty()) return QString();
      return FrameworkInstallName(name);
    }
    case Kind::PrefixLibrary:
      return LibraryInstallName(path);
    default:
      return QString();
  }

}

QString DependencyFilter::FrameworkInstallName(const QString &name) const {
  return QStringLiteral("@rpath/%1.framework/Versions/%2/%1").arg(name, framework_version_);
}

QString DependencyFilter::LibraryInstallName(const QString &path) {
  return "@rpath/lib/"_L1 + QFileInfo(path).fileName();
}

QString DependencyFilter::FrameworkName(const QString &path) {

  const QStringList parts = path.split(u'/', Qt::SkipEmptyParts);
  for (const QString &part : parts) {
    if (part.endsWith(QLatin1String(kFrameworkSuffix))) {
      return part.chopped(static_cast<qsizetype>(sizeof(kFrameworkSuffix) - 1));
    }
  }

  return QString();

}

bool DependencyFilter::IsUnder(const QString &path, const QString &prefix) {

  QString p = prefix;
  while (p.length() > 1 && p.endsWith(u'/')) p.chop(1);
  if (p.isEmpty()) return false;
  if (p == u'/') return path.startsWith(u'/');

  return path == p || path.startsWith(p + QLatin1Char('/'));

}

const char *DependencyFilter::KindName(const Kind kind) {

  switch (kind) {
    case Kind::Relative:        return "relative";
    case Kind::HostApplication: return "host application";
    case Kind::System:          return "system";
    case Kind::PrefixFramework: return "prefix framework";
    case Kind::PrefixLibrary:   return "prefix library";
    case Kind::External:        return "external";
  }

  return "unknown";

}
