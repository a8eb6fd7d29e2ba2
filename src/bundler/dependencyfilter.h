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

#ifndef DEPENDENCYFILTER_H
#define DEPENDENCYFILTER_H

#include <QString>
#include <QStringList>

class BundleConfig;

// Decides what happens to a dependency path reported by otool, and what it is rewritten to.
class DependencyFilter {
 public:
  explicit DependencyFilter(const BundleConfig &config);

  enum class Kind {
    Relative,
    HostApplication,
    System,
    PrefixFramework,
    PrefixLibrary,
    External
  };

  Kind Classify(const QString &path) const;

  // Empty unless path is a framework or library under the prefix.
  QString BundledInstallName(const QString &path) const;

  QString FrameworkInstallName(const QString &name) const;
  static QString LibraryInstallName(const QString &path);

  // "QtCore" for ".../QtCore.framework/Versions/5/QtCore".
  static QString FrameworkName(const QString &path);

  // Path component prefix test, "/opt/localfoo" is not under "/opt/local".
  static bool IsUnder(const QString &path, const QString &prefix);

  static const char *KindName(const Kind kind);

 private:
  QString host_app_;
  QString prefix_;
  QStringList system_prefixes_;
  QString framework_version_;
};

#endif  // DEPENDENCYFILTER_H
