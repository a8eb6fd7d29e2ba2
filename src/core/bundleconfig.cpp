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

#include "config.h"

#include <initializer_list>
#include <utility>

#include <QString>
#include <QStringList>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>

#include "core/logging.h"
#include "bundleconfig.h"

using namespace Qt::Literals::StringLiterals;

BundleConfig::BundleConfig()
    : macports_prefix(QLatin1String(PLUGINBUNDLER_DEFAULT_MACPORTS_PREFIX)),
      frameworks({u"QtCore"_s, u"QtGui"_s, u"QtWidgets"_s, u"QtNetwork"_s, u"QtDBus"_s, u"QtPrintSupport"_s}),
      plugin_dirs({u"platforms"_s, u"styles"_s, u"imageformats"_s, u"iconengines"_s}),
      framework_version(QLatin1String(PLUGINBUNDLER_DEFAULT_FRAMEWORK_VERSION)),
      prefix_libraries({u"lib/libfftw3.3.dylib"_s,
                        u"lib/libfftw3_threads.3.dylib"_s,
                        u"lib/libomp/libomp.dylib"_s,
                        u"lib/libdbus-1.3.dylib"_s}),
      host_libraries({u"Contents/Resources/lib/libpng16.16.dylib"_s,
                      u"Contents/Resources/lib/libz.1.dylib"_s,
                      u"Contents/Resources/lib/libcurl.4.dylib"_s}),
      system_prefixes({u"/System"_s, u"/usr/lib"_s}) {}

bool BundleConfig::Load(const QString &filename) {

  if (!QFile::exists(filename)) {
    qLog(Error) << "Config file" << filename << "does not exist";
    return false;
  }

  QSettings s(filename, QSettings::IniFormat);
  if (s.status() != QSettings::NoError) {
    qLog(Error) << "Could not parse config file" << filename;
    return false;
  }

  s.beginGroup(QLatin1String(kSettingsGroup));

  const auto read_string = [&s](const QString &key, QString *value) {
    if (s.contains(key)) *value = s.value(key).toString();
  };
  const auto read_list = [&s](const QString &key, QStringList *value) {
    if (!s.contains(key)) return;
    value->clear();
    const QStringList list = s.value(key).toStringList();
    for (const QString &item : list) {
      if (!item.trimmed().isEmpty()) *value << item.trimmed();
    }
  };

  read_string(u"bundle_dir"_s, &bundle_dir);
  read_string(u"plugin_bin"_s, &plugin_bin);
  read_string(u"qt_prefix"_s, &qt_prefix);
  read_string(u"host_app"_s, &host_app);
  read_string(u"macports_prefix"_s, &macports_prefix);
  read_string(u"framework_version"_s, &framework_version);
  read_list(u"frameworks"_s, &frameworks);
  read_list(u"plugin_dirs"_s, &plugin_dirs);
  read_list(u"prefix_libraries"_s, &prefix_libraries);
  read_list(u"host_libraries"_s, &host_libraries);
  read_list(u"system_prefixes"_s, &system_prefixes);

  s.endGroup();

  qLog(Debug) << "Loaded config file" << filename;

  return true;

}

void BundleConfig::CleanPaths() {

  for (QString *path : {&bundle_dir, &plugin_bin, &qt_prefix, &host_app, &macports_prefix}) {
    if (!path->isEmpty()) *path = QDir::cleanPath(*path);
  }

}

QStringList BundleConfig::MissingRequired() const {

  QStringList missing;
  if (bundle_dir.isEmpty()) missing << u"bundle-dir"_s;
  if (plugin_bin.isEmpty()) missing << u"plugin-bin"_s;
  if (qt_prefix.isEmpty()) missing << u"qt-prefix"_s;
  if (host_app.isEmpty()) missing << u"host-app"_s;

  return missing;

}

QString BundleConfig::FrameworksDir() const { return bundle_dir + "/Frameworks"_L1; }

QString BundleConfig::PluginsDir() const { return FrameworksDir() + "/plugins"_L1; }

QString BundleConfig::LibDir() const { return FrameworksDir() + "/lib"_L1; }

QString BundleConfig::QtLibDir() const { return qt_prefix + "/lib"_L1; }

QString BundleConfig::QtPluginsDir() const { return qt_prefix + "/plugins"_L1; }

QString BundleConfig::FrameworkSource(const QString &name) const {
  return QStringLiteral("%1/%2.framework").arg(QtLibDir(), name);
}

QString BundleConfig::FrameworkBinary(const QString &name) const {
  return QStringLiteral("%1/%2.framework/Versions/%3/%2").arg(FrameworksDir(), name, framework_version);
}

QString BundleConfig::HostRPath() const { return host_app + "/Contents/Resources"_L1; }

QString BundleConfig::QtConfPath() const { return bundle_dir + "/qt.conf"_L1; }

QStringList BundleConfig::ExplicitLibraries() const {

  QStringList libraries;
  for (const QString &library : prefix_libraries) {
    libraries << macports_prefix + QLatin1Char('/') + library;
  }
  for (const QString &library : host_libraries) {
    libraries << host_app + QLatin1Char('/') + library;
  }

  QStringList resolved;
  for (const QString &library : std::as_const(libraries)) {
    if (!QFileInfo(library).fileName().contains(u'*')) {
      resolved << library;
      continue;
    }
    const QString match = ResolvePattern(library);
    if (match.isEmpty()) {
      qLog(Warning) << "No library matches" << library;
      continue;
    }
    resolved << match;
  }

  return resolved;

}

// First match in name order, ignoring variants like libpng16-config or libz.1-dev.
QString BundleConfig::ResolvePattern(const QString &path) {

  const QFileInfo fileinfo(path);
  const QDir dir = fileinfo.dir();
  const QStringList matches = dir.entryList(QStringList() << fileinfo.fileName(), QDir::Files, QDir::Name);
  for (const QString &match : matches) {
    if (!match.contains(u'-')) {
      return dir.filePath(match);
    }
  }

  return QString();

}
