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

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QDir>
#include <QFile>

#include "test_utils.h"
#include "testbundle.h"
#include "fake_machocommandrunner.h"

using namespace Qt::Literals::StringLiterals;

TestBundle::TestBundle() {

  config_.bundle_dir = Path(u"dist/gmic_gimp_qt"_s);
  config_.plugin_bin = Path(u"dist/gmic_gimp_qt/gmic_gimp_qt"_s);
  config_.macports_prefix = Path(u"opt/local"_s);
  config_.qt_prefix = Path(u"opt/local/libexec/qt5"_s);
  config_.host_app = Path(u"Applications/GIMP.app"_s);
  config_.frameworks = QStringList() << u"QtCore"_s << u"QtGui"_s;
  config_.prefix_libraries = QStringList() << u"lib/libfftw3.3.dylib"_s << u"lib/libmissing.1.dylib"_s;
  config_.host_libraries = QStringList() << u"Contents/Resources/lib/libcurl.4.dylib"_s;

}

QString TestBundle::Path(const QString &path) const { return temp_dir_.filePath(path); }

QString TestBundle::PrefixPath(const QString &path) const { return config_.macports_prefix + QLatin1Char('/') + path; }

QString TestBundle::QtPath(const QString &path) const { return config_.qt_prefix + QLatin1Char('/') + path; }

QString TestBundle::HostPath(const QString &path) const { return config_.host_app + QLatin1Char('/') + path; }

QString TestBundle::BundlePath(const QString &path) const { return config_.bundle_dir + QLatin1Char('/') + path; }

bool TestBundle::Create() {

  if (!temp_dir_.isValid()) return false;

  const QString qtcore = QtPath(u"lib/QtCore.framework/Versions/5/QtCore"_s);
  const QString qtgui = QtPath(u"lib/QtGui.framework/Versions/5/QtGui"_s);

  if (!CreateFramework(u"QtCore"_s, QStringList() << PrefixPath(u"lib/libpcre2-16.0.dylib"_s) << u"/usr/lib/libc++.1.dylib"_s)) return false;
  if (!CreateFramework(u"QtGui"_s, QStringList() << qtcore << PrefixPath(u"lib/libpng16.16.dylib"_s))) return false;

  const QString qcocoa = QtPath(u"plugins/platforms/libqcocoa.dylib"_s);
  const QString qjpeg = QtPath(u"plugins/imageformats/libqjpeg.dylib"_s);
  if (!QDir().mkpath(QtPath(u"plugins/platforms"_s)) || !QDir().mkpath(QtPath(u"plugins/imageformats"_s))) return false;
  if (!FakeMachOCommandRunner::WriteImage(qcocoa, qcocoa, QStringList() << qtgui << qtcore)) return false;
  if (!FakeMachOCommandRunner::WriteImage(qjpeg, qjpeg, QStringList() << qtgui << PrefixPath(u"lib/libjpeg.9.dylib"_s))) return false;

  if (!QDir().mkpath(PrefixPath(u"lib"_s))) return false;
  const QStringList plain_libraries = QStringList() << u"libpcre2-16.0.dylib"_s << u"libjpeg.9.dylib"_s << u"libz.1.dylib"_s << u"libquadmath.0.dylib"_s;
  for (const QString &name : plain_libraries) {
    if (!FakeMachOCommandRunner::WriteImage(PrefixPath(u"lib/"_s + name), PrefixPath(u"lib/"_s + name))) return false;
  }
  if (!FakeMachOCommandRunner::WriteImage(PrefixPath(u"lib/libpng16.16.dylib"_s), PrefixPath(u"lib/libpng16.16.dylib"_s), QStringList() << PrefixPath(u"lib/libz.1.dylib"_s))) return false;
  if (!FakeMachOCommandRunner::WriteImage(PrefixPath(u"lib/libfftw3.3.dylib"_s), PrefixPath(u"lib/libfftw3.3.dylib"_s), QStringList() << PrefixPath(u"lib/libquadmath.0.dylib"_s) << u"/usr/lib/libSystem.B.dylib"_s)) return false;

  if (!QDir().mkpath(HostPath(u"Contents/Resources/lib"_s))) return false;
  if (!FakeMachOCommandRunner::WriteImage(HostPath(u"Contents/Resources/lib/libcurl.4.dylib"_s), HostPath(u"Contents/Resources/lib/libcurl.4.dylib"_s), QStringList() << HostPath(u"Contents/Resources/lib/libz.1.dylib"_s))) return false;

  if (!QDir().mkpath(config_.bundle_dir)) return false;
  const QStringList plugin_dependencies = QStringList() << qtcore
                                                        << qtgui
                                                        << PrefixPath(u"lib/libfftw3.3.dylib"_s)
                                                        << HostPath(u"Contents/Resources/lib/libgimp-3.0.0.dylib"_s)
                                                        << u"/usr/lib/libSystem.B.dylib"_s;
  return FakeMachOCommandRunner::WriteImage(config_.plugin_bin, QString(), plugin_dependencies);

}

bool TestBundle::AddUnbundledDependencies() {

  FakeMachOCommandRunner::Image image;
  if (!FakeMachOCommandRunner::ReadImage(config_.plugin_bin, &image)) return false;

  image.dependencies << u"/usr/local/lib/libfoo.dylib"_s << PrefixPath(u"lib/QtSvg.framework/Versions/5/QtSvg"_s);

  return FakeMachOCommandRunner::WriteImage(config_.plugin_bin, image);

}

bool TestBundle::WriteConfigFile(const QString &filename) const {

  const QByteArray data = "[Bundle]\n"
                          "frameworks=" + config_.frameworks.join(u", "_s).toUtf8() + "\n"
                          "prefix_libraries=" + config_.prefix_libraries.join(u", "_s).toUtf8() + "\n"
                          "host_libraries=" + config_.host_libraries.join(u", "_s).toUtf8() + "\n";

  return WriteTestFile(filename, data);

}

bool TestBundle::CreateFramework(const QString &name, const QStringList &dependencies) const {

  const QString framework_dir = QtPath(u"lib/%1.framework"_s.arg(name));
  const QString binary = framework_dir + u"/Versions/5/"_s + name;

  if (!QDir().mkpath(framework_dir + u"/Versions/5/Resources"_s)) return false;
  if (!WriteTestFile(framework_dir + u"/Versions/5/Resources/Info.plist"_s, "<plist/>\n")) return false;
  if (!FakeMachOCommandRunner::WriteImage(binary, binary, dependencies)) return false;
  if (!QFile::link(u"5"_s, framework_dir + u"/Versions/Current"_s)) return false;
  if (!QFile::link(u"Versions/Current/"_s + name, framework_dir + QLatin1Char('/') + name)) return false;

  return QFile::link(u"Versions/Current/Resources"_s, framework_dir + u"/Resources"_s);

}
