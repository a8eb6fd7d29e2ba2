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

#include <utility>

#include <QIODevice>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QFile>

#include "fake_machocommandrunner.h"

using namespace Qt::Literals::StringLiterals;

namespace {
constexpr char kFakeMagic[] = "\xcf\xfa\xed\xfe";
constexpr char kLibraryVersions[] = " (compatibility version 1.0.0, current version 1.0.0)\n";
}  // namespace

bool FakeMachOCommandRunner::WriteImage(const QString &path, const QString &id, const QStringList &dependencies, const QStringList &rpaths) {

  Image image;
  image.id = id;
  image.dependencies = dependencies;
  image.rpaths = rpaths;
  return WriteImage(path, image);

}

bool FakeMachOCommandRunner::WriteImage(const QString &path, const Image &image) {

  QByteArray data(kFakeMagic, 4);
  data += '\n';
  if (!image.id.isEmpty()) data += "id " + image.id.toUtf8() + '\n';
  for (const QString &dependency : image.dependencies) {
    data += "dep " + dependency.toUtf8() + '\n';
  }
  for (const QString &rpath : image.rpaths) {
    data += "rpath " + rpath.toUtf8() + '\n';
  }

  QFile file(path);
  if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;
  const bool success = file.write(data) == data.size();
  file.close();

  return success;

}

bool FakeMachOCommandRunner::ReadImage(const QString &path, Image *image) {

  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) return false;
  const QByteArray data = file.readAll();
  file.close();

  if (!data.startsWith(QByteArray(kFakeMagic, 4))) return false;

  *image = Image();
  const QStringList lines = QString::fromUtf8(data.mid(4)).split(u'\n', Qt::SkipEmptyParts);
  for (const QString &line : lines) {
    if (line.startsWith("id "_L1)) image->id = line.mid(3);
    else if (line.startsWith("dep "_L1)) image->dependencies << line.mid(4);
    else if (line.startsWith("rpath "_L1)) image->rpaths << line.mid(6);
  }

  return true;

}

bool FakeMachOCommandRunner::Run(const QString &program, const QStringList &arguments, QByteArray *output, QString *error) {

  calls_ << (QStringList() << program << arguments);

  if (failing_programs_.contains(program) || missing_programs_.contains(program)) {
    if (error) *error = u"%1 failed"_s.arg(program);
    return false;
  }

  if (program == "otool"_L1) return Otool(arguments, output, error);
  if (program == "install_name_tool"_L1) return InstallNameTool(arguments, error);

  if (output) output->clear();

  return true;

}

QList<QStringList> FakeMachOCommandRunner::calls(const QString &program) const {

  QList<QStringList> program_calls;
  for (const QStringList &call : calls_) {
    if (call.first() == program) program_calls << call;
  }
  return program_calls;

}

bool FakeMachOCommandRunner::Otool(const QStringList &arguments, QByteArray *output, QString *error) const {

  if (arguments.count() != 2) {
    if (error) *error = u"usage: otool [-L|-l] file"_s;
    return false;
  }

  const QString &path = arguments[1];
  Image image;
  if (!ReadImage(path, &image)) {
    if (error) *error = u"%1: is not an object file"_s.arg(path);
    return false;
  }

  QByteArray data = path.toUtf8() + ":\n";
  if (arguments[0] == "-L"_L1) {
    if (!image.id.isEmpty()) data += '\t' + image.id.toUtf8() + kLibraryVersions;
    for (const QString &dependency : std::as_const(image.dependencies)) {
      data += '\t' + dependency.toUtf8() + kLibraryVersions;
    }
  }
  else if (arguments[0] == "-l"_L1) {
    int index = 0;
    data += "Load command " + QByteArray::number(index++) + "\n"
                "      cmd LC_SEGMENT_64\n"
                "  cmdsize 72\n"
                "  segname __PAGEZERO\n";
    for (const QString &rpath : std::as_const(image.rpaths)) {
      data += "Load command " + QByteArray::number(index++) + "\n"
                  "          cmd LC_RPATH\n"
                  "      cmdsize 48\n"
                  "         path " + rpath.toUtf8() + " (offset 12)\n";
    }
  }
  else {
    if (error) *error = u"unknown option %1"_s.arg(arguments[0]);
    return false;
  }

  if (output) *output = data;

  return true;

}

bool FakeMachOCommandRunner::InstallNameTool(const QStringList &arguments, QString *error) const {

  if (arguments.count() < 3) {
    if (error) *error = u"usage: install_name_tool ..."_s;
    return false;
  }

  const QString &path = arguments.last();
  Image image;
  if (!ReadImage(path, &image)) {
    if (error) *error = u"%1: is not a Mach-O file"_s.arg(path);
    return false;
  }

  if (arguments[0] == "-id"_L1) {
    image.id = arguments[1];
  }
  else if (arguments[0] == "-change"_L1 && arguments.count() == 4) {
    for (QString &dependency : image.dependencies) {
      if (dependency == arguments[1]) dependency = arguments[2];
    }
  }
  else if (arguments[0] == "-add_rpath"_L1) {
    if (image.rpaths.contains(arguments[1])) {
      if (error) *error = u"would duplicate path, file already has LC_RPATH for: %1"_s.arg(arguments[1]);
      return false;
    }
    image.rpaths << arguments[1];
  }
  else {
    if (error) *error = u"unsupported arguments %1"_s.arg(arguments.join(u' '));
    return false;
  }

  return WriteImage(path, image);

}
