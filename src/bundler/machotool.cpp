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

#include <initializer_list>
#include <utility>

#include <QtGlobal>
#include <QtEndian>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QRegularExpression>
#include <QRegularExpressionMatch>

#include "core/logging.h"
#include "core/commandrunner.h"
#include "machotool.h"

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr quint32 kMachOMagic32 = 0xfeedface;
constexpr quint32 kMachOMagic64 = 0xfeedfacf;
constexpr quint32 kFatMagic = 0xcafebabe;
constexpr quint32 kFatMagic64 = 0xcafebabf;

}  // namespace

MachOTool::MachOTool(CommandRunner *runner) : runner_(runner) {}

bool MachOTool::RunOtool(const QString &option, const QString &path, QString *output) const {

  QByteArray data;
  QString error;
  if (!runner_->Run(QLatin1String(kOtool), QStringList() << option << path, &data, &error)) {
    qLog(Error) << "otool" << option << "failed for" << path << ":" << error;
    return false;
  }
  *output = QString::fromUtf8(data);

  return true;

}

bool MachOTool::RunInstallNameTool(const QStringList &arguments) const {

  qLog(Debug) << "install_name_tool" << arguments.join(u' ');

  QString error;
  if (!runner_->Run(QLatin1String(kInstallNameTool), arguments, nullptr, &error)) {
    qLog(Error) << "install_name_tool" << arguments.join(u' ') << "failed:" << error;
    return false;
  }

  return true;

}

bool MachOTool::LinkedLibraries(const QString &path, QStringList *libraries) const {

  QString output;
  if (!RunOtool(u"-L"_s, path, &output)) return false;

  return ParseLinkedLibraries(output, path, libraries);

}

bool MachOTool::RPaths(const QString &path, QStringList *rpaths) const {

  QString output;
  if (!RunOtool(u"-l"_s, path, &output)) return false;

  *rpaths = ParseRPaths(output);

  return true;

}

bool MachOTool::SetInstallName(const QString &path, const QString &install_name) const {
  return RunInstallNameTool(QStringList() << u"-id"_s << install_name << path);
}

bool MachOTool::ChangeDependency(const QString &path, const QString &old_name, const QString &new_name) const {
  return RunInstallNameTool(QStringList() << u"-change"_s << old_name << new_name << path);
}

bool MachOTool::AddRPath(const QString &path, const QString &rpath) const {
  return RunInstallNameTool(QStringList() << u"-add_rpath"_s << rpath << path);
}

bool MachOTool::AddRPathIfMissing(const QString &path, const QString &rpath) const {

  QStringList rpaths;
  if (!RPaths(path, &rpaths)) return false;

  if (rpaths.contains(rpath)) {
    qLog(Debug) << path << "already has rpath" << rpath;
    return true;
  }

  return AddRPath(path, rpath);

}

bool MachOTool::ParseLinkedLibraries(const QString &output, const QString &path, QStringList *libraries) {

  static const QRegularExpression regexp_library(u"^\\t(.+) \\(compatibility version (\\d+\\.\\d+\\.\\d+), current version (\\d+\\.\\d+\\.\\d+)(, weak|, reexport|, upward)?\\)$"_s);

  const QString filename = QFileInfo(path).fileName();

  QStringList output_lines = output.split(u'\n', Qt::SkipEmptyParts);
  if (output_lines.isEmpty()) {
    qLog(Error) << "Could not parse otool output for" << path;
    return false;
  }

  libraries->clear();
  for (const QString &output_line : std::as_const(output_lines)) {
    // File headers, one per architecture for universal binaries.
    if (!output_line.startsWith(u'\t')) {
      if (output_line.endsWith(u':')) continue;
      qLog(Error) << "Could not parse otool output line:" << output_line;
      return false;
    }
    QRegularExpressionMatch match = regexp_library.match(output_line);
    if (!match.hasMatch()) {
      qLog(Error) << "Could not parse otool output line:" << output_line;
      return false;
    }
    const QString library = match.captured(1);
    if (QFileInfo(library).fileName() == filename) {  // It's this.
      continue;
    }
    if (!libraries->contains(library)) {
      libraries->append(library);
    }
  }

  return true;

}

QStringList MachOTool::ParseRPaths(const QString &output) {

  static const QRegularExpression regexp_cmd(u"^\\s*cmd (\\S+)\\s*$"_s);
  static const QRegularExpression regexp_path(u"^\\s*path (.+) \\(offset \\d+\\)\\s*$"_s);

  QStringList rpaths;
  bool in_rpath = false;
  const QStringList output_lines = output.split(u'\n', Qt::SkipEmptyParts);
  for (const QString &output_line : output_lines) {
    QRegularExpressionMatch match_cmd = regexp_cmd.match(output_line);
    if (match_cmd.hasMatch()) {
      in_rpath = match_cmd.captured(1) == "LC_RPATH"_L1;
      continue;
    }
    if (!in_rpath) continue;
    QRegularExpressionMatch match_path = regexp_path.match(output_line);
    if (match_path.hasMatch()) {
      const QString rpath = match_path.captured(1);
      if (!rpaths.contains(rpath)) rpaths << rpath;
      in_rpath = false;
    }
  }

  return rpaths;

}

bool MachOTool::IsMachO(const QByteArray &header) {

  if (header.size() < 4) return false;

  const quint32 magic_be = qFromBigEndian<quint32>(header.constData());
  const quint32 magic_le = qFromLittleEndian<quint32>(header.constData());

  for (const quint32 magic : {magic_be, magic_le}) {
    if (magic == kMachOMagic32 || magic == kMachOMagic64 || magic == kFatMagic || magic == kFatMagic64) {
      return true;
    }
  }

  return false;

}

bool MachOTool::IsMachOFile(const QString &path) {

  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) return false;
  const QByteArray header = file.read(4);
  file.close();

  return IsMachO(header);

}
