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

#ifndef MACHOTOOL_H
#define MACHOTOOL_H

#include <QByteArray>
#include <QString>
#include <QStringList>

class CommandRunner;

// Reads and rewrites Mach-O load commands through otool and install_name_tool.
class MachOTool {
 public:
  explicit MachOTool(CommandRunner *runner);

  static constexpr char kOtool[] = "otool";
  static constexpr char kInstallNameTool[] = "install_name_tool";

  // Libraries the binary links against, without its own install name.
  bool LinkedLibraries(const QString &path, QStringList *libraries) const;

  // LC_RPATH entries, in load command order.
  bool RPaths(const QString &path, QStringList *rpaths) const;

  bool SetInstallName(const QString &path, const QString &install_name) const;
  bool ChangeDependency(const QString &path, const QString &old_name, const QString &new_name) const;
  bool AddRPath(const QString &path, const QString &rpath) const;
  bool AddRPathIfMissing(const QString &path, const QString &rpath) const;

  static bool ParseLinkedLibraries(const QString &output, const QString &path, QStringList *libraries);
  static QStringList ParseRPaths(const QString &output);

  // Checks the magic number for thin and universal Mach-O files.
  static bool IsMachO(const QByteArray &header);
  static bool IsMachOFile(const QString &path);

 private:
  bool RunOtool(const QString &option, const QString &path, QString *output) const;
  bool RunInstallNameTool(const QStringList &arguments) const;

 private:
  CommandRunner *runner_;
};

#endif  // MACHOTOOL_H
