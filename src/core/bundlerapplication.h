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

#ifndef BUNDLERAPPLICATION_H
#define BUNDLERAPPLICATION_H

#include <QtGlobal>
#include <QStringList>

class CommandRunner;
class CommandlineOptions;

// Runs a complete bundling pass for parsed command line options: configuration, tool checks,
// bundling and the optional verify, license, archive and install steps.
class BundlerApplication {
 public:
  explicit BundlerApplication(CommandRunner *runner);

  // Returns the process exit code.
  int Run(const CommandlineOptions &options) const;

  // otool and install_name_tool, plus ditto when an archive is requested.
  static QStringList RequiredTools(const CommandlineOptions &options);

  bool CheckTools(const QStringList &tools) const;

 private:
  CommandRunner *runner_;

  Q_DISABLE_COPY(BundlerApplication)
};

#endif  // BUNDLERAPPLICATION_H
