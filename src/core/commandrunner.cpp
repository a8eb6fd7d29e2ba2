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
#include <QProcess>
#include <QStandardPaths>

#include "core/logging.h"
#include "commandrunner.h"

using namespace Qt::Literals::StringLiterals;

CommandRunner::CommandRunner() = default;

ProcessCommandRunner::ProcessCommandRunner() = default;

bool ProcessCommandRunner::Run(const QString &program, const QStringList &arguments, QByteArray *output, QString *error) {

  qLog(Debug) << "Running" << program << arguments.join(u' ');

  QProcess process;
  process.start(program, arguments);
  if (!process.waitForStarted()) {
    if (error) *error = process.errorString();
    return false;
  }
  // Tools like ditto can take a while on large bundles.
  process.waitForFinished(-1);

  if (output) *output = process.readAllStandardOutput();
  if (error) *error = QString::fromLocal8Bit(process.readAllStandardError()).trimmed();

  if (process.exitStatus() != QProcess::NormalExit) {
    if (error && error->isEmpty()) *error = u"%1 crashed"_s.arg(program);
    return false;
  }

  return process.exitCode() == 0;

}

bool ProcessCommandRunner::Exists(const QString &program) const {
  return !QStandardPaths::findExecutable(program).isEmpty();
}
