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

#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QtGlobal>
#include <QByteArray>
#include <QString>
#include <QStringList>

class CommandRunner {
 public:
  explicit CommandRunner();
  virtual ~CommandRunner() {}

  // Runs program to completion.
  // Returns false if it could not be started, crashed or exited with a non-zero code, stderr is returned in error.
  virtual bool Run(const QString &program, const QStringList &arguments, QByteArray *output = nullptr, QString *error = nullptr) = 0;

  // Whether program can be found in PATH.
  virtual bool Exists(const QString &program) const = 0;

 private:
  Q_DISABLE_COPY(CommandRunner)
};

class ProcessCommandRunner : public CommandRunner {
 public:
  ProcessCommandRunner();

  bool Run(const QString &program, const QStringList &arguments, QByteArray *output = nullptr, QString *error = nullptr) override;
  bool Exists(const QString &program) const override;

 private:
  Q_DISABLE_COPY(ProcessCommandRunner)
};

#endif  // COMMANDRUNNER_H
