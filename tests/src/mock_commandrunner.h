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

#ifndef MOCK_COMMANDRUNNER_H
#define MOCK_COMMANDRUNNER_H

#include "gmock_include.h"

#include "core/commandrunner.h"

// clazy:excludeall=function-args-by-value

class MockCommandRunner : public CommandRunner {
 public:
  MOCK_METHOD4(Run, bool(const QString &program, const QStringList &arguments, QByteArray *output, QString *error));
  MOCK_CONST_METHOD1(Exists, bool(const QString &program));
};

#endif  // MOCK_COMMANDRUNNER_H
