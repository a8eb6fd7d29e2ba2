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
#include "version.h"

#include <QtGlobal>
#include <QCoreApplication>
#include <QString>

#include "core/logging.h"
#include "core/commandlineoptions.h"
#include "core/commandrunner.h"
#include "core/bundlerapplication.h"

using namespace Qt::Literals::StringLiterals;

int main(int argc, char **argv) {

  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName(u"pluginbundler"_s);
  QCoreApplication::setApplicationVersion(QStringLiteral(PLUGINBUNDLER_VERSION_DISPLAY));

  // Log levels are set after the commandline options are parsed below.
  logging::Init();

  CommandlineOptions options(argc, argv);
  if (!options.Parse()) return options.help_requested() ? 0 : 1;
  logging::SetLevels(options.log_levels());

  qLog(Debug) << "pluginbundler" << PLUGINBUNDLER_VERSION_DISPLAY;

  ProcessCommandRunner runner;
  BundlerApplication bundler_application(&runner);

  return bundler_application.Run(options);

}
