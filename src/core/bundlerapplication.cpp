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

#include <iostream>

#include <QtGlobal>
#include <QString>
#include <QStringList>

#include "core/logging.h"
#include "bundlerapplication.h"
#include "bundleconfig.h"
#include "commandlineoptions.h"
#include "commandrunner.h"
#include "bundler/machotool.h"
#include "bundler/pluginbundler.h"
#include "bundler/bundleverifier.h"
#include "bundler/bundlepackager.h"

using namespace Qt::Literals::StringLiterals;

BundlerApplication::BundlerApplication(CommandRunner *runner) : runner_(runner) {}

QStringList BundlerApplication::RequiredTools(const CommandlineOptions &options) {

  QStringList tools = QStringList() << QLatin1String(MachOTool::kOtool) << QLatin1String(MachOTool::kInstallNameTool);
  if (!options.archive().isEmpty()) tools << QLatin1String(BundlePackager::kDitto);

  return tools;

}

bool BundlerApplication::CheckTools(const QStringList &tools) const {

  for (const QString &tool : tools) {
    if (!runner_->Exists(tool)) {
      qLog(Error) << "Missing command:" << qUtf8Printable(tool);
      return false;
    }
  }

  return true;

}

int BundlerApplication::Run(const CommandlineOptions &options) const {

  BundleConfig config;
  if (!options.config_file().isEmpty() && !config.Load(options.config_file())) {
    return 1;
  }
  options.ApplyTo(&config);
  config.CleanPaths();

  const QStringList missing = config.MissingRequired();
  if (!missing.isEmpty()) {
    qLog(Error) << qUtf8Printable(u"Error: --%1 (or env var) is required"_s.arg(missing.first()));
    return 1;
  }

  if (!CheckTools(RequiredTools(options))) return 1;

  MachOTool macho_tool(runner_);

  PluginBundler bundler(config, &macho_tool);
  if (!bundler.Bundle()) return 1;

  if (options.verify()) {
    BundleVerifier verifier(config, &macho_tool);
    if (!verifier.Verify()) {
      qLog(Error) << "Bundle verification failed with" << verifier.errors().count() << "errors";
      return 1;
    }
  }

  BundlePackager packager(config, runner_);
  if (!options.license_file().isEmpty() && !packager.CopyLicense(options.license_file())) return 1;
  if (!options.archive().isEmpty() && !packager.CreateArchive(options.archive())) return 1;
  if (!options.install_dir().isEmpty() && !packager.Install(options.install_dir())) return 1;

  std::cout << "Bundle complete: " << config.bundle_dir.toLocal8Bit().constData() << std::endl;

  return 0;

}
