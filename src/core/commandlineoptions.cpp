/*
 * pluginbundler
 * Copyright 2012, David Sansome <me@davidsansome.com>
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

#include <cstdlib>
#include <iostream>

#include <QtGlobal>
#include <QObject>
#include <QString>

#include "commandlineoptions.h"
#include "bundleconfig.h"
#include "core/logging.h"
#include "utilities/envutils.h"

#include <getopt.h>

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr char kHelpText[] =
    "%1: pluginbundler [%2]\n"
    "\n"
    "%3\n"
    "\n"
    "%4:\n"
    "  --bundle-dir <dir>         %5\n"
    "  --plugin-bin <file>        %6\n"
    "  --qt-prefix <dir>          %7\n"
    "  --host-app <app>           %8\n"
    "  --macports-prefix <dir>    %9\n"
    "  --config <file>            %10\n"
    "\n"
    "%11:\n"
    "  --verify                   %12\n"
    "  --license <file>           %13\n"
    "  --archive <zip>            %14\n"
    "  --install <dir>            %15\n"
    "\n"
    "%16:\n"
    "  --quiet                    %17\n"
    "  --verbose                  %18\n"
    "  --log-levels <levels>      %19\n"
    "  --version                  %20\n"
    "  -h, --help                 %21\n";

constexpr char kVersionText[] = "pluginbundler %1";

}  // namespace

CommandlineOptions::CommandlineOptions(int argc, char **argv)
    : argc_(argc),
      argv_(argv),
      help_requested_(false),
      bundle_dir_(Utilities::GetEnv(QLatin1String(kEnvBundleDir))),
      plugin_bin_(Utilities::GetEnv(QLatin1String(kEnvPluginBin))),
      qt_prefix_(Utilities::GetEnv(QLatin1String(kEnvQtPrefix))),
      host_app_(Utilities::GetEnv(QLatin1String(kEnvHostApp))),
      macports_prefix_(Utilities::GetEnv(QLatin1String(kEnvMacPortsPrefix))),
      verify_(false),
      log_levels_(QLatin1String(logging::kDefaultLogLevels)) {}

bool CommandlineOptions::Parse() {

  static const struct option kOptions[] = {
    { "help", no_argument, nullptr, 'h' },
    { "bundle-dir", required_argument, nullptr, LongOptions::BundleDir },
    { "plugin-bin", required_argument, nullptr, LongOptions::PluginBin },
    { "qt-prefix", required_argument, nullptr, LongOptions::QtPrefix },
    { "host-app", required_argument, nullptr, LongOptions::HostApp },
    { "gimp-app", required_argument, nullptr, LongOptions::HostApp },
    { "macports-prefix", required_argument, nullptr, LongOptions::MacPortsPrefix },
    { "config", required_argument, nullptr, LongOptions::Config },
    { "verify", no_argument, nullptr, LongOptions::Verify },
    { "license", required_argument, nullptr, LongOptions::License },
    { "archive", required_argument, nullptr, LongOptions::Archive },
    { "install", required_argument, nullptr, LongOptions::Install },
    { "quiet", no_argument, nullptr, LongOptions::Quiet },
    { "verbose", no_argument, nullptr, LongOptions::Verbose },
    { "log-levels", required_argument, nullptr, LongOptions::LogLevels },
    { "version", no_argument, nullptr, LongOptions::Version },
    { nullptr, 0, nullptr, 0 }
  };

  // getopt keeps its state in globals, reset it so the options can be parsed more than once.
#ifdef Q_OS_MACOS
  optreset = 1;
  optind = 1;
#else
  optind = 0;
#endif

  Q_FOREVER {
    int c = getopt_long(argc_, argv_, "h", kOptions, nullptr);

    // End of the options
    if (c == -1) break;

    switch (c) {
      case 'h':{
        QString translated_help_text =
            QString::fromUtf8(kHelpText)
                .arg(QObject::tr("Usage"), QObject::tr("options"),
                     QObject::tr("Copies Qt frameworks, Qt plugins and third-party libraries into a plugin bundle and rewrites their load commands."),
                     QObject::tr("Bundle options"),
                     QObject::tr("Plugin bundle directory (env BUNDLE_DIR)"),
                     QObject::tr("Path to the plugin binary inside the bundle (env PLUGIN_BIN)"),
                     QObject::tr("Qt prefix path (env QT_PREFIX)"),
                     QObject::tr("Path to the host application, alias --gimp-app (env GIMP_APP)"),
                     QObject::tr("MacPorts prefix, default /opt/local (env MACPORTS_PREFIX)"))
                .arg(QObject::tr("INI file with a [Bundle] group"),
                     QObject::tr("Packaging options"),
                     QObject::tr("Check that the bundle is self-contained"),
                     QObject::tr("Copy a license file into the bundle"),
                     QObject::tr("Create a zip archive of the bundle"),
                     QObject::tr("Install the bundle into a plug-in directory"),
                     QObject::tr("Other options"),
                     QObject::tr("Equivalent to --log-levels *:1"),
                     QObject::tr("Equivalent to --log-levels *:4"))
                .arg(QObject::tr("Comma separated list of class:level, level is 0-4"),
                     QObject::tr("Print out version information"),
                     QObject::tr("Show this help"));

        std::cout << translated_help_text.toLocal8Bit().constData();
        help_requested_ = true;
        return false;
      }

      case LongOptions::BundleDir:
        bundle_dir_ = OptArgToString(optarg);
        break;
      case LongOptions::PluginBin:
        plugin_bin_ = OptArgToString(optarg);
        break;
      case LongOptions::QtPrefix:
        qt_prefix_ = OptArgToString(optarg);
        break;
      case LongOptions::HostApp:
        host_app_ = OptArgToString(optarg);
        break;
      case LongOptions::MacPortsPrefix:
        macports_prefix_ = OptArgToString(optarg);
        break;
      case LongOptions::Config:
        config_file_ = OptArgToString(optarg);
        break;
      case LongOptions::Verify:
        verify_ = true;
        break;
      case LongOptions::License:
        license_file_ = OptArgToString(optarg);
        break;
      case LongOptions::Archive:
        archive_ = OptArgToString(optarg);
        break;
      case LongOptions::Install:
        install_dir_ = OptArgToString(optarg);
        break;
      case LongOptions::Quiet:
        log_levels_ = QLatin1String(logging::kQuietLogLevels);
        break;
      case LongOptions::Verbose:
        log_levels_ = QLatin1String(logging::kVerboseLogLevels);
        break;
      case LongOptions::LogLevels:
        log_levels_ = OptArgToString(optarg);
        break;
      case LongOptions::Version:{
        QString version_text = QString::fromUtf8(kVersionText).arg(QLatin1String(PLUGINBUNDLER_VERSION_DISPLAY));
        std::cout << version_text.toLocal8Bit().constData() << std::endl;
        std::exit(0);
      }

      case '?':
      default:
        return false;
    }
  }

  if (optind < argc_) {
    qLog(Error) << "Unexpected argument" << OptArgToString(argv_[optind]);
    return false;
  }

  return true;

}

void CommandlineOptions::ApplyTo(BundleConfig *config) const {

  if (!bundle_dir_.isEmpty()) config->bundle_dir = bundle_dir_;
  if (!plugin_bin_.isEmpty()) config->plugin_bin = plugin_bin_;
  if (!qt_prefix_.isEmpty()) config->qt_prefix = qt_prefix_;
  if (!host_app_.isEmpty()) config->host_app = host_app_;
  if (!macports_prefix_.isEmpty()) config->macports_prefix = macports_prefix_;

}

QString CommandlineOptions::OptArgToString(const char *opt) {
  return QString::fromLocal8Bit(opt);
}
