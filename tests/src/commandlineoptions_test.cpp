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

#include "gtest_include.h"

#include <initializer_list>

#include <QString>
#include <QStringList>

#include "test_utils.h"
#include "core/logging.h"
#include "core/bundleconfig.h"
#include "core/commandlineoptions.h"
#include "utilities/envutils.h"

using namespace Qt::Literals::StringLiterals;

namespace {

class CommandlineOptionsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const char *key : {CommandlineOptions::kEnvBundleDir, CommandlineOptions::kEnvPluginBin, CommandlineOptions::kEnvQtPrefix, CommandlineOptions::kEnvHostApp, CommandlineOptions::kEnvMacPortsPrefix}) {
      Utilities::UnsetEnv(key);
    }
  }

  void TearDown() override { SetUp(); }
};

TEST_F(CommandlineOptionsTest, NoArguments) {

  TestArgv args(QStringList() << u"pluginbundler"_s);
  CommandlineOptions options(args.argc(), args.argv());
  ASSERT_TRUE(options.Parse());

  EXPECT_FALSE(options.help_requested());
  EXPECT_TRUE(options.bundle_dir().isEmpty());
  EXPECT_TRUE(options.config_file().isEmpty());
  EXPECT_FALSE(options.verify());
  EXPECT_EQ(QLatin1String(logging::kDefaultLogLevels), options.log_levels());

}

TEST_F(CommandlineOptionsTest, BundleOptions) {

  TestArgv args(QStringList() << u"pluginbundler"_s
                              << u"--bundle-dir"_s << u"/tmp/dist/gmic_gimp_qt"_s
                              << u"--plugin-bin=/tmp/dist/gmic_gimp_qt/gmic_gimp_qt"_s
                              << u"--qt-prefix"_s << u"/opt/local/libexec/qt5"_s
                              << u"--host-app"_s << u"/Applications/GIMP.app"_s
                              << u"--macports-prefix"_s << u"/opt/mp"_s
                              << u"--config"_s << u"bundle.ini"_s);
  CommandlineOptions options(args.argc(), args.argv());
  ASSERT_TRUE(options.Parse());

  EXPECT_EQ(u"/tmp/dist/gmic_gimp_qt"_s, options.bundle_dir());
  EXPECT_EQ(u"/tmp/dist/gmic_gimp_qt/gmic_gimp_qt"_s, options.plugin_bin());
  EXPECT_EQ(u"/opt/local/libexec/qt5"_s, options.qt_prefix());
  EXPECT_EQ(u"/Applications/GIMP.app"_s, options.host_app());
  EXPECT_EQ(u"/opt/mp"_s, options.macports_prefix());
  EXPECT_EQ(u"bundle.ini"_s, options.config_file());

}

TEST_F(CommandlineOptionsTest, PackagingOptions) {

  TestArgv args(QStringList() << u"pluginbundler"_s << u"--verify"_s << u"--license"_s << u"COPYING"_s << u"--archive"_s << u"gmic.zip"_s << u"--install"_s << u"plug-ins"_s);
  CommandlineOptions options(args.argc(), args.argv());
  ASSERT_TRUE(options.Parse());

  EXPECT_TRUE(options.verify());
  EXPECT_EQ(u"COPYING"_s, options.license_file());
  EXPECT_EQ(u"gmic.zip"_s, options.archive());
  EXPECT_EQ(u"plug-ins"_s, options.install_dir());

}

TEST_F(CommandlineOptionsTest, GimpAppAlias) {

  TestArgv args(QStringList() << u"pluginbundler"_s << u"--gimp-app"_s << u"/Applications/GIMP-3.0.app"_s);
  CommandlineOptions options(args.argc(), args.argv());
  ASSERT_TRUE(options.Parse());

  EXPECT_EQ(u"/Applications/GIMP-3.0.app"_s, options.host_app());

}

TEST_F(CommandlineOptionsTest, EnvironmentDefaults) {

  Utilities::SetEnv(CommandlineOptions::kEnvBundleDir, u"/env/bundle"_s);
  Utilities::SetEnv(CommandlineOptions::kEnvPluginBin, u"/env/bundle/plugin"_s);
  Utilities::SetEnv(CommandlineOptions::kEnvQtPrefix, u"/env/qt"_s);
  Utilities::SetEnv(CommandlineOptions::kEnvHostApp, u"/env/GIMP.app"_s);
  Utilities::SetEnv(CommandlineOptions::kEnvMacPortsPrefix, u"/env/prefix"_s);

  TestArgv args(QStringList() << u"pluginbundler"_s << u"--bundle-dir"_s << u"/cli/bundle"_s);
  CommandlineOptions options(args.argc(), args.argv());
  ASSERT_TRUE(options.Parse());

  EXPECT_EQ(u"/cli/bundle"_s, options.bundle_dir());
  EXPECT_EQ(u"/env/bundle/plugin"_s, options.plugin_bin());
  EXPECT_EQ(u"/env/qt"_s, options.qt_prefix());
  EXPECT_EQ(u"/env/GIMP.app"_s, options.host_app());
  EXPECT_EQ(u"/env/prefix"_s, options.macports_prefix());

}

TEST_F(CommandlineOptionsTest, ApplyTo) {

  TestArgv args(QStringList() << u"pluginbundler"_s << u"--qt-prefix"_s << u"/cli/qt"_s);
  CommandlineOptions options(args.argc(), args.argv());
  ASSERT_TRUE(options.Parse());

  BundleConfig config;
  config.bundle_dir = u"/config/bundle"_s;
  config.qt_prefix = u"/config/qt"_s;
  options.ApplyTo(&config);

  EXPECT_EQ(u"/config/bundle"_s, config.bundle_dir);
  EXPECT_EQ(u"/cli/qt"_s, config.qt_prefix);
  EXPECT_EQ(u"/opt/local"_s, config.macports_prefix);

}

TEST_F(CommandlineOptionsTest, LogLevels) {

  {
    TestArgv args(QStringList() << u"pluginbundler"_s << u"--quiet"_s);
    CommandlineOptions options(args.argc(), args.argv());
    ASSERT_TRUE(options.Parse());
    EXPECT_EQ(QLatin1String(logging::kQuietLogLevels), options.log_levels());
  }
  {
    TestArgv args(QStringList() << u"pluginbundler"_s << u"--verbose"_s);
    CommandlineOptions options(args.argc(), args.argv());
    ASSERT_TRUE(options.Parse());
    EXPECT_EQ(QLatin1String(logging::kVerboseLogLevels), options.log_levels());
  }
  {
    TestArgv args(QStringList() << u"pluginbundler"_s << u"--log-levels"_s << u"MachOTool:4,*:2"_s);
    CommandlineOptions options(args.argc(), args.argv());
    ASSERT_TRUE(options.Parse());
    EXPECT_EQ(u"MachOTool:4,*:2"_s, options.log_levels());
  }

}

TEST_F(CommandlineOptionsTest, Help) {

  TestArgv args(QStringList() << u"pluginbundler"_s << u"-h"_s);
  CommandlineOptions options(args.argc(), args.argv());
  EXPECT_FALSE(options.Parse());
  EXPECT_TRUE(options.help_requested());

}

TEST_F(CommandlineOptionsTest, UnknownOption) {

  TestArgv args(QStringList() << u"pluginbundler"_s << u"--frobnicate"_s);
  CommandlineOptions options(args.argc(), args.argv());
  EXPECT_FALSE(options.Parse());
  EXPECT_FALSE(options.help_requested());

}

TEST_F(CommandlineOptionsTest, MissingOptionArgument) {

  TestArgv args(QStringList() << u"pluginbundler"_s << u"--bundle-dir"_s);
  CommandlineOptions options(args.argc(), args.argv());
  EXPECT_FALSE(options.Parse());

}

TEST_F(CommandlineOptionsTest, UnexpectedArgument) {

  TestArgv args(QStringList() << u"pluginbundler"_s << u"--verify"_s << u"extra"_s);
  CommandlineOptions options(args.argc(), args.argv());
  EXPECT_FALSE(options.Parse());

}

TEST_F(CommandlineOptionsTest, Version) {

  TestArgv args(QStringList() << u"pluginbundler"_s << u"--version"_s);
  EXPECT_EXIT({
    CommandlineOptions options(args.argc(), args.argv());
    options.Parse();
  }, ::testing::ExitedWithCode(0), "");

}

}  // namespace
