/*
 * pluginbundler
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef ENVUTILS_H
#define ENVUTILS_H

#include <QString>

namespace Utilities {

QString GetEnv(const QString &key);
void SetEnv(const char *key, const QString &value);
void UnsetEnv(const char *key);

}  // namespace Utilities

#endif  // ENVUTILS_H
