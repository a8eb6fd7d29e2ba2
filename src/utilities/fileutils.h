/*
 * pluginbundler
 * Copyright 2010, David Sansome <me@davidsansome.com>
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

#ifndef FILEUTILS_H
#define FILEUTILS_H

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace Utilities {

QByteArray ReadDataFromFile(const QString &filename, const qint64 max_size = -1);
bool WriteDataToFile(const QString &filename, const QByteArray &data);

// Copies a single file, replacing the destination, and leaves the copy writable by the owner.
bool CopyFile(const QString &source, const QString &destination);

// Copies the directory source into the directory destination, so source "a/b" ends up as "destination/b".
// Symbolic links are recreated as links with the same target instead of being followed.
bool CopyRecursive(const QString &source, const QString &destination);

// Removes path and everything below it. A symbolic link is removed without touching its target.
bool RemoveRecursive(const QString &path);

bool MakeWritable(const QString &path);
bool MakeExecutable(const QString &path);

// Regular files below path with the given suffix, sorted.
QStringList FindFiles(const QString &path, const QString &suffix, const bool recursive);

}  // namespace Utilities

#endif  // FILEUTILS_H
