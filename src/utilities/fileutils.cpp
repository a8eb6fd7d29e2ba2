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

#include <QtGlobal>

#include <algorithm>

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QIODevice>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QFileDevice>

#include "core/logging.h"

#include "fileutils.h"

namespace Utilities {

QByteArray ReadDataFromFile(const QString &filename, const qint64 max_size) {

  QFile file(filename);
  QByteArray data;
  if (file.open(QIODevice::ReadOnly)) {
    data = max_size < 0 ? file.readAll() : file.read(max_size);
    file.close();
  }
  else {
    qLog(Error) << "Failed to open file" << filename << "for reading:" << file.errorString();
  }
  return data;

}

bool WriteDataToFile(const QString &filename, const QByteArray &data) {

  QFile file(filename);
  if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    qLog(Error) << "Failed to open file" << filename << "for writing:" << file.errorString();
    return false;
  }
  if (file.write(data) != data.size()) {
    qLog(Error) << "Failed to write to" << filename << ":" << file.errorString();
    return false;
  }
  file.close();

  return true;

}

bool CopyFile(const QString &source, const QString &destination) {

  if (QFileInfo(destination).isSymLink() || QFile::exists(destination)) {
    if (!QFile::remove(destination)) {
      qLog(Error) << "Failed to remove existing file" << destination;
      return false;
    }
  }

  QFile file(source);
  if (!file.copy(destination)) {
    qLog(Error) << "Failed to copy" << source << "to" << destination << ":" << file.errorString();
    return false;
  }

  return MakeWritable(destination);

}

bool CopyRecursive(const QString &source, const QString &destination) {

  // Make the destination directory
  QString dir_name = source.section(u'/', -1, -1);
  QString dest_path = destination + QLatin1Char('/') + dir_name;
  if (!QDir().mkpath(dest_path)) {
    qLog(Error) << "Failed to create directory" << dest_path;
    return false;
  }

  QDir dir(source);
  const QFileInfoList children = dir.entryInfoList(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System, QDir::Name);
  for (const QFileInfo &child : children) {
    const QString child_dest = dest_path + QLatin1Char('/') + child.fileName();
    if (child.isSymLink()) {
      if (!QFile::link(child.readSymLink(), child_dest)) {
        qLog(Warning) << "Failed to recreate link" << child.filePath() << "as" << child_dest;
        return false;
      }
    }
    else if (child.isDir()) {
      if (!CopyRecursive(child.filePath(), dest_path)) {
        qLog(Warning) << "Failed to copy dir" << child.filePath() << "to" << dest_path;
        return false;
      }
    }
    else if (!CopyFile(child.filePath(), child_dest)) {
      return false;
    }
  }

  return true;

}

bool RemoveRecursive(const QString &path) {

  // A link is removed itself, never what it points to.
  if (QFileInfo(path).isSymLink()) {
    if (!QFile::remove(path)) {
      qLog(Error) << "Failed to remove link" << path;
      return false;
    }
    return true;
  }

  QDir dir(path);
  const QFileInfoList children = dir.entryInfoList(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System);
  for (const QFileInfo &child : children) {
    // Never follow links out of the tree being removed.
    if (child.isSymLink() || !child.isDir()) {
      if (!QFile::remove(child.filePath())) {
        return false;
      }
    }
    else if (!RemoveRecursive(child.filePath())) {
      return false;
    }
  }

  return dir.rmdir(path);

}

bool MakeWritable(const QString &path) {

  const QFileDevice::Permissions permissions = QFile::permissions(path);
  if (permissions.testFlag(QFileDevice::WriteOwner)) return true;

  if (!QFile::setPermissions(path, permissions | QFileDevice::WriteOwner)) {
    qLog(Error) << "Failed to make" << path << "writable";
    return false;
  }

  return true;

}

bool MakeExecutable(const QString &path) {

  const QFileDevice::Permissions permissions = QFile::permissions(path);
  if (!QFile::setPermissions(path, permissions | QFileDevice::ExeOwner | QFileDevice::ExeGroup | QFileDevice::ExeOther)) {
    qLog(Error) << "Failed to make" << path << "executable";
    return false;
  }

  return true;

}

QStringList FindFiles(const QString &path, const QString &suffix, const bool recursive) {

  QStringList files;
  QDirIterator it(path, QDir::Files | QDir::NoSymLinks, recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
  while (it.hasNext()) {
    const QString filepath = it.next();
    if (filepath.endsWith(suffix)) {
      files << filepath;
    }
  }
  std::sort(files.begin(), files.end());

  return files;

}

}  // namespace Utilities
