/* This file is part of pluginbundler.
   Copyright 2011, David Sansome <me@davidsansome.com>
   Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <QtGlobal>

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <memory>

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QIODevice>
#include <QBuffer>
#include <QtMessageHandler>
#include <QMessageLogContext>
#include <QDebug>

#include "logging.h"

using namespace Qt::Literals::StringLiterals;

namespace logging {

static Level sDefaultLevel = Level_Info;
static QMap<QString, Level> *sClassLevels = nullptr;
static QIODevice *sNullDevice = nullptr;

const char *kDefaultLogLevels = "*:3";
const char *kQuietLogLevels = "*:1";
const char *kVerboseLogLevels = "*:4";

static constexpr char kMessageHandlerMagic[] = "__logging_message__";
static const size_t kMessageHandlerMagicLen = strlen(kMessageHandlerMagic);
static QtMessageHandler sOriginalMessageHandler = nullptr;

template<class T>
static T CreateLogger(Level level, const QString &class_name, int line, const char *category);

template<class T>
class DebugBase : public QDebug {
 public:
  DebugBase() : QDebug(sNullDevice) {}
  explicit DebugBase(QtMsgType t) : QDebug(t) {}
  T &space() { return static_cast<T&>(QDebug::space()); }
  T &nospace() { return static_cast<T&>(QDebug::nospace()); }
};

// Debug message will be stored in a buffer.
class BufferedDebug : public DebugBase<BufferedDebug> {
 public:
  BufferedDebug() = default;
  explicit BufferedDebug(QtMsgType msg_type) : buf_(new QBuffer, later_deleter) {

    Q_UNUSED(msg_type)

    buf_->open(QIODevice::WriteOnly);

    // QDebug doesn't have a method to set a new io device, but swap() allows the devices to be swapped between two instances.
    QDebug other(buf_.get());
    swap(other);
  }

  // The base class holds the raw pointer, so the buffer must outlive this object.
  static void later_deleter(QBuffer *b) { b->deleteLater(); }

  std::shared_ptr<QBuffer> buf_;
};

// Debug message will be logged immediately.
class LoggedDebug : public DebugBase<LoggedDebug> {
 public:
  LoggedDebug() = default;
  explicit LoggedDebug(QtMsgType t) : DebugBase(t) { nospace() << kMessageHandlerMagic; }
};

// Everything goes to stderr, stdout is reserved for the final result and the help text.
static void MessageHandler(QtMsgType type, const QMessageLogContext &message_log_context, const QString &message) {

  if (message.startsWith(QLatin1String(kMessageHandlerMagic))) {
    QByteArray message_data = message.toUtf8();
    fprintf(stderr, "%s\n", message_data.constData() + kMessageHandlerMagicLen);
    fflush(stderr);
    if (type == QtFatalMsg) {
      abort();
    }
    return;
  }

  Level level = Level_Debug;
  switch (type) {
    case QtFatalMsg:
    case QtCriticalMsg:
      level = Level_Error;
      break;
    case QtWarningMsg:
      level = Level_Warning;
      break;
    case QtInfoMsg:
      level = Level_Info;
      break;
    case QtDebugMsg:
    default:
      level = Level_Debug;
      break;
  }

  const QString category = message_log_context.category ? QString::fromLatin1(message_log_context.category) : u"qt"_s;

  const QStringList lines = message.split(u'\n');
  for (const QString &line : lines) {
    BufferedDebug d = CreateLogger<BufferedDebug>(level, category, -1, nullptr);
    d << line.toLocal8Bit().constData();
    if (d.buf_) {
      d.buf_->close();
      fprintf(stderr, "%s\n", d.buf_->buffer().constData());
      fflush(stderr);
    }
  }

  if (type == QtFatalMsg) {
    abort();
  }

}

void Init() {

  delete sClassLevels;
  delete sNullDevice;

  sDefaultLevel = Level_Info;
  sClassLevels = new QMap<QString, Level>();
  sNullDevice = new NullDevice;
  sNullDevice->open(QIODevice::ReadWrite);

  // Catch other messages from Qt
  if (!sOriginalMessageHandler) {
    sOriginalMessageHandler = qInstallMessageHandler(MessageHandler);
  }

}

void SetLevels(const QString &levels) {

  if (!sClassLevels) return;

  const QStringList items = levels.split(u',');
  for (const QString &item : items) {
    const QStringList class_level = item.split(u':');

    QString class_name;
    bool ok = false;
    int level = Level_Error;

    if (class_level.count() == 1) {
      level = class_level.last().toInt(&ok);
    }
    else if (class_level.count() == 2) {
      class_name = class_level.first();
      level = class_level.last().toInt(&ok);
    }

    if (!ok || level < Level_Error || level > Level_Debug) {
      continue;
    }

    if (class_name.isEmpty() || class_name == u'*') {
      sDefaultLevel = static_cast<Level>(level);
    }
    else {
      sClassLevels->insert(class_name, static_cast<Level>(level));
    }
  }

}

Level LevelFor(const QString &class_name) {

  if (sClassLevels && sClassLevels->contains(class_name)) {
    return sClassLevels->value(class_name);
  }
  return sDefaultLevel;

}

static QString ParsePrettyFunction(const char *pretty_function) {

  // Get the class name out of the function name.
  QString class_name = QLatin1String(pretty_function);
  const qint64 paren = class_name.indexOf(u'(');
  if (paren != -1) {
    const qint64 colons = class_name.lastIndexOf("::"_L1, paren);
    if (colons != -1) {
      class_name = class_name.left(colons);
    }
    else {
      class_name = class_name.left(paren);
    }
  }

  const qint64 space = class_name.lastIndexOf(u' ');
  if (space != -1) {
    class_name = class_name.mid(space + 1);
  }

  return class_name;

}

template <class T>
static T CreateLogger(Level level, const QString &class_name, int line, const char *category) {

  // Map the level to a string
  const char *level_name = nullptr;
  switch (level) {
    case Level_Debug:   level_name = " DEBUG "; break;
    case Level_Info:    level_name = " INFO  "; break;
    case Level_Warning: level_name = " WARN  "; break;
    case Level_Error:   level_name = " ERROR "; break;
    case Level_Fatal:   level_name = " FATAL "; break;
  }

  const QString filter_category = (category != nullptr) ? QLatin1String(category) : class_name;
  // Fatal messages are never filtered.
  if (level != Level_Fatal && level > LevelFor(filter_category)) {
    return T();
  }

  QString function_line = class_name;
  if (line != -1) {
    function_line += QLatin1Char(':') + QString::number(line);
  }
  if (category) {
    function_line += QLatin1Char('(') + QLatin1String(category) + QLatin1Char(')');
  }

  QtMsgType type = QtDebugMsg;
  if (level == Level_Fatal) {
    type = QtFatalMsg;
  }

  T ret(type);
  ret.nospace() << QDateTime::currentDateTime().toString(u"hh:mm:ss.zzz"_s).toLatin1().constData() << level_name << function_line.leftJustified(32).toLatin1().constData();

  return ret.space();

}

// These are the functions that create loggers for the rest of pluginbundler.
// It's okay that the LoggedDebug instance is copied to a QDebug in these. It doesn't override any behavior that should be needed after return.
#define qCreateLogger(line, pretty_function, category, level) logging::CreateLogger<LoggedDebug>(logging::Level_##level, logging::ParsePrettyFunction(pretty_function), line, category)

QDebug CreateLoggerFatal(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Fatal); }
QDebug CreateLoggerError(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Error); }

#ifdef QT_NO_INFO_OUTPUT
QNoDebug CreateLoggerInfo(const int line, const char *pretty_function, const char *category) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)
  Q_UNUSED(category)

  return QNoDebug();

}
#else
QDebug CreateLoggerInfo(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Info); }
#endif // QT_NO_INFO_OUTPUT

#ifdef QT_NO_WARNING_OUTPUT
QNoDebug CreateLoggerWarning(const int line, const char *pretty_function, const char *category) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)
  Q_UNUSED(category)

  return QNoDebug();

}
#else
QDebug CreateLoggerWarning(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Warning); }
#endif // QT_NO_WARNING_OUTPUT

#ifdef QT_NO_DEBUG_OUTPUT
QNoDebug CreateLoggerDebug(const int line, const char *pretty_function, const char *category) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)
  Q_UNUSED(category)

  return QNoDebug();

}
#else
QDebug CreateLoggerDebug(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Debug); }
#endif // QT_NO_DEBUG_OUTPUT

}  // namespace logging
