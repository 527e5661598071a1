/*
 * SwarmQueue - download queue daemon using Qt and libtorrent.
 * Copyright (C) 2026  SwarmQueue contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
 *
 * In addition, as a special exception, the copyright holders give permission to
 * link this program with the OpenSSL project's "OpenSSL" library (or with
 * modified versions of it that use the same license as the "OpenSSL" library),
 * and distribute the linked executables. You must obey the GNU General Public
 * License in all respects for all of the code used other than "OpenSSL".  If you
 * modify file(s), you may extend this exception to your version of the file(s),
 * but you are not obligated to do so. If you do not wish to do so, delete this
 * exception statement from your version.
 */

#include "filelogger.h"

#include <chrono>

#include <QDateTime>
#include <QList>
#include <QTextStream>

#include "base/global.h"
#include "base/logger.h"
#include "base/utils/fs.h"

namespace
{
    const std::chrono::seconds FLUSH_INTERVAL {2};

    QStringView typePrefix(const Log::MsgType type)
    {
        switch (type)
        {
        case Log::INFO:
            return u"(I) ";
        case Log::WARNING:
            return u"(W) ";
        case Log::CRITICAL:
            return u"(C) ";
        default:
            return u"(N) ";
        }
    }
}

FileLogger::FileLogger(const Path &folderPath, const bool backup, const qint64 maxSize, QObject *parent)
    : QObject(parent)
    , m_path {folderPath / Path(u"swarmqueue.log"_s)}
    , m_backup {backup}
    , m_maxSize {maxSize}
{
    m_flusher.setInterval(FLUSH_INTERVAL);
    m_flusher.setSingleShot(true);
    connect(&m_flusher, &QTimer::timeout, this, &FileLogger::flushLog);

    Utils::Fs::mkpath(folderPath);
    m_logFile.setFileName(m_path.data());
    openLogFile();

    const Logger *const logger = Logger::instance();
    for (const Log::Msg &msg : asConst(logger->getMessages()))
        addLogMessage(msg);

    connect(logger, &Logger::newLogMessage, this, &FileLogger::addLogMessage);
}

FileLogger::~FileLogger()
{
    closeLogFile();
}

Path FileLogger::filePath() const
{
    return m_path;
}

void FileLogger::addLogMessage(const Log::Msg &msg)
{
    if (!m_logFile.isOpen())
        return;

    QTextStream stream(&m_logFile);
    stream << typePrefix(msg.type) << QDateTime::fromSecsSinceEpoch(msg.timestamp).toString(Qt::ISODate)
        << QStringView(u" - ") << msg.message << QChar(u'\n');
    stream.flush();

    if (m_backup && (m_logFile.size() >= m_maxSize))
        rotateLogFile();
    else if (!m_flusher.isActive())
        m_flusher.start();
}

void FileLogger::flushLog()
{
    if (m_logFile.isOpen())
        m_logFile.flush();
}

void FileLogger::openLogFile()
{
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)
        || !m_logFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner))
    {
        m_logFile.close();
        LogMsg(tr("An error occurred while trying to open the log file. Logging to file is disabled."), Log::CRITICAL);
    }
}

void FileLogger::closeLogFile()
{
    m_flusher.stop();
    m_logFile.close();
}

void FileLogger::rotateLogFile()
{
    closeLogFile();

    int counter = 0;
    Path backupPath = m_path + u".bak";
    while (backupPath.exists())
    {
        ++counter;
        backupPath = m_path + u".bak" + QString::number(counter);
    }

    if (!Utils::Fs::renameFile(m_path, backupPath))
        qWarning("Failed to rotate log file \"%s\"", qUtf8Printable(m_path.toString()));

    openLogFile();
}
