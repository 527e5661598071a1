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

#include "jobsnapshotstorage.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include "base/global.h"
#include "base/logger.h"
#include "base/utils/io.h"

using namespace SwarmQueue;

namespace
{
    const int SNAPSHOT_VERSION = 1;
    const qint64 SNAPSHOT_MAX_SIZE = 64 * 1024 * 1024;

    const QString KEY_VERSION = u"version"_s;
    const QString KEY_JOBS = u"jobs"_s;

    void recoverInterruptedJob(Job &job)
    {
        switch (job.status)
        {
        case JobStatus::Downloading:
        case JobStatus::Seeding:
        case JobStatus::AwaitingSelection:
            job.status = JobStatus::Queued;
            break;
        default:
            break;
        }

        job.resetTransferStats();
    }
}

JobSnapshotStorage::JobSnapshotStorage(const Path &filePath)
    : m_filePath {filePath}
{
}

Path JobSnapshotStorage::filePath() const
{
    return m_filePath;
}

nonstd::expected<QList<Job>, QString> JobSnapshotStorage::load() const
{
    const auto readResult = Utils::IO::readFile(m_filePath, SNAPSHOT_MAX_SIZE);
    if (!readResult)
    {
        if (readResult.error().status == Utils::IO::ReadError::NotExist)
            return QList<Job>();

        return nonstd::make_unexpected(readResult.error().message);
    }

    QJsonParseError jsonError;
    const QJsonDocument jsonDoc = QJsonDocument::fromJson(readResult.value(), &jsonError);
    if (jsonError.error != QJsonParseError::NoError)
    {
        return nonstd::make_unexpected(QCoreApplication::translate("JobSnapshotStorage", "Failed to parse job snapshot. File: \"%1\". Error: \"%2\"")
            .arg(m_filePath.toString(), jsonError.errorString()));
    }

    if (!jsonDoc.isObject())
    {
        return nonstd::make_unexpected(QCoreApplication::translate("JobSnapshotStorage", "Invalid job snapshot format. File: \"%1\"")
            .arg(m_filePath.toString()));
    }

    const QJsonObject rootObj = jsonDoc.object();
    const int version = rootObj.value(KEY_VERSION).toInt();
    if (version > SNAPSHOT_VERSION)
    {
        return nonstd::make_unexpected(QCoreApplication::translate("JobSnapshotStorage", "Unsupported job snapshot version. File: \"%1\". Version: %2")
            .arg(m_filePath.toString(), QString::number(version)));
    }

    const QJsonArray jobsArray = rootObj.value(KEY_JOBS).toArray();

    QList<Job> jobs;
    jobs.reserve(jobsArray.size());
    for (const QJsonValue &jobValue : jobsArray)
    {
        std::optional<Job> job = deserializeJob(jobValue.toObject());
        if (!job)
        {
            LogMsg(QCoreApplication::translate("JobSnapshotStorage", "Skipping malformed job record in snapshot. File: \"%1\"")
                .arg(m_filePath.toString()), Log::WARNING);
            continue;
        }

        recoverInterruptedJob(*job);
        jobs.append(std::move(*job));
    }

    return jobs;
}

nonstd::expected<void, QString> JobSnapshotStorage::store(const QList<Job> &jobs) const
{
    QJsonArray jobsArray;
    for (Job job : jobs)
    {
        job.resetTransferStats();
        jobsArray.append(serializeJob(job));
    }

    const QJsonObject rootObj {
        {KEY_VERSION, SNAPSHOT_VERSION},
        {KEY_JOBS, jobsArray}
    };

    const nonstd::expected<void, QString> result = Utils::IO::saveToFile(m_filePath, QJsonDocument(rootObj).toJson());
    if (!result)
    {
        return nonstd::make_unexpected(QCoreApplication::translate("JobSnapshotStorage", "Failed to save job snapshot. File: \"%1\". Error: \"%2\"")
            .arg(m_filePath.toString(), result.error()));
    }

    return {};
}
