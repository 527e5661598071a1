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

#include "job.h"

#include <QJsonArray>
#include <QJsonObject>

#include "base/global.h"

using namespace SwarmQueue;

namespace
{
    const QString KEY_ID = u"id"_s;
    const QString KEY_MAGNET_URI = u"magnetUri"_s;
    const QString KEY_DESCRIPTOR_PATH = u"torrentFilePath"_s;
    const QString KEY_OWNER_ID = u"ownerId"_s;
    const QString KEY_NAME = u"name"_s;
    const QString KEY_STATUS = u"status"_s;
    const QString KEY_INFO_HASH = u"infoHash"_s;
    const QString KEY_ROOT_FOLDER = u"rootFolder"_s;
    const QString KEY_TOTAL_SIZE = u"totalSize"_s;
    const QString KEY_DOWNLOADED = u"downloaded"_s;
    const QString KEY_UPLOADED = u"uploaded"_s;
    const QString KEY_DOWNLOAD_SPEED = u"downloadSpeed"_s;
    const QString KEY_UPLOAD_SPEED = u"uploadSpeed"_s;
    const QString KEY_SEEDERS = u"seeders"_s;
    const QString KEY_RATIO = u"ratio"_s;
    const QString KEY_PROGRESS = u"progress"_s;
    const QString KEY_FILES = u"files"_s;
    const QString KEY_SELECTED_INDICES = u"selectedFileIndices"_s;
    const QString KEY_DOWNLOAD_PATH = u"downloadPath"_s;
    const QString KEY_ERROR = u"error"_s;
    const QString KEY_ADDED_AT = u"addedAt"_s;
    const QString KEY_STARTED_AT = u"startedAt"_s;
    const QString KEY_COMPLETED_AT = u"completedAt"_s;

    const QString KEY_FILE_PATH = u"path"_s;
    const QString KEY_FILE_NAME = u"name"_s;
    const QString KEY_FILE_SIZE = u"size"_s;
    const QString KEY_FILE_DOWNLOADED = u"downloaded"_s;
    const QString KEY_FILE_PROGRESS = u"progress"_s;
    const QString KEY_FILE_SELECTED = u"selected"_s;

    QString toJsonTime(const QDateTime &dateTime)
    {
        return dateTime.isValid() ? dateTime.toString(Qt::ISODateWithMs) : QString();
    }

    QDateTime fromJsonTime(const QJsonValue &value)
    {
        return QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    }
}

QString SwarmQueue::toString(const JobStatus status)
{
    switch (status)
    {
    case JobStatus::Queued:
        return u"queued"_s;
    case JobStatus::Downloading:
        return u"downloading"_s;
    case JobStatus::AwaitingSelection:
        return u"awaiting-selection"_s;
    case JobStatus::Paused:
        return u"paused"_s;
    case JobStatus::Seeding:
        return u"seeding"_s;
    case JobStatus::Completed:
        return u"completed"_s;
    case JobStatus::Error:
        return u"error"_s;
    }

    Q_UNREACHABLE();
    return {};
}

std::optional<JobStatus> SwarmQueue::jobStatusFromString(const QString &str)
{
    const JobStatus statuses[] = {JobStatus::Queued, JobStatus::Downloading, JobStatus::AwaitingSelection
        , JobStatus::Paused, JobStatus::Seeding, JobStatus::Completed, JobStatus::Error};
    for (const JobStatus status : statuses)
    {
        if (str == toString(status))
            return status;
    }
    return std::nullopt;
}

bool SwarmQueue::occupiesSlot(const JobStatus status)
{
    return (status == JobStatus::Downloading) || (status == JobStatus::Seeding);
}

bool SwarmQueue::isTerminal(const JobStatus status)
{
    return (status == JobStatus::Completed) || (status == JobStatus::Error);
}

bool Job::isFileSelected(const int index) const
{
    return !selectedIndices || selectedIndices->contains(index);
}

bool Job::hasNarrowSelection() const
{
    if (!selectedIndices || files.isEmpty())
        return false;

    for (int i = 0; i < files.size(); ++i)
    {
        if (!selectedIndices->contains(i))
            return true;
    }
    return false;
}

void Job::syncFileSelection()
{
    for (int i = 0; i < files.size(); ++i)
        files[i].selected = isFileSelected(i);
}

void Job::resetTransferStats()
{
    downloadSpeed = 0;
    uploadSpeed = 0;
    seederCount = 0;
}

JobProgress JobProgress::fromJob(const Job &job)
{
    JobProgress result;
    result.id = job.id;
    result.status = job.status;
    result.progress = job.progress;
    result.totalSize = job.totalSize;
    result.downloaded = job.downloaded;
    result.uploaded = job.uploaded;
    result.downloadSpeed = job.downloadSpeed;
    result.uploadSpeed = job.uploadSpeed;
    result.seederCount = job.seederCount;
    result.ratio = job.ratio;
    result.files = job.files;
    return result;
}

QJsonObject SwarmQueue::serializeJob(const Job &job)
{
    QJsonArray filesArray;
    for (const JobFile &file : job.files)
    {
        filesArray.append(QJsonObject {
            {KEY_FILE_PATH, file.path.data()},
            {KEY_FILE_NAME, file.name},
            {KEY_FILE_SIZE, file.size},
            {KEY_FILE_DOWNLOADED, file.downloaded},
            {KEY_FILE_PROGRESS, file.progress},
            {KEY_FILE_SELECTED, file.selected}
        });
    }

    QJsonObject jsonObj {
        {KEY_ID, job.id.toString()},
        {KEY_OWNER_ID, job.ownerId},
        {KEY_NAME, job.name},
        {KEY_STATUS, toString(job.status)},
        {KEY_INFO_HASH, job.infoHash},
        {KEY_ROOT_FOLDER, job.rootFolder},
        {KEY_TOTAL_SIZE, job.totalSize},
        {KEY_DOWNLOADED, job.downloaded},
        {KEY_UPLOADED, job.uploaded},
        {KEY_DOWNLOAD_SPEED, job.downloadSpeed},
        {KEY_UPLOAD_SPEED, job.uploadSpeed},
        {KEY_SEEDERS, job.seederCount},
        {KEY_RATIO, job.ratio},
        {KEY_PROGRESS, job.progress},
        {KEY_FILES, filesArray},
        {KEY_DOWNLOAD_PATH, job.downloadPath.data()},
        {KEY_ADDED_AT, toJsonTime(job.addedAt)},
        {KEY_STARTED_AT, toJsonTime(job.startedAt)},
        {KEY_COMPLETED_AT, toJsonTime(job.completedAt)}
    };

    if (!job.source.magnetUri.isEmpty())
        jsonObj[KEY_MAGNET_URI] = job.source.magnetUri;
    if (!job.source.descriptorPath.isEmpty())
        jsonObj[KEY_DESCRIPTOR_PATH] = job.source.descriptorPath.data();
    if (!job.error.isEmpty())
        jsonObj[KEY_ERROR] = job.error;

    if (job.selectedIndices)
    {
        QJsonArray indicesArray;
        for (const int index : asConst(*job.selectedIndices))
            indicesArray.append(index);
        jsonObj[KEY_SELECTED_INDICES] = indicesArray;
    }

    return jsonObj;
}

std::optional<Job> SwarmQueue::deserializeJob(const QJsonObject &jsonObj)
{
    Job job;
    job.id = JobID::fromString(jsonObj.value(KEY_ID).toString());
    if (!job.id.isValid())
        return std::nullopt;

    const std::optional<JobStatus> status = jobStatusFromString(jsonObj.value(KEY_STATUS).toString());
    if (!status)
        return std::nullopt;
    job.status = *status;

    job.source.magnetUri = jsonObj.value(KEY_MAGNET_URI).toString();
    job.source.descriptorPath = Path(jsonObj.value(KEY_DESCRIPTOR_PATH).toString());
    if (job.source.isEmpty())
        return std::nullopt;

    job.ownerId = jsonObj.value(KEY_OWNER_ID).toString();
    job.name = jsonObj.value(KEY_NAME).toString();
    job.infoHash = jsonObj.value(KEY_INFO_HASH).toString();
    job.rootFolder = jsonObj.value(KEY_ROOT_FOLDER).toString();
    job.totalSize = jsonObj.value(KEY_TOTAL_SIZE).toInteger();
    job.downloaded = jsonObj.value(KEY_DOWNLOADED).toInteger();
    job.uploaded = jsonObj.value(KEY_UPLOADED).toInteger();
    job.downloadSpeed = jsonObj.value(KEY_DOWNLOAD_SPEED).toInteger();
    job.uploadSpeed = jsonObj.value(KEY_UPLOAD_SPEED).toInteger();
    job.seederCount = jsonObj.value(KEY_SEEDERS).toInt();
    job.ratio = jsonObj.value(KEY_RATIO).toDouble();
    job.progress = jsonObj.value(KEY_PROGRESS).toInt();
    job.downloadPath = Path(jsonObj.value(KEY_DOWNLOAD_PATH).toString());
    job.error = jsonObj.value(KEY_ERROR).toString();
    job.addedAt = fromJsonTime(jsonObj.value(KEY_ADDED_AT));
    job.startedAt = fromJsonTime(jsonObj.value(KEY_STARTED_AT));
    job.completedAt = fromJsonTime(jsonObj.value(KEY_COMPLETED_AT));

    const QJsonArray filesArray = jsonObj.value(KEY_FILES).toArray();
    job.files.reserve(filesArray.size());
    for (const QJsonValue &fileValue : filesArray)
    {
        const QJsonObject fileObj = fileValue.toObject();
        JobFile file;
        file.path = Path(fileObj.value(KEY_FILE_PATH).toString());
        file.name = fileObj.value(KEY_FILE_NAME).toString();
        file.size = fileObj.value(KEY_FILE_SIZE).toInteger();
        file.downloaded = fileObj.value(KEY_FILE_DOWNLOADED).toInteger();
        file.progress = fileObj.value(KEY_FILE_PROGRESS).toInt();
        file.selected = fileObj.value(KEY_FILE_SELECTED).toBool(true);
        job.files.append(file);
    }

    if (const QJsonValue indicesValue = jsonObj.value(KEY_SELECTED_INDICES); indicesValue.isArray())
    {
        QList<int> indices;
        for (const QJsonValue &indexValue : asConst(indicesValue.toArray()))
            indices.append(indexValue.toInt());
        job.selectedIndices = indices;
        job.syncFileSelection();
    }

    return job;
}
