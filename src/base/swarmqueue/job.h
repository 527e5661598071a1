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

#pragma once

#include <optional>

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

#include "base/path.h"
#include "jobid.h"
#include "jobsource.h"

class QJsonObject;

namespace SwarmQueue
{
    enum class JobStatus
    {
        Queued,
        Downloading,
        AwaitingSelection,
        Paused,
        Seeding,
        Completed,
        Error
    };

    QString toString(JobStatus status);
    std::optional<JobStatus> jobStatusFromString(const QString &str);

    // Jobs in these states hold one concurrency slot
    bool occupiesSlot(JobStatus status);
    // `completed` and `error` leave the source free for resubmission
    bool isTerminal(JobStatus status);

    struct JobFile
    {
        Path path;  // relative to the job download path
        QString name;
        qint64 size = 0;
        qint64 downloaded = 0;
        int progress = 0;
        bool selected = true;

        friend bool operator==(const JobFile &left, const JobFile &right) = default;
    };

    struct Job
    {
        JobID id;
        JobSource source;
        QString ownerId;
        QString name;
        JobStatus status = JobStatus::Queued;
        QString infoHash;
        QString rootFolder;

        qint64 totalSize = 0;
        qint64 downloaded = 0;
        qint64 uploaded = 0;
        qint64 downloadSpeed = 0;
        qint64 uploadSpeed = 0;
        int seederCount = 0;
        qreal ratio = 0;
        int progress = 0;

        QList<JobFile> files;
        std::optional<QList<int>> selectedIndices;

        Path downloadPath;
        QString error;

        QDateTime addedAt;
        QDateTime startedAt;
        QDateTime completedAt;

        bool isFileSelected(int index) const;
        // a selection is active and leaves at least one file out
        bool hasNarrowSelection() const;

        // brings `files[i].selected` in line with `selectedIndices`
        void syncFileSelection();
        void resetTransferStats();
    };

    // Live numbers pushed with each progress tick
    struct JobProgress
    {
        JobID id;
        JobStatus status = JobStatus::Queued;
        int progress = 0;
        qint64 totalSize = 0;
        qint64 downloaded = 0;
        qint64 uploaded = 0;
        qint64 downloadSpeed = 0;
        qint64 uploadSpeed = 0;
        int seederCount = 0;
        qreal ratio = 0;
        QList<JobFile> files;

        static JobProgress fromJob(const Job &job);
    };

    QJsonObject serializeJob(const Job &job);
    std::optional<Job> deserializeJob(const QJsonObject &jsonObj);
}

Q_DECLARE_METATYPE(SwarmQueue::Job)
Q_DECLARE_METATYPE(SwarmQueue::JobProgress)
