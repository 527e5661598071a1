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
#include <QHash>
#include <QList>
#include <QObject>
#include <QString>

#include <nonstd/expected.hpp>

#include "base/path.h"
#include "base/settingvalue.h"
#include "addjobparams.h"
#include "job.h"
#include "jobid.h"
#include "queueerror.h"
#include "queuesettings.h"

class SettingsStorage;

namespace SwarmQueue
{
    class JobSnapshotStorage;
    class ProgressBroadcaster;
    class TransferEngine;
    class TransferHandle;

    // Owns the job table and decides which jobs run. Jobs are admitted in
    // the order they were added while fewer than `maxConcurrentDownloads`
    // jobs are downloading or seeding. Every change of the table is written
    // to the snapshot storage right away.
    class JobManager final : public QObject
    {
        Q_OBJECT
        Q_DISABLE_COPY_MOVE(JobManager)

    public:
        JobManager(TransferEngine *engine, SettingsStorage *settings, JobSnapshotStorage *snapshotStorage, QObject *parent = nullptr);
        ~JobManager() override;

        // Loads the persisted job table, must be called before anything else
        nonstd::expected<void, QueueError> restoreJobs();
        void resumePersistedJobs();

        nonstd::expected<Job, QueueError> submit(const AddJobParams &params);
        nonstd::expected<void, QueueError> pause(const JobID &id);
        nonstd::expected<void, QueueError> resume(const JobID &id);
        nonstd::expected<void, QueueError> remove(const JobID &id, bool deletePayload);
        nonstd::expected<void, QueueError> selectFiles(const JobID &id, const QList<int> &indices);
        nonstd::expected<void, QueueError> addMoreFiles(const JobID &id, const QList<int> &indices);

        QList<Job> jobs() const;
        nonstd::expected<Job, QueueError> job(const JobID &id) const;
        int activeJobsCount() const;

        QueueSettings settings() const;
        QueueSettings updateSettings(const QueueSettingsPatch &patch);

        Path ownerDownloadPath(const QString &ownerId) const;
        void setOwnerDownloadPath(const QString &ownerId, const Path &path);

        nonstd::expected<QList<JobFile>, QueueError> previewDescriptorFiles(const Path &path) const;

        ProgressBroadcaster *progressBroadcaster() const;

    signals:
        void jobAdded(const SwarmQueue::Job &job);
        void jobStatusChanged(const SwarmQueue::Job &job);
        void jobRemoved(const SwarmQueue::JobID &id);
        void jobsProgressUpdated(const QList<SwarmQueue::JobProgress> &progress);
        void fileSelectionNeeded(const SwarmQueue::JobID &id, const QString &name, const QList<SwarmQueue::JobFile> &files);
        void persistenceFailed(const QString &message);

    private:
        void processQueue();
        void startJob(Job &job);
        void releaseHandle(const JobID &id);
        void applyEngineLimits();

        void handleMetadataReceived(const JobID &id);
        void handleTransferFinished(const JobID &id);
        void handleTransferError(const JobID &id, const QString &message);
        void handleProgressTick();

        // completion of the whole content (`partial == false`) or of a narrowed selection
        void completeJob(Job &job, bool partial);
        nonstd::expected<void, QueueError> applySelection(Job &job, TransferHandle *handle, const QList<int> &indices);

        // looks for another non-terminal job fetching the same content
        bool hasDuplicate(const JobSource &source, const JobID &ignoredId = {}) const;
        QueueError rejectDuplicate(const JobSource &source) const;
        QDateTime nextAddedAt();
        void storeJobs();
        void notifyStatusChanged(const Job &job);
        void updateBroadcasterState();

        TransferEngine *m_engine = nullptr;
        SettingsStorage *m_settingsStorage = nullptr;
        JobSnapshotStorage *m_snapshotStorage = nullptr;
        ProgressBroadcaster *m_progressBroadcaster = nullptr;

        CachedSettingValue<int> m_maxConcurrentDownloads;
        CachedSettingValue<bool> m_seedAfterDownload;
        CachedSettingValue<int> m_maxUploadSpeed;
        CachedSettingValue<int> m_maxDownloadSpeed;

        QHash<JobID, Job> m_jobs;
        QHash<JobID, TransferHandle *> m_handles;
        QDateTime m_lastAddedAt;

        bool m_isProcessingQueue = false;
        bool m_isRefreshing = false;
    };
}
