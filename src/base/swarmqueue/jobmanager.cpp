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

#include "jobmanager.h"

#include <algorithm>

#include "base/global.h"
#include "base/logger.h"
#include "base/settingsstorage.h"
#include "fileselection.h"
#include "jobsnapshotstorage.h"
#include "payloadcleaner.h"
#include "progressbroadcaster.h"
#include "transferengine.h"
#include "transferhandle.h"

#define SETTINGS_KEY(name) (u"Queue/" name)

const QString OWNER_DOWNLOAD_PATHS_GROUP = u"OwnerDownloadPaths/"_s;

using namespace SwarmQueue;

namespace
{
    template <typename T>
    auto clampValue(const T lower, const T upper)
    {
        return [lower, upper](const T value) -> T
        {
            return std::clamp(value, lower, upper);
        };
    }

    template <typename T>
    auto lowerLimited(const T limit)
    {
        return [limit](const T value) -> T
        {
            return std::max(value, limit);
        };
    }

    QList<int> normalizeIndices(const QList<int> &indices)
    {
        QList<int> result;
        result.reserve(indices.size());
        for (const int index : indices)
        {
            if ((index >= 0) && !result.contains(index))
                result.append(index);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    void updateSelectionTotals(Job &job)
    {
        qint64 totalSize = 0;
        qint64 downloaded = 0;
        for (const JobFile &file : asConst(job.files))
        {
            if (!file.selected)
                continue;

            totalSize += file.size;
            downloaded += file.downloaded;
        }

        job.totalSize = totalSize;
        job.downloaded = downloaded;
        job.progress = (totalSize > 0) ? static_cast<int>(((downloaded * 100) + (totalSize / 2)) / totalSize) : 0;
    }
}

JobManager::JobManager(TransferEngine *engine, SettingsStorage *settings, JobSnapshotStorage *snapshotStorage, QObject *parent)
    : QObject(parent)
    , m_engine {engine}
    , m_settingsStorage {settings}
    , m_snapshotStorage {snapshotStorage}
    , m_progressBroadcaster {new ProgressBroadcaster(this)}
    , m_maxConcurrentDownloads(settings, SETTINGS_KEY(u"MaxConcurrentDownloads"_s), DEFAULT_CONCURRENT_DOWNLOADS
        , clampValue(MIN_CONCURRENT_DOWNLOADS, MAX_CONCURRENT_DOWNLOADS))
    , m_seedAfterDownload(settings, SETTINGS_KEY(u"SeedAfterDownload"_s), false)
    , m_maxUploadSpeed(settings, SETTINGS_KEY(u"MaxUploadSpeed"_s), 0, lowerLimited(0))
    , m_maxDownloadSpeed(settings, SETTINGS_KEY(u"MaxDownloadSpeed"_s), 0, lowerLimited(0))
{
    Q_ASSERT(m_engine);
    Q_ASSERT(m_settingsStorage);
    Q_ASSERT(m_snapshotStorage);

    connect(m_progressBroadcaster, &ProgressBroadcaster::tick, this, &JobManager::handleProgressTick);

    applyEngineLimits();
}

JobManager::~JobManager()
{
    m_progressBroadcaster->stop();

    const QList<JobID> ids = m_handles.keys();
    for (const JobID &id : ids)
        releaseHandle(id);
}

nonstd::expected<void, QueueError> JobManager::restoreJobs()
{
    const nonstd::expected<QList<Job>, QString> loadResult = m_snapshotStorage->load();
    if (!loadResult)
    {
        LogMsg(tr("Failed to restore jobs. %1").arg(loadResult.error()), Log::CRITICAL);
        return nonstd::make_unexpected(QueueError {QueueError::Persistence, loadResult.error()});
    }

    for (const Job &job : loadResult.value())
    {
        if (m_jobs.contains(job.id))
            continue;

        m_jobs.insert(job.id, job);
        if (job.addedAt.isValid() && (!m_lastAddedAt.isValid() || (job.addedAt > m_lastAddedAt)))
            m_lastAddedAt = job.addedAt;
    }

    if (!m_jobs.isEmpty())
        storeJobs();

    LogMsg(tr("Restored %1 job(s) from \"%2\"").arg(QString::number(m_jobs.size()), m_snapshotStorage->filePath().toString()), Log::INFO);
    return {};
}

void JobManager::resumePersistedJobs()
{
    const qsizetype queuedCount = std::count_if(m_jobs.cbegin(), m_jobs.cend(), [](const Job &job)
    {
        return job.status == JobStatus::Queued;
    });
    if (queuedCount == 0)
        return;

    LogMsg(tr("Resuming queued jobs. Count: %1").arg(queuedCount));
    processQueue();
}

nonstd::expected<Job, QueueError> JobManager::submit(const AddJobParams &params)
{
    if (params.ownerId.isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("Owner ID is required")));
    if (params.name.isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("Job name is required")));
    if (params.downloadPath.isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("Download path is required")));
    if (params.source.isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("Either a magnet link or a torrent file is required")));

    if (hasDuplicate(params.source))
        return nonstd::make_unexpected(rejectDuplicate(params.source));

    Job job;
    job.id = JobID::generate();
    job.source = params.source;
    job.ownerId = params.ownerId;
    job.name = params.name;
    job.downloadPath = params.downloadPath;
    job.addedAt = nextAddedAt();
    if (params.selectedIndices)
    {
        if (const QList<int> indices = normalizeIndices(*params.selectedIndices); !indices.isEmpty())
            job.selectedIndices = indices;
    }

    const JobID id = job.id;
    m_jobs.insert(id, job);
    LogMsg(tr("Added job to queue. Job: \"%1\". Source: \"%2\". Destination: \"%3\"")
        .arg(job.name, job.source.toString(), job.downloadPath.toString()));

    storeJobs();
    emit jobAdded(job);

    processQueue();

    return m_jobs.value(id);
}

nonstd::expected<void, QueueError> JobManager::pause(const JobID &id)
{
    const auto jobIt = m_jobs.find(id);
    if (jobIt == m_jobs.end())
        return nonstd::make_unexpected(QueueError::notFound(id));

    Job &job = jobIt.value();
    if (!occupiesSlot(job.status))
    {
        return nonstd::make_unexpected(QueueError::invalidState(tr("Only downloading or seeding jobs can be paused. Job: \"%1\". Status: %2")
            .arg(job.name, toString(job.status))));
    }

    releaseHandle(id);
    job.status = JobStatus::Paused;
    job.resetTransferStats();
    LogMsg(tr("Paused job. Job: \"%1\"").arg(job.name));

    storeJobs();
    notifyStatusChanged(job);
    processQueue();
    return {};
}

nonstd::expected<void, QueueError> JobManager::resume(const JobID &id)
{
    const auto jobIt = m_jobs.find(id);
    if (jobIt == m_jobs.end())
        return nonstd::make_unexpected(QueueError::notFound(id));

    Job &job = jobIt.value();
    if ((job.status != JobStatus::Paused) && (job.status != JobStatus::Error))
    {
        return nonstd::make_unexpected(QueueError::invalidState(tr("Only paused or failed jobs can be resumed. Job: \"%1\". Status: %2")
            .arg(job.name, toString(job.status))));
    }

    // the same content may have been submitted again after this job failed
    if (isTerminal(job.status) && hasDuplicate(job.source, id))
        return nonstd::make_unexpected(rejectDuplicate(job.source));

    job.status = JobStatus::Queued;
    job.error.clear();
    job.resetTransferStats();
    LogMsg(tr("Resumed job. Job: \"%1\"").arg(job.name));

    storeJobs();
    notifyStatusChanged(job);
    processQueue();
    return {};
}

nonstd::expected<void, QueueError> JobManager::remove(const JobID &id, const bool deletePayload)
{
    if (!m_jobs.contains(id))
        return nonstd::make_unexpected(QueueError::notFound(id));

    releaseHandle(id);
    const Job job = m_jobs.take(id);

    if (deletePayload)
    {
        if (PayloadCleaner::deletePayload(job))
            LogMsg(tr("Removed job and its files. Job: \"%1\"").arg(job.name));
        else
            LogMsg(tr("Removed job, but some of its files could not be deleted. Job: \"%1\"").arg(job.name), Log::WARNING);
    }
    else
    {
        LogMsg(tr("Removed job. Job: \"%1\"").arg(job.name));
    }

    storeJobs();
    emit jobRemoved(id);
    processQueue();
    return {};
}

nonstd::expected<void, QueueError> JobManager::selectFiles(const JobID &id, const QList<int> &indices)
{
    const auto jobIt = m_jobs.find(id);
    if (jobIt == m_jobs.end())
        return nonstd::make_unexpected(QueueError::notFound(id));

    Job &job = jobIt.value();
    TransferHandle *handle = m_handles.value(id);
    if ((job.status != JobStatus::AwaitingSelection) || !handle)
    {
        return nonstd::make_unexpected(QueueError::invalidState(tr("Job is not waiting for file selection. Job: \"%1\". Status: %2")
            .arg(job.name, toString(job.status))));
    }

    if (indices.isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("No files were selected")));

    if (activeJobsCount() < m_maxConcurrentDownloads)
        return applySelection(job, handle, indices);

    // the slot was handed to another job while this one waited for the selection
    const FileSelection::Plan plan = FileSelection::plan(*handle, job.downloadPath, indices);
    if (plan.selected.isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("None of the selected file indices is valid. Job: \"%1\"").arg(job.name)));

    releaseHandle(id);
    job.selectedIndices = plan.selected;
    job.syncFileSelection();
    job.status = JobStatus::Queued;
    job.resetTransferStats();
    LogMsg(tr("No free slot for job, queued it with the selected files. Job: \"%1\"").arg(job.name));

    storeJobs();
    notifyStatusChanged(job);
    processQueue();
    return {};
}

nonstd::expected<void, QueueError> JobManager::addMoreFiles(const JobID &id, const QList<int> &indices)
{
    const auto jobIt = m_jobs.find(id);
    if (jobIt == m_jobs.end())
        return nonstd::make_unexpected(QueueError::notFound(id));

    Job &job = jobIt.value();
    if (indices.isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("No files were selected")));

    // nothing is selected yet, so these files become the first selection
    if (job.status == JobStatus::AwaitingSelection)
        return selectFiles(id, indices);

    if (!job.selectedIndices)
    {
        LogMsg(tr("Job already includes all files. Job: \"%1\"").arg(job.name));
        return {};
    }

    QList<int> merged = job.selectedIndices.value_or(QList<int>());
    QList<int> added;
    for (const int index : normalizeIndices(indices))
    {
        if (!job.files.isEmpty() && (index >= job.files.size()))
        {
            LogMsg(tr("Ignoring invalid file index. Job: \"%1\". Index: %2").arg(job.name, QString::number(index)), Log::WARNING);
            continue;
        }

        if (!merged.contains(index))
        {
            merged.append(index);
            added.append(index);
        }
    }
    std::sort(merged.begin(), merged.end());

    if (added.isEmpty())
        return {};

    TransferHandle *handle = m_handles.value(id);
    if (!handle && isTerminal(job.status) && hasDuplicate(job.source, id))
        return nonstd::make_unexpected(rejectDuplicate(job.source));

    job.selectedIndices = merged;

    if (handle)
    {
        if (handle->hasMetadata())
        {
            for (const int index : asConst(added))
                handle->selectFile(index);
            job.files = FileSelection::mapFiles(*handle, job.selectedIndices);
            updateSelectionTotals(job);
        }
        else
        {
            job.syncFileSelection();
        }

        if (job.status == JobStatus::Seeding)
        {
            job.status = JobStatus::Downloading;
            job.completedAt = {};
        }
    }
    else if ((job.status == JobStatus::Completed) || (job.status == JobStatus::Error) || (job.status == JobStatus::Paused))
    {
        job.status = JobStatus::Queued;
        job.error.clear();
        job.completedAt = {};
        job.progress = 0;
        job.downloaded = 0;
        job.resetTransferStats();
        job.syncFileSelection();
    }
    else
    {
        job.syncFileSelection();
    }

    LogMsg(tr("Added files to job. Job: \"%1\". Files added: %2. Files selected: %3")
        .arg(job.name, QString::number(added.size()), QString::number(merged.size())));

    storeJobs();
    notifyStatusChanged(job);
    processQueue();
    return {};
}

QList<Job> JobManager::jobs() const
{
    QList<Job> result = m_jobs.values();
    std::sort(result.begin(), result.end(), [](const Job &left, const Job &right)
    {
        return left.addedAt < right.addedAt;
    });
    return result;
}

nonstd::expected<Job, QueueError> JobManager::job(const JobID &id) const
{
    const auto jobIt = m_jobs.constFind(id);
    if (jobIt == m_jobs.cend())
        return nonstd::make_unexpected(QueueError::notFound(id));
    return jobIt.value();
}

int JobManager::activeJobsCount() const
{
    return static_cast<int>(std::count_if(m_jobs.cbegin(), m_jobs.cend(), [](const Job &job)
    {
        return occupiesSlot(job.status);
    }));
}

QueueSettings JobManager::settings() const
{
    return {
        .maxConcurrentDownloads = m_maxConcurrentDownloads,
        .seedAfterDownload = m_seedAfterDownload,
        .maxUploadSpeed = m_maxUploadSpeed,
        .maxDownloadSpeed = m_maxDownloadSpeed
    };
}

QueueSettings JobManager::updateSettings(const QueueSettingsPatch &patch)
{
    if (patch.maxConcurrentDownloads)
        m_maxConcurrentDownloads = std::clamp(*patch.maxConcurrentDownloads, MIN_CONCURRENT_DOWNLOADS, MAX_CONCURRENT_DOWNLOADS);
    if (patch.seedAfterDownload)
        m_seedAfterDownload = *patch.seedAfterDownload;
    if (patch.maxUploadSpeed)
        m_maxUploadSpeed = std::max(*patch.maxUploadSpeed, 0);
    if (patch.maxDownloadSpeed)
        m_maxDownloadSpeed = std::max(*patch.maxDownloadSpeed, 0);

    applyEngineLimits();

    const QueueSettings current = settings();
    LogMsg(tr("Queue settings changed. Concurrent downloads: %1. Seed after download: %2. Upload limit: %3 B/s. Download limit: %4 B/s")
        .arg(QString::number(current.maxConcurrentDownloads), (current.seedAfterDownload ? u"yes"_s : u"no"_s)
            , QString::number(current.maxUploadSpeed), QString::number(current.maxDownloadSpeed)));

    processQueue();
    return current;
}

Path JobManager::ownerDownloadPath(const QString &ownerId) const
{
    return m_settingsStorage->loadValue<Path>(OWNER_DOWNLOAD_PATHS_GROUP + ownerId);
}

void JobManager::setOwnerDownloadPath(const QString &ownerId, const Path &path)
{
    if (path.isEmpty())
        m_settingsStorage->removeValue(OWNER_DOWNLOAD_PATHS_GROUP + ownerId);
    else
        m_settingsStorage->storeValue(OWNER_DOWNLOAD_PATHS_GROUP + ownerId, path);
}

nonstd::expected<QList<JobFile>, QueueError> JobManager::previewDescriptorFiles(const Path &path) const
{
    if (!path.exists())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("Torrent file doesn't exist. File: \"%1\"").arg(path.toString())));

    const nonstd::expected<QList<JobFile>, QString> result = m_engine->readDescriptorFiles(path);
    if (!result)
        return nonstd::make_unexpected(QueueError::invalidArgument(result.error()));
    if (result.value().isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("Torrent file contains no files. File: \"%1\"").arg(path.toString())));

    return result.value();
}

ProgressBroadcaster *JobManager::progressBroadcaster() const
{
    return m_progressBroadcaster;
}

void JobManager::processQueue()
{
    // jobs started from here may notify listeners that call back into us
    if (m_isProcessingQueue)
        return;

    m_isProcessingQueue = true;

    while (activeJobsCount() < m_maxConcurrentDownloads)
    {
        Job *nextJob = nullptr;
        for (Job &job : m_jobs)
        {
            if (job.status != JobStatus::Queued)
                continue;

            if (!nextJob || (job.addedAt < nextJob->addedAt))
                nextJob = &job;
        }

        if (!nextJob)
            break;

        startJob(*nextJob);
    }

    m_isProcessingQueue = false;

    updateBroadcasterState();
}

void JobManager::startJob(Job &job)
{
    if ((job.status != JobStatus::Queued) || m_handles.contains(job.id))
        return;

    const nonstd::expected<TransferHandle *, QString> startResult = m_engine->start(job.source, job.downloadPath);
    if (!startResult)
    {
        job.status = JobStatus::Error;
        job.error = startResult.error();
        job.resetTransferStats();
        LogMsg(tr("Failed to start job. Job: \"%1\". Reason: \"%2\"").arg(job.name, job.error), Log::WARNING);

        storeJobs();
        notifyStatusChanged(job);
        return;
    }

    TransferHandle *handle = startResult.value();
    const JobID id = job.id;
    m_handles.insert(id, handle);
    connect(handle, &TransferHandle::metadataReceived, this, [this, id] { handleMetadataReceived(id); });
    connect(handle, &TransferHandle::finished, this, [this, id] { handleTransferFinished(id); });
    connect(handle, &TransferHandle::errorOccurred, this, [this, id](const QString &message) { handleTransferError(id, message); });

    job.status = JobStatus::Downloading;
    job.error.clear();
    job.startedAt = QDateTime::currentDateTimeUtc();
    job.completedAt = {};
    job.resetTransferStats();
    if (const QString infoHash = handle->infoHash(); !infoHash.isEmpty())
        job.infoHash = infoHash;

    LogMsg(tr("Started job. Job: \"%1\". Source: \"%2\"").arg(job.name, job.source.toString()));

    storeJobs();
    notifyStatusChanged(job);

    m_progressBroadcaster->start();
}

void JobManager::releaseHandle(const JobID &id)
{
    TransferHandle *handle = m_handles.take(id);
    if (!handle)
        return;

    handle->disconnect(this);
    handle->destroy();
}

void JobManager::applyEngineLimits()
{
    m_engine->setDownloadSpeedLimit(m_maxDownloadSpeed);
    m_engine->setUploadSpeedLimit(m_maxUploadSpeed);
}

void JobManager::handleMetadataReceived(const JobID &id)
{
    const auto jobIt = m_jobs.find(id);
    TransferHandle *handle = m_handles.value(id);
    if ((jobIt == m_jobs.end()) || !handle)
        return;

    Job &job = jobIt.value();
    if (job.status != JobStatus::Downloading)
        return;

    if (const QString name = handle->name(); !name.isEmpty())
        job.name = name;
    if (const QString infoHash = handle->infoHash(); !infoHash.isEmpty())
        job.infoHash = infoHash;

    PathList filePaths;
    for (int i = 0; i < handle->filesCount(); ++i)
        filePaths.append(handle->filePath(i));
    job.rootFolder = Path::findRootFolder(filePaths).data();

    LogMsg(tr("Metadata received. Job: \"%1\". Files: %2").arg(job.name, QString::number(filePaths.size())));

    if (job.selectedIndices)
    {
        if (applySelection(job, handle, *job.selectedIndices))
            return;

        LogMsg(tr("Stored file selection doesn't match the content, asking again. Job: \"%1\"").arg(job.name), Log::WARNING);
        job.selectedIndices.reset();
    }

    handle->deselectAllFiles();
    job.files = FileSelection::mapFiles(*handle, QList<int>());
    job.totalSize = 0;
    for (const JobFile &file : asConst(job.files))
        job.totalSize += file.size;
    job.status = JobStatus::AwaitingSelection;
    job.resetTransferStats();

    LogMsg(tr("Waiting for file selection. Job: \"%1\"").arg(job.name));

    // listeners may remove the job, so nothing is read from it after the notification
    const QString name = job.name;
    const QList<JobFile> files = job.files;

    storeJobs();
    notifyStatusChanged(job);
    emit fileSelectionNeeded(id, name, files);

    processQueue();
}

void JobManager::handleTransferFinished(const JobID &id)
{
    const auto jobIt = m_jobs.find(id);
    if ((jobIt == m_jobs.end()) || (jobIt->status != JobStatus::Downloading))
        return;

    completeJob(jobIt.value(), false);
}

void JobManager::handleTransferError(const JobID &id, const QString &message)
{
    const auto jobIt = m_jobs.find(id);
    if ((jobIt == m_jobs.end()) || !m_handles.contains(id))
        return;

    Job &job = jobIt.value();
    releaseHandle(id);
    job.status = JobStatus::Error;
    job.error = message;
    job.resetTransferStats();
    LogMsg(tr("Job failed. Job: \"%1\". Reason: \"%2\"").arg(job.name, message), Log::WARNING);

    storeJobs();
    notifyStatusChanged(job);
    processQueue();
}

void JobManager::handleProgressTick()
{
    if (m_isRefreshing)
        return;

    m_isRefreshing = true;

    QList<JobProgress> updates;
    QList<JobID> completedIds;
    for (auto it = m_handles.cbegin(); it != m_handles.cend(); ++it)
    {
        const auto jobIt = m_jobs.find(it.key());
        if ((jobIt == m_jobs.end()) || !occupiesSlot(jobIt->status))
            continue;

        Job &job = jobIt.value();
        if (ProgressBroadcaster::refreshJob(job, *it.value()) == ProgressBroadcaster::RefreshResult::SelectionCompleted)
            completedIds.append(job.id);
        else
            updates.append(JobProgress::fromJob(job));
    }

    for (const JobID &id : asConst(completedIds))
    {
        if (const auto jobIt = m_jobs.find(id); jobIt != m_jobs.end())
            completeJob(jobIt.value(), true);
    }

    if (!updates.isEmpty())
        emit jobsProgressUpdated(updates);

    m_isRefreshing = false;

    updateBroadcasterState();
}

void JobManager::completeJob(Job &job, const bool partial)
{
    TransferHandle *handle = m_handles.value(job.id);
    if (handle && handle->hasMetadata())
        job.files = FileSelection::mapCompletedFiles(*handle, job.selectedIndices);
    else
        FileSelection::markCompleted(job.files);

    if (!job.files.isEmpty())
        updateSelectionTotals(job);
    job.downloaded = job.totalSize;
    job.progress = 100;
    job.completedAt = QDateTime::currentDateTimeUtc();
    job.resetTransferStats();
    if (handle)
        job.uploaded = std::max(job.uploaded, handle->stats().uploaded);
    job.ratio = (job.downloaded > 0) ? (static_cast<qreal>(job.uploaded) / job.downloaded) : 0;

    // a partial selection is never seeded
    if (!partial && m_seedAfterDownload)
    {
        job.status = JobStatus::Seeding;
        LogMsg(tr("Download finished, seeding. Job: \"%1\"").arg(job.name));
    }
    else
    {
        releaseHandle(job.id);
        job.status = JobStatus::Completed;
        if (job.hasNarrowSelection())
        {
            // the engine keeps writing pieces into deselected files until the transfer is gone
            if (handle)
                connect(handle, &QObject::destroyed, this, [completedJob = job] { PayloadCleaner::cleanupDeselectedFiles(completedJob); });
            else
                PayloadCleaner::cleanupDeselectedFiles(job);
        }
        LogMsg(tr("Download finished. Job: \"%1\"").arg(job.name));
    }

    storeJobs();
    notifyStatusChanged(job);
    processQueue();
}

nonstd::expected<void, QueueError> JobManager::applySelection(Job &job, TransferHandle *handle, const QList<int> &indices)
{
    const FileSelection::Plan plan = FileSelection::plan(*handle, job.downloadPath, indices);
    if (plan.selected.isEmpty())
        return nonstd::make_unexpected(QueueError::invalidArgument(tr("None of the selected file indices is valid. Job: \"%1\"").arg(job.name)));

    job.selectedIndices = plan.selected;

    if (plan.isAlreadyComplete())
    {
        LogMsg(tr("All selected files are already downloaded. Job: \"%1\"").arg(job.name));
        completeJob(job, true);
        return {};
    }

    FileSelection::apply(*handle, plan);
    job.files = FileSelection::mapFiles(*handle, job.selectedIndices);
    updateSelectionTotals(job);
    job.status = JobStatus::Downloading;

    LogMsg(tr("Applied file selection. Job: \"%1\". Selected: %2. To download: %3")
        .arg(job.name, QString::number(plan.selected.size()), QString::number(plan.toTransfer.size())));

    storeJobs();
    notifyStatusChanged(job);
    return {};
}

bool JobManager::hasDuplicate(const JobSource &source, const JobID &ignoredId) const
{
    return std::any_of(m_jobs.cbegin(), m_jobs.cend(), [&source, &ignoredId](const Job &job)
    {
        return (job.id != ignoredId) && !isTerminal(job.status) && job.source.overlaps(source);
    });
}

QueueError JobManager::rejectDuplicate(const JobSource &source) const
{
    const QString message = tr("This content is already queued or downloading. Source: \"%1\"").arg(source.toString());
    LogMsg(tr("Rejected duplicate job. %1").arg(message), Log::WARNING);
    return {QueueError::Duplicate, message};
}

QDateTime JobManager::nextAddedAt()
{
    QDateTime addedAt = QDateTime::currentDateTimeUtc();
    if (m_lastAddedAt.isValid() && (addedAt <= m_lastAddedAt))
        addedAt = m_lastAddedAt.addMSecs(1);

    m_lastAddedAt = addedAt;
    return addedAt;
}

void JobManager::storeJobs()
{
    const nonstd::expected<void, QString> result = m_snapshotStorage->store(jobs());
    if (!result)
    {
        LogMsg(tr("Job table could not be saved, changes will be lost on restart. %1").arg(result.error()), Log::CRITICAL);
        emit persistenceFailed(result.error());
    }
}

void JobManager::notifyStatusChanged(const Job &job)
{
    const Job jobCopy = job;
    emit jobStatusChanged(jobCopy);
}

void JobManager::updateBroadcasterState()
{
    if (activeJobsCount() > 0)
        m_progressBroadcaster->start();
    else
        m_progressBroadcaster->stop();
}
