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

#include "application.h"

#include <algorithm>
#include <cstdio>

#include <QList>
#include <QStringList>
#include <QUrl>
#include <QUrlQuery>

#include "base/exceptions.h"
#include "base/global.h"
#include "base/logger.h"
#include "base/profile.h"
#include "base/settingsstorage.h"
#include "base/swarmqueue/addjobparams.h"
#include "base/swarmqueue/job.h"
#include "base/swarmqueue/jobmanager.h"
#include "base/swarmqueue/queueerror.h"
#include "base/swarmqueue/transferengineimpl.h"
#include "base/utils/fs.h"
#include "base/utils/string.h"
#include "base/version.h"
#include "filelogger.h"

#define SETTINGS_KEY(name) u"Application/" name
#define FILELOGGER_SETTINGS_KEY(name) (SETTINGS_KEY(u"FileLogger/") name)

namespace
{
    const QString DEFAULT_OWNER_ID = u"cli"_s;
    const QString SNAPSHOT_FILE_NAME = u"jobs.json"_s;

    const int MIN_FILELOG_SIZE = 1024; // 1KiB
    const int MAX_FILELOG_SIZE = 1000 * 1024 * 1024; // 1000MiB
    const int DEFAULT_FILELOG_SIZE = 65 * 1024; // 65KiB

    QString displayNameOf(const QString &source)
    {
        if (source.startsWith(MAGNET_URI_PREFIX))
        {
            const QUrlQuery query {QUrl(source).query(QUrl::FullyEncoded)};
            const QString name = query.queryItemValue(u"dn"_s, QUrl::FullyDecoded);
            return name.isEmpty() ? source : name;
        }

        const QString fileName = Path(source).filename();
        return fileName.endsWith(TORRENT_FILE_EXTENSION, Qt::CaseInsensitive)
            ? fileName.chopped(TORRENT_FILE_EXTENSION.size()) : fileName;
    }
}

Application::Application(int &argc, char **argv)
    : QCoreApplication(argc, argv)
    , m_commandLineArgs(parseCommandLine(Application::arguments()))
{
    qRegisterMetaType<Log::Msg>("Log::Msg");
    qRegisterMetaType<SwarmQueue::Job>();
    qRegisterMetaType<SwarmQueue::JobID>();
    qRegisterMetaType<QList<SwarmQueue::JobProgress>>();

    setApplicationName(u"SwarmQueue"_s);
    setApplicationVersion(QStringLiteral(SWQ_VERSION_2));

    Logger::initInstance();

    m_profile = std::make_unique<Profile>(m_commandLineArgs.profileDir, m_commandLineArgs.configurationName);
    m_settings = new SettingsStorage(*m_profile, u"swarmqueue"_s, this);
    m_snapshotStorage = std::make_unique<SwarmQueue::JobSnapshotStorage>(m_profile->location(SpecialFolder::Data) / Path(SNAPSHOT_FILE_NAME));

    connect(this, &QCoreApplication::aboutToQuit, this, &Application::cleanup);

    LogMsg(tr("SwarmQueue %1 started. Process ID: %2", "SwarmQueue v1.0.0 started")
        .arg(QStringLiteral(SWQ_VERSION), QString::number(QCoreApplication::applicationPid())));
    LogMsg(tr("Using config directory: %1").arg(m_profile->location(SpecialFolder::Config).toString()));
    LogMsg(tr("Job table file: %1").arg(m_snapshotStorage->filePath().toString()));

    if (isFileLoggerEnabled())
        m_fileLogger = new FileLogger(fileLoggerPath(), isFileLoggerBackup(), fileLoggerMaxSize(), this);
}

Application::~Application()
{
    // we still need to call cleanup()
    // in case the App failed to start
    cleanup();
}

const SwqCommandLineParameters &Application::commandLineArgs() const
{
    return m_commandLineArgs;
}

bool Application::isFileLoggerEnabled() const
{
    return m_settings->loadValue(FILELOGGER_SETTINGS_KEY(u"Enabled"_s), true);
}

Path Application::fileLoggerPath() const
{
    return m_settings->loadValue(FILELOGGER_SETTINGS_KEY(u"Path"_s), m_profile->location(SpecialFolder::Logs));
}

bool Application::isFileLoggerBackup() const
{
    return m_settings->loadValue(FILELOGGER_SETTINGS_KEY(u"Backup"_s), true);
}

int Application::fileLoggerMaxSize() const
{
    const int val = m_settings->loadValue(FILELOGGER_SETTINGS_KEY(u"MaxSizeBytes"_s), DEFAULT_FILELOG_SIZE);
    return std::clamp(val, MIN_FILELOG_SIZE, MAX_FILELOG_SIZE);
}

int Application::exec()
{
    m_engine = new SwarmQueue::TransferEngineImpl(this);
    m_jobManager = new SwarmQueue::JobManager(m_engine, m_settings, m_snapshotStorage.get(), this);

    connect(m_jobManager, &SwarmQueue::JobManager::jobStatusChanged, this, &Application::handleJobStatusChanged);
    connect(m_jobManager, &SwarmQueue::JobManager::jobRemoved, this, &Application::checkExitWhenDone);
    // answered from the event loop so the manager never sees a re-entrant call
    connect(m_jobManager, &SwarmQueue::JobManager::fileSelectionNeeded, this, &Application::handleFileSelectionNeeded, Qt::QueuedConnection);

    if (m_commandLineArgs.maxActive > 0)
        m_jobManager->updateSettings({.maxConcurrentDownloads = m_commandLineArgs.maxActive});

    if (const auto restoreResult = m_jobManager->restoreJobs(); !restoreResult)
        throw RuntimeError(restoreResult.error().message);

    m_jobManager->resumePersistedJobs();
    processParams(m_commandLineArgs);

    if (m_commandLineArgs.exitWhenDone)
        QMetaObject::invokeMethod(this, &Application::checkExitWhenDone, Qt::QueuedConnection);

    return QCoreApplication::exec();
}

void Application::processParams(const SwqCommandLineParameters &params)
{
    if (params.sources.isEmpty())
        return;

    const QString ownerId = params.ownerId.isEmpty() ? DEFAULT_OWNER_ID : params.ownerId;

    Path downloadPath = params.savePath;
    if (!downloadPath.isEmpty())
    {
        downloadPath = Utils::Fs::toAbsolutePath(downloadPath);
        if (!params.ownerId.isEmpty())
            m_jobManager->setOwnerDownloadPath(ownerId, downloadPath);
    }
    else
    {
        downloadPath = m_jobManager->ownerDownloadPath(ownerId);
        if (downloadPath.isEmpty())
            downloadPath = m_profile->location(SpecialFolder::Downloads);
    }

    for (const QString &source : params.sources)
    {
        SwarmQueue::AddJobParams jobParams;
        jobParams.ownerId = ownerId;
        jobParams.downloadPath = downloadPath;
        jobParams.selectedIndices = params.selectedIndices;
        jobParams.name = ((params.sources.size() == 1) && !params.name.isEmpty()) ? params.name : displayNameOf(source);
        if (source.startsWith(MAGNET_URI_PREFIX))
            jobParams.source.magnetUri = source;
        else
            jobParams.source.descriptorPath = Path(source);

        const nonstd::expected<SwarmQueue::Job, SwarmQueue::QueueError> result = m_jobManager->submit(jobParams);
        if (!result)
        {
            const QString message = tr("Couldn't queue \"%1\". %2: %3")
                .arg(source, SwarmQueue::toString(result.error().kind), result.error().message);
            fprintf(stderr, "%s\n", qUtf8Printable(message));
            continue;
        }

        printf("%s\n", qUtf8Printable(tr("Queued \"%1\" as job %2").arg(result.value().name, result.value().id.toString())));
    }
}

void Application::handleJobStatusChanged(const SwarmQueue::Job &job)
{
    QString line = u"[%1] %2"_s.arg(SwarmQueue::toString(job.status), job.name);
    if (job.status == SwarmQueue::JobStatus::Error)
        line += u" - " + job.error;
    printf("%s\n", qUtf8Printable(line));

    checkExitWhenDone();
}

void Application::handleFileSelectionNeeded(const SwarmQueue::JobID &id, const QString &name, const QList<SwarmQueue::JobFile> &files)
{
    if (!m_commandLineArgs.autoSelect)
    {
        QStringList lines;
        lines.reserve(files.size() + 1);
        lines.append(tr("Job \"%1\" (%2) is waiting for file selection:").arg(name, id.toString()));
        for (int i = 0; i < files.size(); ++i)
            lines.append(u"  %1: %2 (%3 bytes)"_s.arg(QString::number(i), files[i].path.toString(), QString::number(files[i].size)));
        printf("%s\n", qUtf8Printable(lines.join(u'\n')));
        return;
    }

    QList<int> indices;
    indices.reserve(files.size());
    for (int i = 0; i < files.size(); ++i)
        indices.append(i);

    if (const auto result = m_jobManager->selectFiles(id, indices); !result)
    {
        LogMsg(tr("Couldn't select files automatically. Job: \"%1\". Reason: \"%2\"").arg(name, result.error().message), Log::WARNING);
        return;
    }

    LogMsg(tr("Selected all files automatically. Job: \"%1\". Files: %2").arg(name, Utils::String::joinIntList(indices)));
}

void Application::checkExitWhenDone()
{
    if (!m_commandLineArgs.exitWhenDone || !m_jobManager)
        return;

    const QList<SwarmQueue::Job> jobs = m_jobManager->jobs();
    const bool hasPendingJobs = std::any_of(jobs.cbegin(), jobs.cend(), [this](const SwarmQueue::Job &job)
    {
        switch (job.status)
        {
        case SwarmQueue::JobStatus::Queued:
        case SwarmQueue::JobStatus::Downloading:
            return true;
        case SwarmQueue::JobStatus::AwaitingSelection:
            return m_commandLineArgs.autoSelect;
        default:
            return false;
        }
    });

    if (!hasPendingJobs)
    {
        LogMsg(tr("No job is left to download. Exiting."));
        QMetaObject::invokeMethod(this, [] { QCoreApplication::exit(); }, Qt::QueuedConnection);
    }
}

void Application::cleanup()
{
    // cleanup() can be called multiple times during shutdown. We only need it once.
    if (m_isCleanupRun.exchange(true, std::memory_order_acquire))
        return;

    LogMsg(tr("SwarmQueue termination initiated"));

    delete m_jobManager;
    delete m_engine;

    // saves pending changes while the profile is still alive
    delete m_settings;
    m_settings = nullptr;

    LogMsg(tr("SwarmQueue is now ready to exit"));

    delete m_fileLogger;
    Logger::freeInstance();
}
