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

#include <memory>

#include <QObject>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include "base/global.h"
#include "base/path.h"
#include "base/profile.h"
#include "base/settingsstorage.h"
#include "base/swarmqueue/jobmanager.h"
#include "base/swarmqueue/jobsnapshotstorage.h"
#include "base/utils/fs.h"
#include "base/utils/io.h"
#include "fakeengine.h"

using namespace SwarmQueue;

namespace
{
    QString magnet(const QString &hash)
    {
        return u"magnet:?xt=urn:btih:" + hash;
    }

    const QList<FakeFile> PACK_FILES = {
        {Path(u"pack/a.bin"_s), 100},
        {Path(u"pack/b.bin"_s), 200},
        {Path(u"pack/c.bin"_s), 300}
    };
}

class TestJobManager final : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(TestJobManager)

public:
    TestJobManager() = default;

private slots:
    void init()
    {
        m_tempDir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_tempDir->isValid());

        m_rootPath = Path(m_tempDir->path());
        m_profile = std::make_unique<Profile>(m_rootPath / Path(u"profile"_s));
        m_settings = std::make_unique<SettingsStorage>(*m_profile, u"test"_s);
        m_snapshot = std::make_unique<JobSnapshotStorage>(m_rootPath / Path(u"jobs.json"_s));
        createManager();
    }

    void cleanup()
    {
        m_manager.reset();
        m_engine.reset();
        m_snapshot.reset();
        m_settings.reset();
        m_profile.reset();
        m_tempDir.reset();
    }

    void testSubmitValidation()
    {
        AddJobParams params = makeParams(magnet(u"aaaa"_s), u"a"_s);
        params.ownerId.clear();
        auto result = m_manager->submit(params);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidArgument);

        params = makeParams({}, u"a"_s);
        result = m_manager->submit(params);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidArgument);

        params = makeParams(magnet(u"aaaa"_s), u"a"_s);
        params.downloadPath = {};
        result = m_manager->submit(params);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidArgument);

        QVERIFY(m_manager->jobs().isEmpty());
        QCOMPARE(m_engine->startCount(), 0);
    }

    void testConcurrencyLimit()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 2});

        const auto first = m_manager->submit(makeParams(magnet(u"0001"_s), u"first"_s));
        const auto second = m_manager->submit(makeParams(magnet(u"0002"_s), u"second"_s));
        const auto third = m_manager->submit(makeParams(magnet(u"0003"_s), u"third"_s));
        QVERIFY(first && second && third);

        QCOMPARE(first->status, JobStatus::Downloading);
        QCOMPARE(second->status, JobStatus::Downloading);
        QCOMPARE(third->status, JobStatus::Queued);
        QCOMPARE(m_manager->activeJobsCount(), 2);
        QCOMPARE(m_engine->startCount(), 2);

        // raising the limit admits the waiting job right away
        m_manager->updateSettings({.maxConcurrentDownloads = 3});
        QCOMPARE(m_manager->job(third->id)->status, JobStatus::Downloading);
        QCOMPARE(m_manager->activeJobsCount(), 3);

        // lowering it never stops running jobs
        m_manager->updateSettings({.maxConcurrentDownloads = 1});
        QCOMPARE(m_manager->activeJobsCount(), 3);
    }

    void testFifoAdmission()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 1});

        const auto a = m_manager->submit(makeParams(magnet(u"000a"_s), u"a"_s));
        const auto b = m_manager->submit(makeParams(magnet(u"000b"_s), u"b"_s));
        const auto c = m_manager->submit(makeParams(magnet(u"000c"_s), u"c"_s));
        QVERIFY(a && b && c);
        QVERIFY(a->addedAt < b->addedAt);
        QVERIFY(b->addedAt < c->addedAt);

        const QList<Job> jobs = m_manager->jobs();
        QCOMPARE(jobs.size(), 3);
        QCOMPARE(jobs[0].id, a->id);
        QCOMPARE(jobs[1].id, b->id);
        QCOMPARE(jobs[2].id, c->id);

        QVERIFY(m_manager->pause(a->id));
        QCOMPARE(m_manager->job(a->id)->status, JobStatus::Paused);
        QCOMPARE(m_manager->job(b->id)->status, JobStatus::Downloading);
        QCOMPARE(m_manager->job(c->id)->status, JobStatus::Queued);

        // a resumed job goes back in line by its original position
        QVERIFY(m_manager->resume(a->id));
        QCOMPARE(m_manager->job(a->id)->status, JobStatus::Queued);

        QVERIFY(m_manager->remove(b->id, false));
        QCOMPARE(m_manager->job(a->id)->status, JobStatus::Downloading);
        QCOMPARE(m_manager->job(c->id)->status, JobStatus::Queued);
    }

    void testDuplicateRejected()
    {
        const auto first = m_manager->submit(makeParams(magnet(u"dddd"_s), u"first"_s));
        QVERIFY(first);

        const auto duplicate = m_manager->submit(makeParams(magnet(u"dddd"_s), u"again"_s));
        QVERIFY(!duplicate);
        QCOMPARE(duplicate.error().kind, QueueError::Duplicate);
        QCOMPARE(m_manager->jobs().size(), 1);

        // finished content may be fetched again
        m_engine->handleFor(magnet(u"dddd"_s))->finish();
        QCOMPARE(m_manager->job(first->id)->status, JobStatus::Completed);

        const auto resubmitted = m_manager->submit(makeParams(magnet(u"dddd"_s), u"again"_s));
        QVERIFY(resubmitted);
        QCOMPARE(resubmitted->status, JobStatus::Downloading);
        QCOMPARE(m_manager->jobs().size(), 2);
    }

    void testDuplicateRejectedOnReactivation()
    {
        const auto failed = m_manager->submit(makeParams(magnet(u"d101"_s), u"failed"_s));
        QVERIFY(failed);
        m_engine->handleFor(magnet(u"d101"_s))->fail(u"disk full"_s);
        QCOMPARE(m_manager->job(failed->id)->status, JobStatus::Error);

        const auto retried = m_manager->submit(makeParams(magnet(u"d101"_s), u"retried"_s));
        QVERIFY(retried);
        QCOMPARE(retried->status, JobStatus::Downloading);

        auto result = m_manager->resume(failed->id);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::Duplicate);
        QCOMPARE(m_manager->job(failed->id)->status, JobStatus::Error);
        QCOMPARE(m_manager->job(failed->id)->error, u"disk full"_s);

        AddJobParams params = makeParams(magnet(u"d102"_s), u"done"_s);
        params.selectedIndices = QList<int> {1};
        const auto done = m_manager->submit(params);
        QVERIFY(done);
        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"d102"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);
        handle->setFileDownloaded(1, 200);
        emit m_manager->progressBroadcaster()->tick();
        QCOMPARE(m_manager->job(done->id)->status, JobStatus::Completed);

        const auto again = m_manager->submit(makeParams(magnet(u"d102"_s), u"again"_s));
        QVERIFY(again);

        result = m_manager->addMoreFiles(done->id, {2});
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::Duplicate);
        QCOMPARE(m_manager->job(done->id)->status, JobStatus::Completed);
        QCOMPARE(m_manager->job(done->id)->selectedIndices, QList<int>({1}));

        // once the other job is gone the old one may run again
        QVERIFY(m_manager->remove(retried->id, false));
        QVERIFY(m_manager->resume(failed->id));
        QCOMPARE(m_manager->job(failed->id)->status, JobStatus::Downloading);
    }

    void testTransferErrorFreesSlot()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 1});

        const auto a = m_manager->submit(makeParams(magnet(u"e001"_s), u"a"_s));
        const auto b = m_manager->submit(makeParams(magnet(u"e002"_s), u"b"_s));
        QVERIFY(a && b);
        QCOMPARE(b->status, JobStatus::Queued);

        m_engine->handleFor(magnet(u"e001"_s))->fail(u"tracker unreachable"_s);

        const auto failed = m_manager->job(a->id);
        QCOMPARE(failed->status, JobStatus::Error);
        QCOMPARE(failed->error, u"tracker unreachable"_s);
        QCOMPARE(m_manager->job(b->id)->status, JobStatus::Downloading);
        QCOMPARE(m_engine->destroyedCount(), 1);

        // a failed job may be retried
        QVERIFY(m_manager->remove(b->id, false));
        QVERIFY(m_manager->resume(a->id));
        QCOMPARE(m_manager->job(a->id)->status, JobStatus::Downloading);
        QVERIFY(m_manager->job(a->id)->error.isEmpty());
    }

    void testEngineStartFailure()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 1});

        m_engine->setStartError(u"invalid magnet"_s);
        const auto broken = m_manager->submit(makeParams(magnet(u"f001"_s), u"broken"_s));
        QVERIFY(broken);
        QCOMPARE(broken->status, JobStatus::Error);
        QCOMPARE(broken->error, u"invalid magnet"_s);
        QCOMPARE(m_manager->activeJobsCount(), 0);

        m_engine->setStartError({});
        const auto next = m_manager->submit(makeParams(magnet(u"f002"_s), u"next"_s));
        QVERIFY(next);
        QCOMPARE(next->status, JobStatus::Downloading);
    }

    void testAwaitingSelection()
    {
        QSignalSpy selectionSpy(m_manager.get(), &JobManager::fileSelectionNeeded);

        const auto pack = m_manager->submit(makeParams(magnet(u"c001"_s), u"pack"_s));
        QVERIFY(pack);

        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"c001"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);

        const auto waiting = m_manager->job(pack->id);
        QCOMPARE(waiting->status, JobStatus::AwaitingSelection);
        QCOMPARE(waiting->rootFolder, u"pack"_s);
        QCOMPARE(waiting->files.size(), 3);
        QCOMPARE(waiting->totalSize, 600);
        QVERIFY(!handle->isFileSelected(0));
        QVERIFY(!handle->isFileSelected(1));
        QVERIFY(!handle->isFileSelected(2));

        QCOMPARE(selectionSpy.count(), 1);
        QCOMPARE(selectionSpy.at(0).at(0).value<JobID>(), pack->id);
        QCOMPARE(selectionSpy.at(0).at(2).value<QList<JobFile>>().size(), 3);

        QVERIFY(m_manager->selectFiles(pack->id, {1}));

        const auto selected = m_manager->job(pack->id);
        QCOMPARE(selected->status, JobStatus::Downloading);
        QCOMPARE(selected->totalSize, 200);
        QCOMPARE(selected->selectedIndices, QList<int>({1}));
        QVERIFY(!handle->isFileSelected(0));
        QVERIFY(handle->isFileSelected(1));
        QVERIFY(!handle->isFileSelected(2));
        QVERIFY(!selected->files[0].selected);
        QVERIFY(selected->files[1].selected);
    }

    void testRemovedWhileAskingForSelection()
    {
        QSignalSpy selectionSpy(m_manager.get(), &JobManager::fileSelectionNeeded);
        connect(m_manager.get(), &JobManager::jobStatusChanged, this, [this](const Job &job)
        {
            if (job.status == JobStatus::AwaitingSelection)
                QVERIFY(m_manager->remove(job.id, false));
        });

        const auto pack = m_manager->submit(makeParams(magnet(u"c201"_s), u"pack"_s));
        QVERIFY(pack);

        m_engine->handleFor(magnet(u"c201"_s))->receiveMetadata(u"pack"_s, PACK_FILES);

        QVERIFY(!m_manager->job(pack->id));
        QCOMPARE(selectionSpy.count(), 1);
        QCOMPARE(selectionSpy.at(0).at(1).toString(), u"pack"_s);
        QCOMPARE(selectionSpy.at(0).at(2).value<QList<JobFile>>().size(), 3);
    }

    void testSelectionWhileSlotsAreTaken()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 1});

        const auto pack = m_manager->submit(makeParams(magnet(u"c101"_s), u"pack"_s));
        const auto other = m_manager->submit(makeParams(magnet(u"c102"_s), u"other"_s));
        QVERIFY(pack && other);
        QCOMPARE(other->status, JobStatus::Queued);

        m_engine->handleFor(magnet(u"c101"_s))->receiveMetadata(u"pack"_s, PACK_FILES);
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::AwaitingSelection);

        // waiting for the user does not hold a slot
        QCOMPARE(m_manager->job(other->id)->status, JobStatus::Downloading);

        // no slot left: the job goes back in line with its selection
        QVERIFY(m_manager->selectFiles(pack->id, {1}));
        auto job = m_manager->job(pack->id);
        QCOMPARE(job->status, JobStatus::Queued);
        QCOMPARE(job->selectedIndices, QList<int>({1}));
        QCOMPARE(m_engine->destroyedCount(), 1);
        QCOMPARE(m_manager->activeJobsCount(), 1);

        // it runs first once the slot frees up, and the selection is applied right away
        QVERIFY(m_manager->pause(other->id));
        job = m_manager->job(pack->id);
        QCOMPARE(job->status, JobStatus::Downloading);

        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"c101"_s));
        QVERIFY(handle);
        handle->receiveMetadata(u"pack"_s, PACK_FILES);

        job = m_manager->job(pack->id);
        QCOMPARE(job->status, JobStatus::Downloading);
        QCOMPARE(job->totalSize, 200);
        QVERIFY(!handle->isFileSelected(0));
        QVERIFY(handle->isFileSelected(1));
    }

    void testSelectionGivenUpFront()
    {
        QSignalSpy selectionSpy(m_manager.get(), &JobManager::fileSelectionNeeded);

        AddJobParams params = makeParams(magnet(u"c003"_s), u"pack"_s);
        params.selectedIndices = QList<int> {2, 0, 2};
        const auto pack = m_manager->submit(params);
        QVERIFY(pack);
        QCOMPARE(pack->selectedIndices, QList<int>({0, 2}));

        m_engine->handleFor(magnet(u"c003"_s))->receiveMetadata(u"pack"_s, PACK_FILES);

        const auto job = m_manager->job(pack->id);
        QCOMPARE(job->status, JobStatus::Downloading);
        QCOMPARE(job->totalSize, 400);
        QCOMPARE(selectionSpy.count(), 0);
    }

    void testPartialCompletion()
    {
        const auto pack = m_manager->submit(makeParams(magnet(u"c004"_s), u"pack"_s));
        QVERIFY(pack);

        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"c004"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);
        QVERIFY(m_manager->selectFiles(pack->id, {1}));

        QSignalSpy progressSpy(m_manager.get(), &JobManager::jobsProgressUpdated);

        handle->setFileDownloaded(1, 50);
        emit m_manager->progressBroadcaster()->tick();
        QCOMPARE(progressSpy.count(), 1);
        QCOMPARE(m_manager->job(pack->id)->progress, 25);
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Downloading);

        handle->setFileDownloaded(1, 200);
        emit m_manager->progressBroadcaster()->tick();

        const auto done = m_manager->job(pack->id);
        QCOMPARE(done->status, JobStatus::Completed);
        QCOMPARE(done->progress, 100);
        QCOMPARE(done->downloaded, 200);
        QVERIFY(done->completedAt.isValid());
        QCOMPARE(m_engine->destroyedCount(), 1);
        QVERIFY(m_engine->handles().isEmpty());
        QVERIFY(!m_manager->progressBroadcaster()->isActive());
    }

    void testPartialSelectionIsNeverSeeded()
    {
        m_manager->updateSettings({.seedAfterDownload = true});

        const auto whole = m_manager->submit(makeParams(magnet(u"5001"_s), u"whole"_s));
        const auto part = m_manager->submit(makeParams(magnet(u"5002"_s), u"part"_s));
        QVERIFY(whole && part);

        m_engine->handleFor(magnet(u"5001"_s))->finish();
        QCOMPARE(m_manager->job(whole->id)->status, JobStatus::Seeding);
        QCOMPARE(m_manager->activeJobsCount(), 2);

        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"5002"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);
        QVERIFY(m_manager->selectFiles(part->id, {0}));
        handle->setFileDownloaded(0, 100);
        emit m_manager->progressBroadcaster()->tick();

        QCOMPARE(m_manager->job(part->id)->status, JobStatus::Completed);
        QCOMPARE(m_manager->activeJobsCount(), 1);
    }

    void testIllegalTransitions()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 1});

        const auto running = m_manager->submit(makeParams(magnet(u"1001"_s), u"running"_s));
        const auto waiting = m_manager->submit(makeParams(magnet(u"1002"_s), u"waiting"_s));
        QVERIFY(running && waiting);

        auto result = m_manager->pause(waiting->id);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidState);

        result = m_manager->resume(running->id);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidState);

        result = m_manager->selectFiles(running->id, {0});
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidState);

        result = m_manager->pause(JobID::generate());
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::NotFound);

        result = m_manager->remove(JobID::generate(), false);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::NotFound);

        QVERIFY(!m_manager->job(JobID::generate()));

        // nothing changed
        QCOMPARE(m_manager->job(running->id)->status, JobStatus::Downloading);
        QCOMPARE(m_manager->job(waiting->id)->status, JobStatus::Queued);
    }

    void testInvalidSelection()
    {
        const auto pack = m_manager->submit(makeParams(magnet(u"2001"_s), u"pack"_s));
        QVERIFY(pack);
        m_engine->handleFor(magnet(u"2001"_s))->receiveMetadata(u"pack"_s, PACK_FILES);

        auto result = m_manager->selectFiles(pack->id, {});
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidArgument);

        result = m_manager->selectFiles(pack->id, {7, -1});
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidArgument);
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::AwaitingSelection);
    }

    void testSkipFilesAlreadyOnDisk()
    {
        const Path downloadPath = m_rootPath / Path(u"downloads"_s);
        QVERIFY(Utils::Fs::mkpath(downloadPath / Path(u"pack"_s)));
        QVERIFY(Utils::IO::saveToFile((downloadPath / Path(u"pack/b.bin"_s)), QByteArray(200, 'x')));

        const auto pack = m_manager->submit(makeParams(magnet(u"3001"_s), u"pack"_s));
        QVERIFY(pack);
        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"3001"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);

        // the only selected file is complete already
        QVERIFY(m_manager->selectFiles(pack->id, {1}));
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Completed);
        QCOMPARE(m_engine->destroyedCount(), 1);
    }

    void testAddMoreFiles()
    {
        const auto pack = m_manager->submit(makeParams(magnet(u"4001"_s), u"pack"_s));
        QVERIFY(pack);

        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"4001"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);
        QVERIFY(m_manager->selectFiles(pack->id, {1}));

        // while running, the file is selected in place
        QVERIFY(m_manager->addMoreFiles(pack->id, {2}));
        auto job = m_manager->job(pack->id);
        QCOMPARE(job->status, JobStatus::Downloading);
        QCOMPARE(job->selectedIndices, QList<int>({1, 2}));
        QCOMPARE(job->totalSize, 500);
        QVERIFY(handle->isFileSelected(2));

        handle->setFileDownloaded(1, 200);
        handle->setFileDownloaded(2, 300);
        emit m_manager->progressBroadcaster()->tick();
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Completed);

        // a completed job goes back in line
        QVERIFY(m_manager->addMoreFiles(pack->id, {0, 1}));
        job = m_manager->job(pack->id);
        QCOMPARE(job->status, JobStatus::Downloading);
        QCOMPARE(job->selectedIndices, QList<int>({0, 1, 2}));
        QCOMPARE(m_engine->startCount(), 2);

        // nothing new
        QVERIFY(m_manager->addMoreFiles(pack->id, {1}));

        auto result = m_manager->addMoreFiles(pack->id, {});
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidArgument);
    }

    void testAddMoreFilesWhileAwaitingSelection()
    {
        const auto pack = m_manager->submit(makeParams(magnet(u"4101"_s), u"pack"_s));
        QVERIFY(pack);

        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"4101"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::AwaitingSelection);

        QVERIFY(m_manager->addMoreFiles(pack->id, {1}));

        const auto job = m_manager->job(pack->id);
        QCOMPARE(job->status, JobStatus::Downloading);
        QCOMPARE(job->selectedIndices, QList<int>({1}));
        QCOMPARE(job->totalSize, 200);
        QVERIFY(!handle->isFileSelected(0));
        QVERIFY(handle->isFileSelected(1));
        QVERIFY(!handle->isFileSelected(2));
    }

    void testAddMoreFilesWhileAwaitingSelectionWithoutFreeSlot()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 1});

        const auto pack = m_manager->submit(makeParams(magnet(u"4201"_s), u"pack"_s));
        const auto other = m_manager->submit(makeParams(magnet(u"4202"_s), u"other"_s));
        QVERIFY(pack && other);

        m_engine->handleFor(magnet(u"4201"_s))->receiveMetadata(u"pack"_s, PACK_FILES);
        QCOMPARE(m_manager->job(other->id)->status, JobStatus::Downloading);

        QVERIFY(m_manager->addMoreFiles(pack->id, {2}));

        const auto job = m_manager->job(pack->id);
        QCOMPARE(job->status, JobStatus::Queued);
        QCOMPARE(job->selectedIndices, QList<int>({2}));
        QCOMPARE(m_manager->activeJobsCount(), 1);
    }

    void testAddMoreFilesKeepsWholeContent()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 1});

        const auto running = m_manager->submit(makeParams(magnet(u"4301"_s), u"running"_s));
        const auto waiting = m_manager->submit(makeParams(magnet(u"4302"_s), u"waiting"_s));
        QVERIFY(running && waiting);
        QCOMPARE(waiting->status, JobStatus::Queued);

        // without a selection every file is fetched already
        QVERIFY(m_manager->addMoreFiles(waiting->id, {1}));

        const auto job = m_manager->job(waiting->id);
        QCOMPARE(job->status, JobStatus::Queued);
        QVERIFY(!job->selectedIndices);
    }

    void testDeselectedFilesRemovedAfterCompletion()
    {
        const Path downloadPath = m_rootPath / Path(u"downloads"_s);
        const auto pack = m_manager->submit(makeParams(magnet(u"4401"_s), u"pack"_s));
        QVERIFY(pack);

        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"4401"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);
        QVERIFY(m_manager->selectFiles(pack->id, {1}));

        // pieces shared with the selected file end up in its neighbours
        const Path leftover = downloadPath / Path(u"pack/a.bin"_s);
        const Path wanted = downloadPath / Path(u"pack/b.bin"_s);
        QVERIFY(Utils::IO::saveToFile(leftover, QByteArray(10, 'x')));
        QVERIFY(Utils::IO::saveToFile(wanted, QByteArray(200, 'x')));

        handle->setFileDownloaded(1, 200);
        emit m_manager->progressBroadcaster()->tick();
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Completed);

        // files are left alone until the engine has let the transfer go
        QVERIFY(leftover.exists());

        QTRY_VERIFY(!leftover.exists());
        QVERIFY(wanted.exists());
    }

    void testRemoveWithPayload()
    {
        const Path downloadPath = m_rootPath / Path(u"downloads"_s);
        const auto pack = m_manager->submit(makeParams(magnet(u"6001"_s), u"pack"_s));
        QVERIFY(pack);
        m_engine->handleFor(magnet(u"6001"_s))->receiveMetadata(u"pack"_s, PACK_FILES);
        QVERIFY(m_manager->selectFiles(pack->id, {0, 1, 2}));

        QVERIFY(Utils::Fs::mkpath(downloadPath / Path(u"pack"_s)));
        QVERIFY(Utils::IO::saveToFile((downloadPath / Path(u"pack/a.bin"_s)), QByteArray(10, 'x')));

        QSignalSpy removedSpy(m_manager.get(), &JobManager::jobRemoved);
        QVERIFY(m_manager->remove(pack->id, true));

        QCOMPARE(removedSpy.count(), 1);
        QVERIFY(!(downloadPath / Path(u"pack"_s)).exists());
        QVERIFY(m_manager->jobs().isEmpty());
        QCOMPARE(m_engine->destroyedCount(), 1);
    }

    void testRestartRecovery()
    {
        m_manager->updateSettings({.maxConcurrentDownloads = 1});

        const auto a = m_manager->submit(makeParams(magnet(u"7001"_s), u"a"_s));
        const auto b = m_manager->submit(makeParams(magnet(u"7002"_s), u"b"_s));
        const auto c = m_manager->submit(makeParams(magnet(u"7003"_s), u"c"_s));
        QVERIFY(a && b && c);
        QVERIFY(m_manager->pause(a->id));
        QCOMPARE(m_manager->job(b->id)->status, JobStatus::Downloading);

        createManager();
        QVERIFY(m_manager->jobs().isEmpty());
        QVERIFY(m_manager->restoreJobs());

        const QList<Job> restored = m_manager->jobs();
        QCOMPARE(restored.size(), 3);
        QCOMPARE(restored[0].status, JobStatus::Paused);
        QCOMPARE(restored[1].status, JobStatus::Queued);
        QCOMPARE(restored[2].status, JobStatus::Queued);
        QCOMPARE(m_manager->settings().maxConcurrentDownloads, 1);

        m_manager->resumePersistedJobs();
        QCOMPARE(m_manager->job(b->id)->status, JobStatus::Downloading);
        QCOMPARE(m_manager->job(c->id)->status, JobStatus::Queued);
        QCOMPARE(m_engine->startCount(), 1);

        // new jobs keep being ordered after the restored ones
        const auto d = m_manager->submit(makeParams(magnet(u"7004"_s), u"d"_s));
        QVERIFY(d);
        QVERIFY(d->addedAt > c->addedAt);

        const auto duplicate = m_manager->submit(makeParams(magnet(u"7003"_s), u"c"_s));
        QVERIFY(!duplicate);
        QCOMPARE(duplicate.error().kind, QueueError::Duplicate);
    }

    void testRestoredSeedingJobWithContentOnDisk()
    {
        m_manager->updateSettings({.seedAfterDownload = true});

        AddJobParams params = makeParams(magnet(u"7101"_s), u"pack"_s);
        params.selectedIndices = QList<int> {0, 1, 2};
        const auto pack = m_manager->submit(params);
        QVERIFY(pack);

        FakeTransferHandle *handle = m_engine->handleFor(magnet(u"7101"_s));
        handle->receiveMetadata(u"pack"_s, PACK_FILES);
        handle->finish();
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Seeding);

        const Path downloadPath = m_rootPath / Path(u"downloads"_s);
        for (const FakeFile &file : PACK_FILES)
            QVERIFY(Utils::IO::saveToFile((downloadPath / file.path), QByteArray(file.size, 'x')));

        createManager();
        QVERIFY(m_manager->restoreJobs());
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Queued);

        m_manager->resumePersistedJobs();
        handle = m_engine->handleFor(magnet(u"7101"_s));
        QVERIFY(handle);
        handle->receiveMetadata(u"pack"_s, PACK_FILES);

        // everything selected is on disk: the job completes instead of seeding again
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Completed);
        QCOMPARE(m_manager->job(pack->id)->progress, 100);
        QCOMPARE(m_engine->destroyedCount(), 1);
        QCOMPARE(m_manager->activeJobsCount(), 0);
    }

    void testPersistenceFailure()
    {
        // a folder in place of the snapshot file can't be written
        const Path blockedPath = m_rootPath / Path(u"blocked.json"_s);
        QVERIFY(Utils::Fs::mkpath(blockedPath));
        m_manager.reset();
        m_snapshot = std::make_unique<JobSnapshotStorage>(blockedPath);
        createManager();

        QSignalSpy failureSpy(m_manager.get(), &JobManager::persistenceFailed);

        const auto pack = m_manager->submit(makeParams(magnet(u"7201"_s), u"pack"_s));
        QVERIFY(pack);
        QVERIFY(failureSpy.count() > 0);
        QVERIFY(!failureSpy.at(0).at(0).toString().isEmpty());

        // the in-memory table keeps working
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Downloading);
        QVERIFY(m_manager->pause(pack->id));
        QCOMPARE(m_manager->job(pack->id)->status, JobStatus::Paused);
        QCOMPARE(m_manager->jobs().size(), 1);
    }

    void testSettings()
    {
        QueueSettings current = m_manager->settings();
        QCOMPARE(current.maxConcurrentDownloads, DEFAULT_CONCURRENT_DOWNLOADS);
        QCOMPARE(current.seedAfterDownload, false);
        QCOMPARE(m_engine->downloadLimit(), 0);
        QCOMPARE(m_engine->uploadLimit(), 0);

        current = m_manager->updateSettings({.maxConcurrentDownloads = 0, .maxUploadSpeed = -5});
        QCOMPARE(current.maxConcurrentDownloads, MIN_CONCURRENT_DOWNLOADS);
        QCOMPARE(current.maxUploadSpeed, 0);

        current = m_manager->updateSettings({.maxConcurrentDownloads = 50, .maxDownloadSpeed = 1024});
        QCOMPARE(current.maxConcurrentDownloads, MAX_CONCURRENT_DOWNLOADS);
        QCOMPARE(current.maxDownloadSpeed, 1024);
        QCOMPARE(m_engine->downloadLimit(), 1024);

        m_manager->setOwnerDownloadPath(u"alice"_s, Path(u"/srv/alice"_s));
        QCOMPARE(m_manager->ownerDownloadPath(u"alice"_s), Path(u"/srv/alice"_s));
        QVERIFY(m_manager->ownerDownloadPath(u"bob"_s).isEmpty());

        createManager();
        QCOMPARE(m_manager->settings(), current);
        QCOMPARE(m_engine->downloadLimit(), 1024);
        QCOMPARE(m_manager->ownerDownloadPath(u"alice"_s), Path(u"/srv/alice"_s));
    }

    void testPreviewDescriptorFiles()
    {
        const Path descriptor = m_rootPath / Path(u"pack.torrent"_s);

        auto result = m_manager->previewDescriptorFiles(descriptor);
        QVERIFY(!result);
        QCOMPARE(result.error().kind, QueueError::InvalidArgument);

        QVERIFY(Utils::IO::saveToFile(descriptor, QByteArrayLiteral("d4:infod4:name4:packee")));
        result = m_manager->previewDescriptorFiles(descriptor);
        QVERIFY(!result);

        m_engine->setDescriptorFiles({JobFile {.path = Path(u"pack/a.bin"_s), .name = u"a.bin"_s, .size = 100}});
        result = m_manager->previewDescriptorFiles(descriptor);
        QVERIFY(result);
        QCOMPARE(result->size(), 1);
        QCOMPARE(result->at(0).size, 100);
    }

private:
    AddJobParams makeParams(const QString &magnetUri, const QString &name) const
    {
        AddJobParams params;
        params.ownerId = u"tester"_s;
        params.source.magnetUri = magnetUri;
        params.name = name;
        params.downloadPath = m_rootPath / Path(u"downloads"_s);
        return params;
    }

    // simulates a restart: the snapshot and the settings survive, transfers don't
    void createManager()
    {
        m_manager.reset();
        m_engine = std::make_unique<FakeTransferEngine>();
        m_manager = std::make_unique<JobManager>(m_engine.get(), m_settings.get(), m_snapshot.get());
    }

    std::unique_ptr<QTemporaryDir> m_tempDir;
    Path m_rootPath;
    std::unique_ptr<Profile> m_profile;
    std::unique_ptr<SettingsStorage> m_settings;
    std::unique_ptr<JobSnapshotStorage> m_snapshot;
    std::unique_ptr<FakeTransferEngine> m_engine;
    std::unique_ptr<JobManager> m_manager;
};

QTEST_GUILESS_MAIN(TestJobManager)
#include "testjobmanager.moc"
