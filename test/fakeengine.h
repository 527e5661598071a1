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

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>

#include <nonstd/expected.hpp>

#include "base/global.h"
#include "base/path.h"
#include "base/swarmqueue/jobsource.h"
#include "base/swarmqueue/transferengine.h"
#include "base/swarmqueue/transferhandle.h"

class FakeTransferEngine;

struct FakeFile
{
    Path path;
    qint64 size = 0;
};

class FakeTransferHandle final : public SwarmQueue::TransferHandle
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(FakeTransferHandle)

public:
    FakeTransferHandle(const SwarmQueue::JobSource &source, const Path &savePath, FakeTransferEngine *engine);

    SwarmQueue::JobSource source() const { return m_source; }
    Path savePath() const { return m_savePath; }
    bool isDestroyed() const { return m_isDestroyed; }

    void setMetadata(const QString &name, const QList<FakeFile> &files)
    {
        m_name = name;
        m_files = files;
        m_selected = QList<bool>(files.size(), true);
        m_downloaded = QList<qint64>(files.size(), 0);
        m_hasMetadata = true;
    }

    void setFileDownloaded(const int index, const qint64 bytes) { m_downloaded[index] = bytes; }
    void setStats(const SwarmQueue::TransferStats &stats) { m_stats = stats; }
    bool isFileSelected(const int index) const { return m_selected.value(index); }

    void receiveMetadata(const QString &name, const QList<FakeFile> &files)
    {
        setMetadata(name, files);
        emit metadataReceived();
    }

    void finish() { emit finished(); }
    void fail(const QString &message) { emit errorOccurred(message); }

    QString infoHash() const override { return m_infoHash; }
    QString name() const override { return m_name; }
    bool hasMetadata() const override { return m_hasMetadata; }

    int filesCount() const override { return static_cast<int>(m_files.size()); }
    QString fileName(const int index) const override { return m_files.at(index).path.filename(); }
    Path filePath(const int index) const override { return m_files.at(index).path; }
    qint64 fileSize(const int index) const override { return m_files.at(index).size; }
    QList<qint64> filesDownloaded() const override { return m_downloaded; }

    void selectFile(const int index) override { m_selected[index] = true; }
    void deselectAllFiles() override { m_selected.fill(false); }

    SwarmQueue::TransferStats stats() const override { return m_stats; }

    void destroy() override;

private:
    FakeTransferEngine *m_engine = nullptr;
    SwarmQueue::JobSource m_source;
    Path m_savePath;
    QString m_infoHash;
    QString m_name;
    bool m_hasMetadata = false;
    bool m_isDestroyed = false;
    QList<FakeFile> m_files;
    QList<bool> m_selected;
    QList<qint64> m_downloaded;
    SwarmQueue::TransferStats m_stats;
};

// Records every transfer it is asked to start. Nothing happens until the
// test drives the returned handles.
class FakeTransferEngine final : public SwarmQueue::TransferEngine
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(FakeTransferEngine)

public:
    using SwarmQueue::TransferEngine::TransferEngine;

    nonstd::expected<SwarmQueue::TransferHandle *, QString> start(const SwarmQueue::JobSource &source, const Path &savePath) override
    {
        ++m_startCount;
        if (!m_startError.isEmpty())
            return nonstd::make_unexpected(m_startError);

        auto *handle = new FakeTransferHandle(source, savePath, this);
        m_handles.append(handle);
        return handle;
    }

    void setDownloadSpeedLimit(const int limit) override { m_downloadLimit = limit; }
    void setUploadSpeedLimit(const int limit) override { m_uploadLimit = limit; }

    nonstd::expected<QList<SwarmQueue::JobFile>, QString> readDescriptorFiles(const Path &path) const override
    {
        if (m_descriptorFiles.isEmpty())
            return nonstd::make_unexpected(u"Not a torrent file: %1"_s.arg(path.toString()));
        return m_descriptorFiles;
    }

    // alive handles, in start order
    QList<FakeTransferHandle *> handles() const { return m_handles; }
    FakeTransferHandle *handleFor(const QString &magnetUri) const
    {
        for (FakeTransferHandle *handle : m_handles)
        {
            if (handle->source().magnetUri == magnetUri)
                return handle;
        }
        return nullptr;
    }

    int startCount() const { return m_startCount; }
    int destroyedCount() const { return m_destroyedCount; }
    int downloadLimit() const { return m_downloadLimit; }
    int uploadLimit() const { return m_uploadLimit; }

    void setStartError(const QString &error) { m_startError = error; }
    void setDescriptorFiles(const QList<SwarmQueue::JobFile> &files) { m_descriptorFiles = files; }

    void removeHandle(FakeTransferHandle *handle)
    {
        m_handles.removeOne(handle);
        ++m_destroyedCount;
    }

private:
    QList<FakeTransferHandle *> m_handles;
    QList<SwarmQueue::JobFile> m_descriptorFiles;
    QString m_startError;
    int m_startCount = 0;
    int m_destroyedCount = 0;
    int m_downloadLimit = -1;
    int m_uploadLimit = -1;
};

inline FakeTransferHandle::FakeTransferHandle(const SwarmQueue::JobSource &source, const Path &savePath, FakeTransferEngine *engine)
    : SwarmQueue::TransferHandle(engine)
    , m_engine {engine}
    , m_source {source}
    , m_savePath {savePath}
{
}

inline void FakeTransferHandle::destroy()
{
    m_isDestroyed = true;
    m_engine->removeHandle(this);
    deleteLater();
}
