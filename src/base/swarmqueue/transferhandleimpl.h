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

#include <libtorrent/fwd.hpp>
#include <libtorrent/torrent_handle.hpp>

#include <QString>

#include "transferhandle.h"

namespace SwarmQueue
{
    class TransferEngineImpl;

    class TransferHandleImpl final : public TransferHandle
    {
        Q_OBJECT
        Q_DISABLE_COPY_MOVE(TransferHandleImpl)

    public:
        TransferHandleImpl(TransferEngineImpl *engine, const lt::torrent_handle &nativeHandle, const QString &name);

        QString infoHash() const override;
        QString name() const override;
        bool hasMetadata() const override;

        int filesCount() const override;
        QString fileName(int index) const override;
        Path filePath(int index) const override;
        qint64 fileSize(int index) const override;
        QList<qint64> filesDownloaded() const override;

        void selectFile(int index) override;
        void deselectAllFiles() override;

        TransferStats stats() const override;

        void destroy() override;

        lt::torrent_handle nativeHandle() const;

        void handleMetadataReceived();
        void handleFinished();
        void handleError(const QString &message);

    private:
        void setFilePriority(int index, lt::download_priority_t priority);

        TransferEngineImpl *m_engine = nullptr;
        lt::torrent_handle m_nativeHandle;
        QString m_name;
        bool m_isDestroyed = false;
    };
}
