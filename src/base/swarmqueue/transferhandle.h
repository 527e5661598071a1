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
#include <QString>

#include "base/pathfwd.h"

namespace SwarmQueue
{
    struct TransferStats
    {
        qint64 downloadSpeed = 0;
        qint64 uploadSpeed = 0;
        qint64 downloaded = 0;
        qint64 uploaded = 0;
        qint64 totalSize = 0;
        int peersCount = 0;
    };

    // A single running transfer inside the engine. Handles are owned by the
    // engine; after `destroy()` no more signals are emitted and the object
    // is deleted once the engine no longer touches the transfer's files.
    class TransferHandle : public QObject
    {
        Q_OBJECT
        Q_DISABLE_COPY_MOVE(TransferHandle)

    public:
        using QObject::QObject;

        virtual QString infoHash() const = 0;
        virtual QString name() const = 0;
        virtual bool hasMetadata() const = 0;

        virtual int filesCount() const = 0;
        virtual QString fileName(int index) const = 0;
        // relative to the save path, starts with the root folder if any
        virtual Path filePath(int index) const = 0;
        virtual qint64 fileSize(int index) const = 0;
        virtual QList<qint64> filesDownloaded() const = 0;

        virtual void selectFile(int index) = 0;
        virtual void deselectAllFiles() = 0;

        virtual TransferStats stats() const = 0;

        virtual void destroy() = 0;

    signals:
        void metadataReceived();
        // emitted only when the whole content is downloaded
        void finished();
        void errorOccurred(const QString &message);
    };
}
