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

#include <QList>

#include "base/pathfwd.h"
#include "job.h"

namespace SwarmQueue
{
    class TransferHandle;
}

namespace SwarmQueue::FileSelection
{
    struct Plan
    {
        // valid requested indices, sorted and without duplicates
        QList<int> selected;
        // the part of `selected` that still has to be transferred
        QList<int> toTransfer;

        bool isAlreadyComplete() const;
    };

    // A file counts as complete when it exists with exactly the expected size
    bool isFileComplete(const Path &filePath, qint64 expectedSize);

    Plan plan(const TransferHandle &handle, const Path &downloadPath, const QList<int> &indices);

    // Deselects everything, then selects the files of `plan.toTransfer`
    void apply(TransferHandle &handle, const Plan &plan);

    // File list as reported by the engine with live byte counts
    QList<JobFile> mapFiles(const TransferHandle &handle, const std::optional<QList<int>> &selection);
    // File list of a finished job: selected files are reported as fully downloaded
    QList<JobFile> mapCompletedFiles(const TransferHandle &handle, const std::optional<QList<int>> &selection);
    void markCompleted(QList<JobFile> &files);
}
