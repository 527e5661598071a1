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

#include "fileselection.h"

#include <algorithm>

#include <QCoreApplication>

#include "base/logger.h"
#include "base/path.h"
#include "base/utils/fs.h"
#include "transferhandle.h"

using namespace SwarmQueue;

namespace
{
    int fileProgress(const qint64 downloaded, const qint64 size)
    {
        if (size <= 0)
            return 100;
        return static_cast<int>(std::clamp<qint64>(((downloaded * 100) + (size / 2)) / size, 0, 100));
    }
}

bool FileSelection::Plan::isAlreadyComplete() const
{
    return !selected.isEmpty() && toTransfer.isEmpty();
}

bool FileSelection::isFileComplete(const Path &filePath, const qint64 expectedSize)
{
    const qint64 actualSize = Utils::Fs::fileSize(filePath);
    return (actualSize >= 0) && (actualSize == expectedSize);
}

FileSelection::Plan FileSelection::plan(const TransferHandle &handle, const Path &downloadPath, const QList<int> &indices)
{
    const int filesCount = handle.filesCount();

    Plan result;
    for (const int index : indices)
    {
        if ((index < 0) || (index >= filesCount))
        {
            LogMsg(QCoreApplication::translate("FileSelection", "Ignoring invalid file index. Transfer: \"%1\". Index: %2").arg(handle.name(), QString::number(index)), Log::WARNING);
            continue;
        }

        if (!result.selected.contains(index))
            result.selected.append(index);
    }
    std::sort(result.selected.begin(), result.selected.end());

    for (const int index : asConst(result.selected))
    {
        const Path filePath = downloadPath / handle.filePath(index);
        if (isFileComplete(filePath, handle.fileSize(index)))
        {
            LogMsg(QCoreApplication::translate("FileSelection", "File is already complete on disk, skipping. File: \"%1\"").arg(filePath.toString()));
            continue;
        }

        result.toTransfer.append(index);
    }

    return result;
}

void FileSelection::apply(TransferHandle &handle, const Plan &plan)
{
    handle.deselectAllFiles();
    for (const int index : plan.toTransfer)
        handle.selectFile(index);
}

QList<JobFile> FileSelection::mapFiles(const TransferHandle &handle, const std::optional<QList<int>> &selection)
{
    const int filesCount = handle.filesCount();
    const QList<qint64> downloaded = handle.filesDownloaded();

    QList<JobFile> files;
    files.reserve(filesCount);
    for (int i = 0; i < filesCount; ++i)
    {
        JobFile file;
        file.path = handle.filePath(i);
        file.name = handle.fileName(i);
        file.size = handle.fileSize(i);
        file.downloaded = (i < downloaded.size()) ? std::min(downloaded[i], file.size) : 0;
        file.progress = fileProgress(file.downloaded, file.size);
        file.selected = !selection || selection->contains(i);
        files.append(file);
    }
    return files;
}

QList<JobFile> FileSelection::mapCompletedFiles(const TransferHandle &handle, const std::optional<QList<int>> &selection)
{
    QList<JobFile> files = mapFiles(handle, selection);
    markCompleted(files);
    return files;
}

void FileSelection::markCompleted(QList<JobFile> &files)
{
    for (JobFile &file : files)
    {
        if (!file.selected)
            continue;

        file.downloaded = file.size;
        file.progress = 100;
    }
}
