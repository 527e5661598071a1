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

#include "payloadcleaner.h"

#include <QCoreApplication>

#include "base/global.h"
#include "base/logger.h"
#include "base/path.h"
#include "base/utils/fs.h"
#include "job.h"

using namespace SwarmQueue;

namespace
{
    bool removeJobFile(const Path &filePath, const Path &downloadPath)
    {
        if (!filePath.exists())
            return true;

        if (const nonstd::expected<void, QString> result = Utils::Fs::removeFile(filePath); !result)
        {
            LogMsg(QCoreApplication::translate("PayloadCleaner", "Failed to remove file. File: \"%1\". Reason: \"%2\"")
                .arg(filePath.toString(), result.error()), Log::WARNING);
            return false;
        }

        Utils::Fs::removeEmptyParentFolders(filePath, downloadPath);
        return true;
    }
}

bool PayloadCleaner::deletePayload(const Job &job)
{
    if (job.downloadPath.isEmpty())
        return true;

    if (!job.rootFolder.isEmpty())
    {
        const Path rootPath = job.downloadPath / Path(job.rootFolder);
        if (Utils::Fs::isDir(rootPath))
        {
            if (!Utils::Fs::removeDirRecursively(rootPath))
            {
                LogMsg(QCoreApplication::translate("PayloadCleaner", "Failed to remove content folder. Folder: \"%1\"")
                    .arg(rootPath.toString()), Log::WARNING);
                return false;
            }

            LogMsg(QCoreApplication::translate("PayloadCleaner", "Removed content folder. Folder: \"%1\"").arg(rootPath.toString()));
            return true;
        }
    }

    bool ok = true;
    for (const JobFile &file : asConst(job.files))
    {
        if (!removeJobFile(job.downloadPath / file.path, job.downloadPath))
            ok = false;
    }
    return ok;
}

void PayloadCleaner::cleanupDeselectedFiles(const Job &job)
{
    if (job.downloadPath.isEmpty())
        return;

    int removedCount = 0;
    for (const JobFile &file : asConst(job.files))
    {
        if (file.selected)
            continue;

        const Path filePath = job.downloadPath / file.path;
        if (!filePath.exists())
            continue;

        if (removeJobFile(filePath, job.downloadPath))
            ++removedCount;
    }

    if (removedCount > 0)
    {
        LogMsg(QCoreApplication::translate("PayloadCleaner", "Removed unselected files. Job: \"%1\". Count: %2")
            .arg(job.name, QString::number(removedCount)));
    }
}
