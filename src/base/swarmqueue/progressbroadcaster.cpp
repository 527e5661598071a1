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

#include "progressbroadcaster.h"

#include <algorithm>

#include "base/global.h"
#include "fileselection.h"
#include "job.h"
#include "transferhandle.h"

using namespace std::chrono_literals;
using namespace SwarmQueue;

namespace
{
    int percentage(const qint64 done, const qint64 total)
    {
        if (total <= 0)
            return 0;
        return static_cast<int>(std::clamp<qint64>(((done * 100) + (total / 2)) / total, 0, 100));
    }
}

ProgressBroadcaster::ProgressBroadcaster(QObject *parent)
    : QObject(parent)
{
    m_timer.setInterval(1s);
    connect(&m_timer, &QTimer::timeout, this, &ProgressBroadcaster::tick);
}

void ProgressBroadcaster::start()
{
    if (!m_timer.isActive())
        m_timer.start();
}

void ProgressBroadcaster::stop()
{
    m_timer.stop();
}

bool ProgressBroadcaster::isActive() const
{
    return m_timer.isActive();
}

std::chrono::milliseconds ProgressBroadcaster::interval() const
{
    return m_timer.intervalAsDuration();
}

void ProgressBroadcaster::setInterval(const std::chrono::milliseconds interval)
{
    m_timer.setInterval(interval);
}

ProgressBroadcaster::RefreshResult ProgressBroadcaster::refreshJob(Job &job, const TransferHandle &handle)
{
    const TransferStats stats = handle.stats();
    job.downloadSpeed = stats.downloadSpeed;
    job.uploadSpeed = stats.uploadSpeed;
    job.uploaded = stats.uploaded;
    job.seederCount = stats.peersCount;

    if (handle.hasMetadata())
        job.files = FileSelection::mapFiles(handle, job.selectedIndices);

    bool selectionCompleted = false;
    if (job.hasNarrowSelection())
    {
        qint64 selectedSize = 0;
        qint64 selectedDownloaded = 0;
        for (const JobFile &file : asConst(job.files))
        {
            if (!file.selected)
                continue;

            selectedSize += file.size;
            selectedDownloaded += file.downloaded;
        }

        job.totalSize = selectedSize;
        job.downloaded = selectedDownloaded;
        // the engine never reports completion of a partial selection by itself
        selectionCompleted = (job.status == JobStatus::Downloading) && (selectedSize > 0) && (selectedDownloaded >= selectedSize);
    }
    else
    {
        job.totalSize = stats.totalSize;
        job.downloaded = (stats.totalSize > 0) ? std::min(stats.downloaded, stats.totalSize) : stats.downloaded;
    }

    job.progress = percentage(job.downloaded, job.totalSize);
    job.ratio = (job.downloaded > 0) ? (static_cast<qreal>(job.uploaded) / job.downloaded) : 0;

    return selectionCompleted ? RefreshResult::SelectionCompleted : RefreshResult::Updated;
}
