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

namespace SwarmQueue
{
    inline const int MIN_CONCURRENT_DOWNLOADS = 1;
    inline const int MAX_CONCURRENT_DOWNLOADS = 10;
    inline const int DEFAULT_CONCURRENT_DOWNLOADS = 3;

    struct QueueSettings
    {
        int maxConcurrentDownloads = DEFAULT_CONCURRENT_DOWNLOADS;
        bool seedAfterDownload = false;
        // bytes per second, 0 means unlimited
        int maxUploadSpeed = 0;
        int maxDownloadSpeed = 0;

        friend bool operator==(const QueueSettings &left, const QueueSettings &right) = default;
    };

    // Only the fields that are set get changed
    struct QueueSettingsPatch
    {
        std::optional<int> maxConcurrentDownloads;
        std::optional<bool> seedAfterDownload;
        std::optional<int> maxUploadSpeed;
        std::optional<int> maxDownloadSpeed;
    };
}
