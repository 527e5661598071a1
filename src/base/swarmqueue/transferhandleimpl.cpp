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

#include "transferhandleimpl.h"

#include <vector>

#include <libtorrent/download_priority.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

#include "base/global.h"
#include "base/path.h"
#include "transferengineimpl.h"

using namespace SwarmQueue;

namespace
{
    template <typename Hash>
    QString toHexString(const Hash &hash)
    {
        return QString::fromLatin1(QByteArray(hash.data(), static_cast<qsizetype>(hash.size())).toHex());
    }
}

TransferHandleImpl::TransferHandleImpl(TransferEngineImpl *engine, const lt::torrent_handle &nativeHandle, const QString &name)
    : TransferHandle(engine)
    , m_engine {engine}
    , m_nativeHandle {nativeHandle}
    , m_name {name}
{
}

QString TransferHandleImpl::infoHash() const
{
    const lt::info_hash_t hashes = m_nativeHandle.info_hashes();
    if (hashes.has_v1())
        return toHexString(hashes.v1);
    if (hashes.has_v2())
        return toHexString(hashes.v2);
    return {};
}

QString TransferHandleImpl::name() const
{
    if (const std::shared_ptr<const lt::torrent_info> info = m_nativeHandle.torrent_file())
        return QString::fromStdString(info->name());
    return m_name;
}

bool TransferHandleImpl::hasMetadata() const
{
    return m_nativeHandle.is_valid() && (m_nativeHandle.torrent_file() != nullptr);
}

int TransferHandleImpl::filesCount() const
{
    const std::shared_ptr<const lt::torrent_info> info = m_nativeHandle.torrent_file();
    return info ? info->num_files() : 0;
}

QString TransferHandleImpl::fileName(const int index) const
{
    const std::shared_ptr<const lt::torrent_info> info = m_nativeHandle.torrent_file();
    if (!info)
        return {};

    const lt::string_view fileName = info->files().file_name(lt::file_index_t {index});
    return QString::fromUtf8(fileName.data(), static_cast<qsizetype>(fileName.size()));
}

Path TransferHandleImpl::filePath(const int index) const
{
    const std::shared_ptr<const lt::torrent_info> info = m_nativeHandle.torrent_file();
    if (!info)
        return {};

    return Path(info->files().file_path(lt::file_index_t {index}));
}

qint64 TransferHandleImpl::fileSize(const int index) const
{
    const std::shared_ptr<const lt::torrent_info> info = m_nativeHandle.torrent_file();
    return info ? info->files().file_size(lt::file_index_t {index}) : 0;
}

QList<qint64> TransferHandleImpl::filesDownloaded() const
{
    if (!hasMetadata())
        return {};

    const std::vector<std::int64_t> progress = m_nativeHandle.file_progress(lt::torrent_handle::piece_granularity);

    QList<qint64> result;
    result.reserve(static_cast<qsizetype>(progress.size()));
    for (const std::int64_t bytes : progress)
        result.append(bytes);
    return result;
}

void TransferHandleImpl::selectFile(const int index)
{
    setFilePriority(index, lt::default_priority);
}

void TransferHandleImpl::deselectAllFiles()
{
    const int count = filesCount();
    if (count <= 0)
        return;

    m_nativeHandle.prioritize_files(std::vector<lt::download_priority_t>(static_cast<std::size_t>(count), lt::dont_download));
}

TransferStats TransferHandleImpl::stats() const
{
    if (!m_nativeHandle.is_valid())
        return {};

    const lt::torrent_status status = m_nativeHandle.status();
    const std::shared_ptr<const lt::torrent_info> info = m_nativeHandle.torrent_file();

    return {
        .downloadSpeed = status.download_payload_rate,
        .uploadSpeed = status.upload_payload_rate,
        .downloaded = status.total_done,
        .uploaded = status.all_time_upload,
        .totalSize = info ? info->total_size() : status.total_wanted,
        .peersCount = status.num_peers
    };
}

void TransferHandleImpl::destroy()
{
    if (m_isDestroyed)
        return;

    m_isDestroyed = true;
    if (!m_engine->removeTransfer(this))
        deleteLater();
}

lt::torrent_handle TransferHandleImpl::nativeHandle() const
{
    return m_nativeHandle;
}

void TransferHandleImpl::handleMetadataReceived()
{
    if (!m_isDestroyed)
        emit metadataReceived();
}

void TransferHandleImpl::handleFinished()
{
    if (m_isDestroyed)
        return;

    // with deselected files libtorrent reports "finished" before the content is complete
    const lt::torrent_status status = m_nativeHandle.status({});
    if (status.is_seeding)
        emit finished();
}

void TransferHandleImpl::handleError(const QString &message)
{
    if (!m_isDestroyed)
        emit errorOccurred(message);
}

void TransferHandleImpl::setFilePriority(const int index, const lt::download_priority_t priority)
{
    if ((index < 0) || (index >= filesCount()))
        return;

    m_nativeHandle.file_priority(lt::file_index_t {index}, priority);
}
