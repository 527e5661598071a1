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

#include <map>
#include <memory>
#include <unordered_map>
#include <vector>

#include <libtorrent/fwd.hpp>
#include <libtorrent/info_hash.hpp>
#include <libtorrent/torrent_handle.hpp>

#include "transferengine.h"

namespace SwarmQueue
{
    class TransferHandleImpl;

    class TransferEngineImpl final : public TransferEngine
    {
        Q_OBJECT
        Q_DISABLE_COPY_MOVE(TransferEngineImpl)

    public:
        explicit TransferEngineImpl(QObject *parent = nullptr);
        ~TransferEngineImpl() override;

        nonstd::expected<TransferHandle *, QString> start(const JobSource &source, const Path &savePath) override;

        void setDownloadSpeedLimit(int limit) override;
        void setUploadSpeedLimit(int limit) override;

        nonstd::expected<QList<JobFile>, QString> readDescriptorFiles(const Path &path) const override;

        // Returns `false` when the transfer is unknown to the session,
        // the handle can be deleted right away then
        bool removeTransfer(TransferHandleImpl *handle);

    private:
        void readAlerts();
        void handleAlert(const lt::alert *alert);
        void handleSessionErrorAlert(const lt::session_error_alert *alert) const;
        void handleTransferRemoved(const lt::info_hash_t &infoHashes);
        TransferHandleImpl *findTransfer(const lt::torrent_handle &nativeHandle) const;

        std::unique_ptr<lt::session> m_nativeSession;
        std::unordered_map<lt::torrent_handle, TransferHandleImpl *> m_transfers;
        // handles waiting for libtorrent to release the storage of their torrent
        std::map<lt::info_hash_t, TransferHandleImpl *> m_removingTransfers;
        std::vector<lt::alert *> m_alerts;
    };
}
