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

#include "transferengineimpl.h"

#include <algorithm>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/download_priority.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/version.hpp>

#include <QCoreApplication>

#include "base/global.h"
#include "base/logger.h"
#include "base/path.h"
#include "base/utils/fs.h"
#include "base/version.h"
#include "jobsource.h"
#include "transferhandleimpl.h"

using namespace SwarmQueue;

namespace
{
    const auto USER_AGENT = QStringLiteral("SwarmQueue/" SWQ_VERSION_2);

    QString toQString(const std::string &str)
    {
        return QString::fromStdString(str);
    }

    lt::settings_pack initialSettings()
    {
        lt::settings_pack pack;
        pack.set_int(lt::settings_pack::alert_mask, lt::alert_category::error
            | lt::alert_category::status
            | lt::alert_category::storage
            | lt::alert_category::file_progress);
        pack.set_str(lt::settings_pack::user_agent, USER_AGENT.toStdString());
        pack.set_bool(lt::settings_pack::enable_upnp, false);
        pack.set_bool(lt::settings_pack::enable_natpmp, false);
        pack.set_bool(lt::settings_pack::enable_dht, true);
        pack.set_bool(lt::settings_pack::enable_lsd, true);
        return pack;
    }
}

TransferEngineImpl::TransferEngineImpl(QObject *parent)
    : TransferEngine(parent)
    , m_nativeSession {std::make_unique<lt::session>(lt::session_params {initialSettings(), {}})}
{
    m_nativeSession->set_alert_notify([this]()
    {
        QMetaObject::invokeMethod(this, &TransferEngineImpl::readAlerts, Qt::QueuedConnection);
    });

    LogMsg(tr("Transfer engine started. libtorrent version: %1. HTTP User-Agent: \"%2\"")
        .arg(QString::fromLatin1(lt::version()), USER_AGENT), Log::INFO);
}

TransferEngineImpl::~TransferEngineImpl()
{
    m_nativeSession->set_alert_notify([] {});

    for (auto it = m_transfers.cbegin(); it != m_transfers.cend(); ++it)
        m_nativeSession->remove_torrent(it->first);
    m_transfers.clear();

    // the proxy waits for the session to shut down when it goes out of scope
    const lt::session_proxy proxy = m_nativeSession->abort();
    m_nativeSession.reset();
}

nonstd::expected<TransferHandle *, QString> TransferEngineImpl::start(const JobSource &source, const Path &savePath)
{
    lt::add_torrent_params params;

    if (source.useDescriptor())
    {
        lt::error_code ec;
        auto info = std::make_shared<lt::torrent_info>(source.descriptorPath.toString().toStdString(), ec);
        if (ec)
        {
            return nonstd::make_unexpected(tr("Failed to load torrent file. File: \"%1\". Error: \"%2\"")
                .arg(source.descriptorPath.toString(), toQString(ec.message())));
        }
        params.ti = std::move(info);
    }
    else if (!source.magnetUri.isEmpty())
    {
        lt::error_code ec;
        lt::parse_magnet_uri(source.magnetUri.toStdString(), params, ec);
        if (ec)
        {
            return nonstd::make_unexpected(tr("Invalid magnet link. Link: \"%1\". Error: \"%2\"")
                .arg(source.magnetUri, toQString(ec.message())));
        }
    }
    else
    {
        return nonstd::make_unexpected(tr("Torrent file doesn't exist. File: \"%1\"").arg(source.descriptorPath.toString()));
    }

    if (!Utils::Fs::mkpath(savePath))
        return nonstd::make_unexpected(tr("Couldn't create download folder. Folder: \"%1\"").arg(savePath.toString()));

    params.save_path = savePath.toString().toStdString();
    params.flags &= ~lt::torrent_flags::paused;
    params.flags &= ~lt::torrent_flags::auto_managed;

    const bool hasMetadata = (params.ti != nullptr);
    const QString name = hasMetadata ? toQString(params.ti->name()) : toQString(params.name);

    lt::error_code ec;
    const lt::torrent_handle nativeHandle = m_nativeSession->add_torrent(std::move(params), ec);
    if (ec)
        return nonstd::make_unexpected(tr("Failed to add transfer. Error: \"%1\"").arg(toQString(ec.message())));

    if (hasMetadata)
    {
        // nothing is fetched until the owner decides which files it wants
        const int filesCount = nativeHandle.torrent_file()->num_files();
        nativeHandle.prioritize_files(std::vector<lt::download_priority_t>(static_cast<std::size_t>(filesCount), lt::dont_download));
    }

    auto *handle = new TransferHandleImpl(this, nativeHandle, name);
    m_transfers.emplace(nativeHandle, handle);

    // metadata of a torrent file is known right away, report it like a resolved magnet link
    if (hasMetadata)
        QMetaObject::invokeMethod(handle, &TransferHandleImpl::handleMetadataReceived, Qt::QueuedConnection);

    return handle;
}

void TransferEngineImpl::setDownloadSpeedLimit(const int limit)
{
    lt::settings_pack pack;
    pack.set_int(lt::settings_pack::download_rate_limit, std::max(limit, 0));
    m_nativeSession->apply_settings(std::move(pack));
}

void TransferEngineImpl::setUploadSpeedLimit(const int limit)
{
    lt::settings_pack pack;
    pack.set_int(lt::settings_pack::upload_rate_limit, std::max(limit, 0));
    m_nativeSession->apply_settings(std::move(pack));
}

nonstd::expected<QList<JobFile>, QString> TransferEngineImpl::readDescriptorFiles(const Path &path) const
{
    lt::error_code ec;
    const lt::torrent_info info {path.toString().toStdString(), ec};
    if (ec)
    {
        return nonstd::make_unexpected(tr("Failed to load torrent file. File: \"%1\". Error: \"%2\"")
            .arg(path.toString(), toQString(ec.message())));
    }

    const lt::file_storage &files = info.files();

    QList<JobFile> result;
    result.reserve(files.num_files());
    for (const lt::file_index_t index : files.file_range())
    {
        const lt::string_view fileName = files.file_name(index);

        JobFile file;
        file.path = Path(files.file_path(index));
        file.name = QString::fromUtf8(fileName.data(), static_cast<qsizetype>(fileName.size()));
        file.size = files.file_size(index);
        file.selected = false;
        result.append(file);
    }
    return result;
}

bool TransferEngineImpl::removeTransfer(TransferHandleImpl *handle)
{
    const lt::torrent_handle nativeHandle = handle->nativeHandle();
    if ((m_transfers.erase(nativeHandle) == 0) || !nativeHandle.is_valid())
        return false;

    // `torrent_removed_alert` may be posted while the files are still open,
    // so the handle lives until `torrent_deleted_alert` confirms the storage is released
    m_removingTransfers.emplace(nativeHandle.info_hashes(), handle);
    m_nativeSession->remove_torrent(nativeHandle, lt::session::delete_partfile);
    return true;
}

void TransferEngineImpl::readAlerts()
{
    m_alerts.clear();
    m_nativeSession->pop_alerts(&m_alerts);

    for (const lt::alert *alert : m_alerts)
        handleAlert(alert);
}

void TransferEngineImpl::handleAlert(const lt::alert *alert)
{
    try
    {
        switch (alert->type())
        {
        case lt::metadata_received_alert::alert_type:
            if (TransferHandleImpl *handle = findTransfer(static_cast<const lt::torrent_alert *>(alert)->handle))
                handle->handleMetadataReceived();
            break;
        case lt::torrent_finished_alert::alert_type:
            if (TransferHandleImpl *handle = findTransfer(static_cast<const lt::torrent_alert *>(alert)->handle))
                handle->handleFinished();
            break;
        case lt::torrent_error_alert::alert_type:
        case lt::file_error_alert::alert_type:
        case lt::metadata_failed_alert::alert_type:
            if (TransferHandleImpl *handle = findTransfer(static_cast<const lt::torrent_alert *>(alert)->handle))
                handle->handleError(toQString(alert->message()));
            break;
        case lt::torrent_deleted_alert::alert_type:
            handleTransferRemoved(static_cast<const lt::torrent_deleted_alert *>(alert)->info_hashes);
            break;
        case lt::torrent_delete_failed_alert::alert_type:
            {
                const auto *deleteFailedAlert = static_cast<const lt::torrent_delete_failed_alert *>(alert);
                LogMsg(tr("Failed to remove partfile. Error: \"%1\"").arg(toQString(deleteFailedAlert->error.message())), Log::WARNING);
                handleTransferRemoved(deleteFailedAlert->info_hashes);
            }
            break;
        case lt::session_error_alert::alert_type:
            handleSessionErrorAlert(static_cast<const lt::session_error_alert *>(alert));
            break;
        }
    }
    catch (const std::exception &exc)
    {
        LogMsg(tr("Failed to process libtorrent alert. Alert: \"%1\". Error: \"%2\"")
            .arg(QString::fromLatin1(alert->what()), QString::fromLocal8Bit(exc.what())), Log::WARNING);
    }
}

void TransferEngineImpl::handleSessionErrorAlert(const lt::session_error_alert *alert) const
{
    LogMsg(tr("libtorrent session encountered a serious error. Error: \"%1\"")
        .arg(toQString(alert->message())), Log::CRITICAL);
}

void TransferEngineImpl::handleTransferRemoved(const lt::info_hash_t &infoHashes)
{
    const auto it = m_removingTransfers.find(infoHashes);
    if (it == m_removingTransfers.end())
        return;

    it->second->deleteLater();
    m_removingTransfers.erase(it);
}

TransferHandleImpl *TransferEngineImpl::findTransfer(const lt::torrent_handle &nativeHandle) const
{
    const auto it = m_transfers.find(nativeHandle);
    return (it != m_transfers.cend()) ? it->second : nullptr;
}
