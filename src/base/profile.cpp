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

#include "profile.h"

#include <QCoreApplication>
#include <QStandardPaths>

#include "base/global.h"
#include "base/utils/fs.h"

Profile::Profile(const Path &rootProfilePath, const QString &configurationName)
    : m_rootPath {rootProfilePath}
    , m_configurationName {configurationName}
{
    if (m_rootPath.isEmpty())
    {
        const QString suffix = m_configurationName.isEmpty() ? QString() : (u'_' + m_configurationName);
        m_configLocation = Path(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + suffix);
        m_dataLocation = Path(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + suffix);
        m_logsLocation = m_dataLocation / Path(u"logs"_s);
        m_downloadLocation = Path(QStandardPaths::writableLocation(QStandardPaths::DownloadLocation));
    }
    else
    {
        const Path basePath = Utils::Fs::toAbsolutePath(m_rootPath) / Path(profileName());
        m_configLocation = basePath / Path(u"config"_s);
        m_dataLocation = basePath / Path(u"data"_s);
        m_logsLocation = basePath / Path(u"logs"_s);
        m_downloadLocation = basePath / Path(u"downloads"_s);
    }

    ensureDirectoryExists(SpecialFolder::Config);
    ensureDirectoryExists(SpecialFolder::Data);
    ensureDirectoryExists(SpecialFolder::Logs);
}

Path Profile::location(const SpecialFolder folder) const
{
    switch (folder)
    {
    case SpecialFolder::Config:
        return m_configLocation;
    case SpecialFolder::Data:
        return m_dataLocation;
    case SpecialFolder::Logs:
        return m_logsLocation;
    case SpecialFolder::Downloads:
        return m_downloadLocation;
    }

    return {};
}

std::unique_ptr<QSettings> Profile::applicationSettings(const QString &name) const
{
    const Path settingsPath = m_configLocation / Path(name + u".conf");
    return std::make_unique<QSettings>(settingsPath.data(), QSettings::IniFormat);
}

Path Profile::rootPath() const
{
    return m_rootPath;
}

QString Profile::configurationName() const
{
    return m_configurationName;
}

QString Profile::profileName() const
{
    const QString appName = QCoreApplication::applicationName().isEmpty()
        ? u"swarmqueue"_s : QCoreApplication::applicationName();
    return m_configurationName.isEmpty() ? appName : (appName + u'_' + m_configurationName);
}

void Profile::ensureDirectoryExists(const SpecialFolder folder) const
{
    const Path locationPath = location(folder);
    if (!locationPath.isEmpty() && !Utils::Fs::mkpath(locationPath))
        qFatal("Could not create required directory '%s'", qUtf8Printable(locationPath.toString()));
}
