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

#include "path.h"

#include <algorithm>

#include <QDir>
#include <QFileInfo>
#include <QList>
#include <QStringView>

#include "base/global.h"

const int PATHLIST_TYPEID = qRegisterMetaType<PathList>("PathList");

namespace
{
    QString cleanPath(const QString &path)
    {
        const bool hasSeparator = std::any_of(path.cbegin(), path.cend(), [](const QChar c)
        {
            return (c == u'/') || (c == u'\\');
        });
        return hasSeparator ? QDir::cleanPath(path) : path;
    }
}

Path::Path(const QString &pathStr)
    : m_pathStr {cleanPath(pathStr)}
{
}

Path::Path(const std::string &pathStr)
    : Path(QString::fromStdString(pathStr))
{
}

bool Path::isEmpty() const
{
    return m_pathStr.isEmpty();
}

bool Path::exists() const
{
    return !isEmpty() && QFileInfo::exists(m_pathStr);
}

Path Path::parentPath() const
{
    const int slashIndex = m_pathStr.lastIndexOf(u'/');
    if (slashIndex == -1)
        return {};

    if (slashIndex == 0) // *nix absolute path
        return (m_pathStr.size() == 1) ? Path() : createUnchecked(u"/"_s);

    return createUnchecked(m_pathStr.left(slashIndex));
}

QString Path::filename() const
{
    const int slashIndex = m_pathStr.lastIndexOf(u'/');
    if (slashIndex == -1)
        return m_pathStr;

    return m_pathStr.mid(slashIndex + 1);
}

bool Path::hasAncestor(const Path &other) const
{
    if (other.isEmpty() || (m_pathStr.size() <= other.m_pathStr.size()))
        return false;

    return (m_pathStr[other.m_pathStr.size()] == u'/')
            && m_pathStr.startsWith(other.m_pathStr);
}

QString Path::data() const
{
    return m_pathStr;
}

QString Path::toString() const
{
    return QDir::toNativeSeparators(m_pathStr);
}

std::filesystem::path Path::toStdFsPath() const
{
    return {data().toStdString(), std::filesystem::path::format::generic_format};
}

Path &Path::operator/=(const Path &other)
{
    *this = *this / other;
    return *this;
}

Path Path::findRootFolder(const PathList &filePaths)
{
    Path rootFolder;
    for (const Path &filePath : filePaths)
    {
        const auto filePathElements = QStringView(filePath.m_pathStr).split(u'/');
        // if at least one file has no root folder, no common root folder exists
        if (filePathElements.count() <= 1)
            return {};

        if (rootFolder.isEmpty())
            rootFolder.m_pathStr = filePathElements.at(0).toString();
        else if (rootFolder.m_pathStr != filePathElements.at(0))
            return {};
    }

    return rootFolder;
}

Path Path::createUnchecked(const QString &pathStr)
{
    Path path;
    path.m_pathStr = pathStr;

    return path;
}

bool operator==(const Path &lhs, const Path &rhs)
{
    return (lhs.data() == rhs.data());
}

Path operator/(const Path &lhs, const Path &rhs)
{
    if (rhs.isEmpty())
        return lhs;

    if (lhs.isEmpty())
        return rhs;

    return Path(lhs.m_pathStr + u'/' + rhs.m_pathStr);
}

Path operator+(const Path &lhs, const QStringView rhs)
{
    return Path(lhs.data() + rhs);
}

std::size_t qHash(const Path &key, const std::size_t seed)
{
    return ::qHash(key.data(), seed);
}
