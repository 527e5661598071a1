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

#include "fs.h"

#include <filesystem>

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "base/path.h"

/**
 * Returns the size of a regular file, -1 if `path` doesn't name one.
 */
qint64 Utils::Fs::fileSize(const Path &path)
{
    std::error_code ec;
    const std::filesystem::path stdPath = path.toStdFsPath();
    if (!std::filesystem::is_regular_file(stdPath, ec))
        return -1;

    const std::uintmax_t size = std::filesystem::file_size(stdPath, ec);
    return ec ? -1 : static_cast<qint64>(size);
}

bool Utils::Fs::isDir(const Path &path)
{
    return QFileInfo(path.data()).isDir();
}

bool Utils::Fs::isDirEmpty(const Path &path)
{
    return QDir(path.data()).isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);
}

Path Utils::Fs::toAbsolutePath(const Path &path)
{
    return Path(QFileInfo(path.data()).absoluteFilePath());
}

bool Utils::Fs::renameFile(const Path &from, const Path &to)
{
    return QFile::rename(from.data(), to.data());
}

/**
 * Removes the file with the given filePath.
 *
 * This function will try to fix the file permissions before removing it.
 */
nonstd::expected<void, QString> Utils::Fs::removeFile(const Path &path)
{
    QFile file {path.data()};
    if (file.remove())
        return {};

    if (!file.exists())
        return {};

    // Make sure we have read/write permissions
    file.setPermissions(file.permissions() | QFile::ReadOwner | QFile::WriteOwner | QFile::ReadUser | QFile::WriteUser);
    if (file.remove())
        return {};

    const QString errorMessage = file.errorString();
    return nonstd::make_unexpected(!errorMessage.isEmpty() ? errorMessage : QCoreApplication::translate("fs", "Unknown error"));
}

bool Utils::Fs::mkpath(const Path &dirPath)
{
    return QDir().mkpath(dirPath.data());
}

bool Utils::Fs::rmdir(const Path &dirPath)
{
    return QDir().rmdir(dirPath.data());
}

/**
 * Removes directory and its content recursively.
 * Returns `true` if the directory doesn't exist afterwards.
 */
bool Utils::Fs::removeDirRecursively(const Path &path)
{
    if (path.isEmpty())
        return false;

    QDir(path.data()).removeRecursively();
    return !path.exists();
}

/**
 * Walks up from the parent folder of `filePath` and removes every folder
 * that became empty, stopping at (and never removing) `stopPath`.
 * Returns the number of removed folders.
 */
int Utils::Fs::removeEmptyParentFolders(const Path &filePath, const Path &stopPath)
{
    int removedCount = 0;
    Path dir = filePath.parentPath();
    while (dir.hasAncestor(stopPath))
    {
        if (!dir.exists())
        {
            dir = dir.parentPath();
            continue;
        }

        if (!isDirEmpty(dir) || !rmdir(dir))
            break;

        ++removedCount;
        dir = dir.parentPath();
    }
    return removedCount;
}
