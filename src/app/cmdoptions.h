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

#include <QList>
#include <QString>
#include <QStringList>

#include "base/exceptions.h"
#include "base/path.h"

class QProcessEnvironment;

struct SwqCommandLineParameters
{
    bool showHelp = false;
    bool showVersion = false;
    bool autoSelect = false;
    bool exitWhenDone = false;
    int maxActive = -1;
    Path profileDir;
    QString configurationName;
    Path savePath;
    QString ownerId;
    QString name;
    std::optional<QList<int>> selectedIndices;
    QStringList sources;
    QString unknownParameter;

    explicit SwqCommandLineParameters(const QProcessEnvironment &env);
};

class CommandLineParameterError : public RuntimeError
{
public:
    using RuntimeError::RuntimeError;
};

SwqCommandLineParameters parseCommandLine(const QStringList &args);
void displayUsage(const QString &prgName);
