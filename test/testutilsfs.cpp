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

#include <QObject>
#include <QTemporaryDir>
#include <QTest>

#include "base/global.h"
#include "base/path.h"
#include "base/utils/fs.h"
#include "base/utils/io.h"

class TestUtilsFs final : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(TestUtilsFs)

public:
    TestUtilsFs() = default;

private slots:
    void testFileSize() const
    {
        const QTemporaryDir tempDir;
        QVERIFY(tempDir.isValid());
        const Path rootPath {tempDir.path()};

        const Path filePath = rootPath / Path(u"a.bin"_s);
        QVERIFY(Utils::IO::saveToFile(filePath, QByteArray(42, 'x')));

        QCOMPARE(Utils::Fs::fileSize(filePath), 42);
        QCOMPARE(Utils::Fs::fileSize(rootPath / Path(u"missing.bin"_s)), -1);
        QCOMPARE(Utils::Fs::fileSize(rootPath), -1);
    }

    void testRemoveEmptyParentFolders() const
    {
        const QTemporaryDir tempDir;
        QVERIFY(tempDir.isValid());
        const Path rootPath {tempDir.path()};

        const Path keptFile = rootPath / Path(u"pack/kept.bin"_s);
        const Path removedFile = rootPath / Path(u"pack/sub/deep/removed.bin"_s);
        QVERIFY(Utils::IO::saveToFile(keptFile, QByteArrayLiteral("1")));
        QVERIFY(Utils::IO::saveToFile(removedFile, QByteArrayLiteral("2")));

        QVERIFY(Utils::Fs::removeFile(removedFile));
        QCOMPARE(Utils::Fs::removeEmptyParentFolders(removedFile, rootPath), 2);

        QVERIFY(!(rootPath / Path(u"pack/sub"_s)).exists());
        QVERIFY(keptFile.exists());
        QVERIFY(rootPath.exists());

        // the stop folder itself is never removed
        QVERIFY(Utils::Fs::removeFile(keptFile));
        QCOMPARE(Utils::Fs::removeEmptyParentFolders(keptFile, rootPath), 1);
        QVERIFY(rootPath.exists());
        QVERIFY(Utils::Fs::isDirEmpty(rootPath));
    }

    void testRemoveDirRecursively() const
    {
        const QTemporaryDir tempDir;
        QVERIFY(tempDir.isValid());
        const Path folder = Path(tempDir.path()) / Path(u"pack"_s);

        QVERIFY(Utils::IO::saveToFile(folder / Path(u"a/b.bin"_s), QByteArrayLiteral("b")));
        QVERIFY(Utils::Fs::isDir(folder));
        QVERIFY(Utils::Fs::removeDirRecursively(folder));
        QVERIFY(!folder.exists());

        QVERIFY(!Utils::Fs::removeDirRecursively(Path()));
    }
};

QTEST_APPLESS_MAIN(TestUtilsFs)
#include "testutilsfs.moc"
