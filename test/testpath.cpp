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
#include <QTest>

#include "base/global.h"
#include "base/path.h"

class TestPath final : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(TestPath)

public:
    TestPath() = default;

private slots:
    void testConstructors() const
    {
        QVERIFY(Path(u""_s) == Path(std::string("")));
        QVERIFY(Path(u"abc"_s) == Path(std::string("abc")));
        QVERIFY(Path(u"/abc"_s) == Path(std::string("/abc")));
        QVERIFY(Path(u"/abc/"_s) == Path(u"/abc"_s));
        QVERIFY(Path(u"a//b/./c/../d"_s) == Path(u"a/b/d"_s));
    }

    void testIsEmpty() const
    {
        QCOMPARE(Path().isEmpty(), true);
        QCOMPARE(Path(u""_s).isEmpty(), true);

        QCOMPARE(Path(u"/"_s).isEmpty(), false);
        QCOMPARE(Path(u"a"_s).isEmpty(), false);
        QCOMPARE(Path(u"/a"_s).isEmpty(), false);
    }

    void testParentPath() const
    {
        QCOMPARE(Path().parentPath(), Path());
        QCOMPARE(Path(u"/"_s).parentPath(), Path());
        QCOMPARE(Path(u"a"_s).parentPath(), Path());
        QCOMPARE(Path(u"/a"_s).parentPath(), Path(u"/"_s));
        QCOMPARE(Path(u"a/b"_s).parentPath(), Path(u"a"_s));
        QCOMPARE(Path(u"a/b/c.bin"_s).parentPath(), Path(u"a/b"_s));
    }

    void testFilename() const
    {
        QCOMPARE(Path().filename(), QString());
        QCOMPARE(Path(u"a.bin"_s).filename(), u"a.bin"_s);
        QCOMPARE(Path(u"pack/sub/a.bin"_s).filename(), u"a.bin"_s);
    }

    void testHasAncestor() const
    {
        QCOMPARE(Path(u"/srv/dl/pack/a.bin"_s).hasAncestor(Path(u"/srv/dl"_s)), true);
        QCOMPARE(Path(u"/srv/dl"_s).hasAncestor(Path(u"/srv/dl"_s)), false);
        QCOMPARE(Path(u"/srv/dl2/a.bin"_s).hasAncestor(Path(u"/srv/dl"_s)), false);
        QCOMPARE(Path(u"/srv/dl/a.bin"_s).hasAncestor(Path()), false);
    }

    void testJoin() const
    {
        QCOMPARE((Path(u"/srv"_s) / Path(u"pack/a.bin"_s)), Path(u"/srv/pack/a.bin"_s));
        QCOMPARE((Path() / Path(u"a"_s)), Path(u"a"_s));
        QCOMPARE((Path(u"a"_s) / Path()), Path(u"a"_s));
        QCOMPARE((Path(u"/srv/a.bin"_s) + u".bak"), Path(u"/srv/a.bin.bak"_s));

        Path path {u"/srv"_s};
        path /= Path(u"dl"_s);
        QCOMPARE(path, Path(u"/srv/dl"_s));
    }

    void testFindRootFolder() const
    {
        QCOMPARE(Path::findRootFolder({}), Path());
        QCOMPARE(Path::findRootFolder({Path(u"a.bin"_s)}), Path());
        QCOMPARE(Path::findRootFolder({Path(u"pack/a.bin"_s), Path(u"pack/sub/b.bin"_s)}), Path(u"pack"_s));
        QCOMPARE(Path::findRootFolder({Path(u"pack/a.bin"_s), Path(u"b.bin"_s)}), Path());
        QCOMPARE(Path::findRootFolder({Path(u"pack/a.bin"_s), Path(u"other/b.bin"_s)}), Path());
    }
};

QTEST_APPLESS_MAIN(TestPath)
#include "testpath.moc"
