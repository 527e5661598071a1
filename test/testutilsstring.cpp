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

#include <optional>

#include <QObject>
#include <QTest>

#include "base/global.h"
#include "base/utils/string.h"

class TestUtilsString final : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(TestUtilsString)

public:
    TestUtilsString() = default;

private slots:
    void testUnquote() const
    {
        QCOMPARE(Utils::String::unquote(u""_s), u""_s);
        QCOMPARE(Utils::String::unquote(u"\""_s), u"\""_s);
        QCOMPARE(Utils::String::unquote(u"\"\""_s), u""_s);
        QCOMPARE(Utils::String::unquote(u"\"abc\""_s), u"abc"_s);
        QCOMPARE(Utils::String::unquote(u"'abc'"_s), u"'abc'"_s);
        QCOMPARE(Utils::String::unquote(u"'abc'"_s, u"'\""_s), u"abc"_s);
    }

    void testParseIntList() const
    {
        using IntList = QList<int>;

        QCOMPARE(Utils::String::parseIntList(u""_s), std::optional<IntList>(IntList()));
        QCOMPARE(Utils::String::parseIntList(u"1"_s), std::optional<IntList>(IntList {1}));
        QCOMPARE(Utils::String::parseIntList(u"1,3, 4"_s), std::optional<IntList>(IntList {1, 3, 4}));
        QCOMPARE(Utils::String::parseIntList(u"1,,2,"_s), std::optional<IntList>(IntList {1, 2}));
        QCOMPARE(Utils::String::parseIntList(u"1;2"_s, u';'), std::optional<IntList>(IntList {1, 2}));
        QCOMPARE(Utils::String::parseIntList(u"1,a"_s), std::nullopt);
        QCOMPARE(Utils::String::parseIntList(u"1;2"_s), std::nullopt);
    }

    void testJoinIntList() const
    {
        QCOMPARE(Utils::String::joinIntList({}), u""_s);
        QCOMPARE(Utils::String::joinIntList({4}), u"4"_s);
        QCOMPARE(Utils::String::joinIntList({0, 2, 5}), u"0, 2, 5"_s);
        QCOMPARE(Utils::String::joinIntList({0, 2}, u","_s), u"0,2"_s);
    }
};

QTEST_APPLESS_MAIN(TestUtilsString)
#include "testutilsstring.moc"
