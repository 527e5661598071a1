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

#include "cmdoptions.h"

#include <cstdio>

#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QProcessEnvironment>
#include <QStringView>

#include "base/global.h"
#include "base/utils/fs.h"
#include "base/utils/string.h"

namespace
{
    const int USAGE_INDENTATION = 4;
    const int USAGE_TEXT_COLUMN = 31;
    const int WRAP_AT_COLUMN = 80;

    // Base option class. Encapsulates name operations.
    class Option
    {
    protected:
        explicit constexpr Option(const QStringView name, const QChar shortcut = QChar::Null)
            : m_name {name}
            , m_shortcut {shortcut}
        {
        }

        QString fullParameter() const
        {
            return u"--" + m_name.toString();
        }

        QString shortcutParameter() const
        {
            return u"-" + m_shortcut;
        }

        bool hasShortcut() const
        {
            return !m_shortcut.isNull();
        }

        QString envVarName() const
        {
            return u"SWQ_"
                   + m_name.toString().toUpper().replace(u'-', u'_');
        }

    public:
        static QString padUsageText(const QString &usage)
        {
            QString res = QString(USAGE_INDENTATION, u' ') + usage;

            if ((USAGE_TEXT_COLUMN - usage.length() - 4) > 0)
                return res + QString((USAGE_TEXT_COLUMN - usage.length() - 4), u' ');

            return res;
        }

    private:
        const QStringView m_name;
        const QChar m_shortcut;
    };

    // Boolean option.
    class BoolOption : protected Option
    {
    public:
        explicit constexpr BoolOption(const QStringView name, const QChar shortcut = QChar::Null)
            : Option {name, shortcut}
        {
        }

        bool value(const QProcessEnvironment &env) const
        {
            const QString val = env.value(envVarName());
            // we accept "1" and "true" (upper or lower cased) as boolean 'true' values
            return ((val == u"1") || (val.toUpper() == u"TRUE"));
        }

        QString usage() const
        {
            QString res;
            if (hasShortcut())
                res += shortcutParameter() + u" | ";
            res += fullParameter();
            return padUsageText(res);
        }

        friend bool operator==(const BoolOption &option, const QString &arg)
        {
            return (option.hasShortcut() && ((arg.size() == 2) && (option.shortcutParameter() == arg)))
                   || (option.fullParameter() == arg);
        }
    };

    // Option with string value. May not have a shortcut
    struct StringOption : protected Option
    {
    public:
        explicit constexpr StringOption(const QStringView name)
            : Option {name, QChar::Null}
        {
        }

        QString value(const QString &arg) const
        {
            const qsizetype separatorIndex = arg.indexOf(u'=');
            if (separatorIndex > 0)
                return Utils::String::unquote(arg.mid(separatorIndex + 1), u"'\""_s);
            throw CommandLineParameterError(QCoreApplication::translate("CMD Options", "Parameter '%1' must follow syntax '%1=%2'",
                                                        "e.g. Parameter '--save-path' must follow syntax '--save-path=value'")
                                            .arg(fullParameter(), u"<value>"_s));
        }

        QString value(const QProcessEnvironment &env, const QString &defaultValue = {}) const
        {
            const QString val = env.value(envVarName());
            return val.isEmpty() ? defaultValue : Utils::String::unquote(val, u"'\""_s);
        }

        QString usage(const QString &valueName) const
        {
            return padUsageText(parameterAssignment() + u'<' + valueName + u'>');
        }

        friend bool operator==(const StringOption &option, const QString &arg)
        {
            return arg.startsWith(option.parameterAssignment());
        }

    protected:
        QString parameterName() const
        {
            return fullParameter();
        }

        QString variableName() const
        {
            return envVarName();
        }

    private:
        QString parameterAssignment() const
        {
            return fullParameter() + u'=';
        }
    };

    // Option with integer value. May not have a shortcut
    class IntOption : protected StringOption
    {
    public:
        explicit constexpr IntOption(const QStringView name)
            : StringOption {name}
        {
        }

        using StringOption::usage;

        int value(const QString &arg) const
        {
            const std::optional<int> res = Utils::String::parseInt(StringOption::value(arg));
            if (!res)
            {
                throw CommandLineParameterError(QCoreApplication::translate("CMD Options", "Parameter '%1' must follow syntax '%1=%2'",
                                                            "e.g. Parameter '--max-active' must follow syntax '--max-active=<value>'")
                                                .arg(parameterName(), u"<integer value>"_s));
            }
            return *res;
        }

        int value(const QProcessEnvironment &env, const int defaultValue) const
        {
            const QString val = env.value(variableName());
            if (val.isEmpty())
                return defaultValue;

            const std::optional<int> res = Utils::String::parseInt(val);
            if (!res)
            {
                qDebug() << QCoreApplication::translate("CMD Options", "Expected integer number in environment variable '%1', but got '%2'")
                    .arg(variableName(), val);
                return defaultValue;
            }
            return *res;
        }

        friend bool operator==(const IntOption &option, const QString &arg)
        {
            return (static_cast<const StringOption &>(option) == arg);
        }
    };

    // Comma separated list of integers. May not have a shortcut
    class IntListOption : protected StringOption
    {
    public:
        explicit constexpr IntListOption(const QStringView name)
            : StringOption {name}
        {
        }

        using StringOption::usage;

        QList<int> value(const QString &arg) const
        {
            const std::optional<QList<int>> res = Utils::String::parseIntList(StringOption::value(arg));
            if (!res)
            {
                throw CommandLineParameterError(QCoreApplication::translate("CMD Options", "Parameter '%1' must follow syntax '%1=%2'",
                                                            "e.g. Parameter '--select' must follow syntax '--select=<i,j,...>'")
                                                .arg(parameterName(), u"<i,j,...>"_s));
            }
            return *res;
        }

        std::optional<QList<int>> value(const QProcessEnvironment &env) const
        {
            const QString val = env.value(variableName());
            if (val.isEmpty())
                return std::nullopt;

            const std::optional<QList<int>> res = Utils::String::parseIntList(val);
            if (!res)
            {
                qDebug() << QCoreApplication::translate("CMD Options", "Expected comma separated numbers in environment variable '%1', but got '%2'")
                    .arg(variableName(), val);
            }
            return res;
        }

        friend bool operator==(const IntListOption &option, const QString &arg)
        {
            return (static_cast<const StringOption &>(option) == arg);
        }
    };

    constexpr const BoolOption SHOW_HELP_OPTION {u"help", u'h'};
    constexpr const BoolOption SHOW_VERSION_OPTION {u"version", u'v'};
    constexpr const StringOption PROFILE_OPTION {u"profile"};
    constexpr const StringOption CONFIGURATION_OPTION {u"configuration"};
    constexpr const StringOption SAVE_PATH_OPTION {u"save-path"};
    constexpr const StringOption OWNER_OPTION {u"owner"};
    constexpr const StringOption NAME_OPTION {u"name"};
    constexpr const IntListOption SELECT_OPTION {u"select"};
    constexpr const IntOption MAX_ACTIVE_OPTION {u"max-active"};
    constexpr const BoolOption AUTO_SELECT_OPTION {u"auto-select"};
    constexpr const BoolOption EXIT_WHEN_DONE_OPTION {u"exit-when-done"};
}

SwqCommandLineParameters::SwqCommandLineParameters(const QProcessEnvironment &env)
    : autoSelect(AUTO_SELECT_OPTION.value(env))
    , exitWhenDone(EXIT_WHEN_DONE_OPTION.value(env))
    , maxActive(MAX_ACTIVE_OPTION.value(env, -1))
    , profileDir(Utils::Fs::toAbsolutePath(Path(PROFILE_OPTION.value(env))))
    , configurationName(CONFIGURATION_OPTION.value(env))
    , savePath(Path(SAVE_PATH_OPTION.value(env)))
    , ownerId(OWNER_OPTION.value(env))
    , name(NAME_OPTION.value(env))
    , selectedIndices(SELECT_OPTION.value(env))
{
}

SwqCommandLineParameters parseCommandLine(const QStringList &args)
{
    SwqCommandLineParameters result {QProcessEnvironment::systemEnvironment()};

    for (int i = 1; i < args.count(); ++i)
    {
        const QString &arg = args[i];

        if ((arg.startsWith(u"--") && !arg.endsWith(TORRENT_FILE_EXTENSION))
            || (arg.startsWith(u'-') && (arg.size() == 2)))
        {
            // Parse known parameters
            if (arg == SHOW_HELP_OPTION)
            {
                result.showHelp = true;
            }
            else if (arg == SHOW_VERSION_OPTION)
            {
                result.showVersion = true;
            }
            else if (arg == PROFILE_OPTION)
            {
                result.profileDir = Utils::Fs::toAbsolutePath(Path(PROFILE_OPTION.value(arg)));
            }
            else if (arg == CONFIGURATION_OPTION)
            {
                result.configurationName = CONFIGURATION_OPTION.value(arg);
            }
            else if (arg == SAVE_PATH_OPTION)
            {
                result.savePath = Path(SAVE_PATH_OPTION.value(arg));
            }
            else if (arg == OWNER_OPTION)
            {
                result.ownerId = OWNER_OPTION.value(arg);
            }
            else if (arg == NAME_OPTION)
            {
                result.name = NAME_OPTION.value(arg);
            }
            else if (arg == SELECT_OPTION)
            {
                result.selectedIndices = SELECT_OPTION.value(arg);
            }
            else if (arg == MAX_ACTIVE_OPTION)
            {
                result.maxActive = MAX_ACTIVE_OPTION.value(arg);
                if ((result.maxActive < 1) || (result.maxActive > 10))
                {
                    throw CommandLineParameterError(QCoreApplication::translate("CMD Options", "%1 must specify a number from 1 to 10.")
                                                    .arg(u"--max-active"_s));
                }
            }
            else if (arg == AUTO_SELECT_OPTION)
            {
                result.autoSelect = true;
            }
            else if (arg == EXIT_WHEN_DONE_OPTION)
            {
                result.exitWhenDone = true;
            }
            else
            {
                // Unknown argument
                result.unknownParameter = arg;
                break;
            }
        }
        else
        {
            const QFileInfo torrentPath {arg};
            if (!arg.startsWith(MAGNET_URI_PREFIX) && torrentPath.exists())
                result.sources += torrentPath.absoluteFilePath();
            else
                result.sources += arg;
        }
    }

    return result;
}

QString wrapText(const QString &text, int initialIndentation = USAGE_TEXT_COLUMN, int wrapAtColumn = WRAP_AT_COLUMN)
{
    QStringList words = text.split(u' ');
    QStringList lines = {words.first()};
    int currentLineMaxLength = wrapAtColumn - initialIndentation;

    for (const QString &word : asConst(words.mid(1)))
    {
        if (lines.last().length() + word.length() + 1 < currentLineMaxLength)
        {
            lines.last().append(u' ' + word);
        }
        else
        {
            lines.append(QString(initialIndentation, u' ') + word);
            currentLineMaxLength = wrapAtColumn;
        }
    }

    return lines.join(u'\n');
}

QString makeUsage(const QString &prgName)
{
    const QString indentation {USAGE_INDENTATION, u' '};

    const QString text = QCoreApplication::translate("CMD Options", "Usage:") + u'\n'
        + indentation + prgName + u' ' + QCoreApplication::translate("CMD Options", "[options] [(<torrent file> | <magnet link>)...]") + u'\n'

        + QCoreApplication::translate("CMD Options", "Options:") + u'\n'
        + SHOW_HELP_OPTION.usage() + wrapText(QCoreApplication::translate("CMD Options", "Display this help message and exit")) + u'\n'
        + SHOW_VERSION_OPTION.usage() + wrapText(QCoreApplication::translate("CMD Options", "Display program version and exit")) + u'\n'
    //: Use appropriate short form or abbreviation of "directory"
        + PROFILE_OPTION.usage(QCoreApplication::translate("CMD Options", "dir"))
        + wrapText(QCoreApplication::translate("CMD Options", "Store configuration, job table and logs in <dir>")) + u'\n'
        + CONFIGURATION_OPTION.usage(QCoreApplication::translate("CMD Options", "name"))
        + wrapText(QCoreApplication::translate("CMD Options", "Store configuration files in directories swarmqueue_<name>")) + u'\n'
        + MAX_ACTIVE_OPTION.usage(QCoreApplication::translate("CMD Options", "n"))
        + wrapText(QCoreApplication::translate("CMD Options", "Number of jobs allowed to transfer at the same time (1 to 10)")) + u'\n'
        + AUTO_SELECT_OPTION.usage()
        + wrapText(QCoreApplication::translate("CMD Options", "Download all files of a job when it asks which files to fetch")) + u'\n'
        + EXIT_WHEN_DONE_OPTION.usage()
        + wrapText(QCoreApplication::translate("CMD Options", "Exit once no job is queued or transferring anymore")) + u'\n'
        + Option::padUsageText(QCoreApplication::translate("CMD Options", "files or links"))
        + wrapText(QCoreApplication::translate("CMD Options", "Queue the given torrent files or magnet links")) + u'\n'
        + u'\n'

        + wrapText(QCoreApplication::translate("CMD Options", "Options when adding new jobs:"), 0) + u'\n'
        + SAVE_PATH_OPTION.usage(QCoreApplication::translate("CMD Options", "path")) + wrapText(QCoreApplication::translate("CMD Options", "Download folder")) + u'\n'
        + OWNER_OPTION.usage(QCoreApplication::translate("CMD Options", "id"))
        + wrapText(QCoreApplication::translate("CMD Options", "Owner the jobs belong to. Its stored download folder is used when no save path is given")) + u'\n'
        + NAME_OPTION.usage(QCoreApplication::translate("CMD Options", "name"))
        + wrapText(QCoreApplication::translate("CMD Options", "Display name of the job until the real name is known")) + u'\n'
        + SELECT_OPTION.usage(QCoreApplication::translate("CMD Options", "i,j,..."))
        + wrapText(QCoreApplication::translate("CMD Options", "Only download the files with these indices")) + u'\n'
        + u'\n'

        + wrapText(QCoreApplication::translate("CMD Options", "Option values may be supplied via environment variables. For option named "
                                "'parameter-name', environment variable name is 'SWQ_PARAMETER_NAME' (in upper "
                                "case, '-' replaced with '_'). To pass flag values, set the variable to '1' or "
                                "'TRUE'. For example, to download all files without asking: "), 0) + u'\n'
        + u"SWQ_AUTO_SELECT=1 " + prgName + u'\n'
        + wrapText(QCoreApplication::translate("CMD Options", "Command line parameters take precedence over environment variables"), 0) + u'\n';

    return text;
}

void displayUsage(const QString &prgName)
{
    printf("%s\n", qUtf8Printable(makeUsage(prgName)));
}
