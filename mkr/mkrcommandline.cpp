/* Class MkrCommandLine
*
* This file is part of the mkrelay project.
*
* Copyright (C) Mark Kendall 2012-18
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301,
* USA.
*/

// Std
#include <iostream>

// Qt
#include <QCoreApplication>
#include <QStringList>

// Mkr
#include "mkrexitcodes.h"
#include "mkrlocaldefs.h"
#include "mkrcommandline.h"

using namespace std;

MkrArgument::MkrArgument()
  : m_value(),
    m_helpText(),
    m_exitImmediately(false),
    m_flags(MkrCommandLine::None)
{
}

MkrArgument::MkrArgument(const QVariant &Default, const QString &HelpText, MkrCommandLine::Options Flags, bool Exit)
  : m_value(Default),
    m_helpText(HelpText),
    m_exitImmediately(Exit),
    m_flags(Flags)
{
}

/*! \class MkrCommandLine
 *  \brief Simple command line parser.
 *
 * Options are registered with a comma separated list of keys (e.g. "h,help") and a default value.
 * The type of the default decides how the option is parsed: booleans are switches, integers must
 * parse as integers and everything else takes a string value. Values may be given as
 * '--key value' or '--key=value'.
 *
 * The standard options are added by passing the appropriate MkrCommandLine::Option flags to the
 * constructor.
*/
MkrCommandLine::MkrCommandLine(MkrCommandLine::Options Flags)
  : m_options(),
    m_aliases(),
    m_help(),
    m_maxLength(0)
{
    if (Flags & MkrCommandLine::Help)
        Add(QStringLiteral("h,help,?"),  QVariant(false), QStringLiteral("Display full usage information."), MkrCommandLine::Help, true);
    if (Flags & MkrCommandLine::Version)
        Add(QStringLiteral("version"),   QVariant(false), QStringLiteral("Display version information."), MkrCommandLine::Version, true);
    if (Flags & MkrCommandLine::LogLevel)
        Add(QStringLiteral("l,loglevel"), QStringLiteral("info"), QStringLiteral("Set the logging level (err, warning, notice, info, debug...)."), MkrCommandLine::LogLevel);
    if (Flags & MkrCommandLine::Verbose)
        Add(QStringLiteral("v,verbose"), QStringLiteral("general"), QStringLiteral("Set the verbose masks (general, network, discovery, http, all, none...). Use 'help' for a full list."), MkrCommandLine::Verbose);
    if (Flags & MkrCommandLine::LogFile)
        Add(QStringLiteral("logfile"),   QString(), QStringLiteral("Also log to the given file."), MkrCommandLine::LogFile);
    if (Flags & MkrCommandLine::Ini)
        Add(QStringLiteral("ini"),       QString(), QStringLiteral("Machinekit configuration file (overrides MACHINEKIT_INI)."), MkrCommandLine::Ini);
    if (Flags & MkrCommandLine::Port)
        Add(QStringLiteral("port"),      QVariant((int)0), QStringLiteral("HTTP port to listen on (default 8088)."), MkrCommandLine::Port);
    if (Flags & MkrCommandLine::Browse)
        Add(QStringLiteral("browse"),    QString(), QStringLiteral("Comma separated list of additional service types to browse."), MkrCommandLine::Browse);
    if (Flags & MkrCommandLine::Uuid)
        Add(QStringLiteral("uuid"),      QString(), QStringLiteral("Override the local instance UUID."), MkrCommandLine::Uuid);
}

void MkrCommandLine::Add(const QString &Keys, const QVariant &Default, const QString &HelpText, MkrCommandLine::Options Flags, bool ExitImmediately)
{
    QStringList keys = Keys.split(',', QString::SkipEmptyParts);
    if (keys.isEmpty())
        return;

    QString primary = keys.first();
    if (m_options.contains(primary))
    {
        LOG(VB_GENERAL, LOG_ERR, QStringLiteral("Command line option '%1' already registered").arg(primary));
        return;
    }

    QStringList formatted;
    foreach (const QString &key, keys)
    {
        if (m_aliases.contains(key))
        {
            LOG(VB_GENERAL, LOG_ERR, QStringLiteral("Command line alias '%1' already registered").arg(key));
            continue;
        }

        m_aliases.insert(key, primary);
        formatted << (key.size() > 1 ? QStringLiteral("--") : QStringLiteral("-")) + key;
    }

    QString helpkey = formatted.join(QStringLiteral(", "));
    if (Default.type() != QVariant::Bool)
        helpkey += QStringLiteral(" <value>");

    m_options.insert(primary, MkrArgument(Default, HelpText, Flags, ExitImmediately));
    m_help.insert(helpkey, HelpText);
    m_maxLength = qMax(m_maxLength, helpkey.size());
}

QString MkrCommandLine::HelpText(void) const
{
    QString result = QStringLiteral("Usage: %1 [options]\n\n").arg(MKR_MKRELAY);

    QStringList keys = m_help.keys();
    keys.sort();
    foreach (const QString &key, keys)
        result += QStringLiteral("  %1  %2\n").arg(key, -m_maxLength).arg(m_help.value(key));
    return result;
}

/*! \brief Parse the command line.
 *
 * Returns MKR_EXIT_OK on success. Exit is set if the caller should exit immediately (for help
 * or version information) with the returned code.
*/
int MkrCommandLine::Evaluate(int argc, const char * const *argv, bool &Exit)
{
    Exit = false;
    bool printhelp    = false;
    bool printversion = false;

    for (int i = 1; i < argc; ++i)
    {
        QString arg = QString::fromLocal8Bit(argv[i]);
        if (!arg.startsWith('-') || arg.size() < 2)
        {
            cerr << "Unexpected argument '" << arg.toLocal8Bit().constData() << "'" << endl;
            return MKR_EXIT_INVALID_CMDLINE;
        }

        // strip leading dashes and split any inline value
        QString key = arg.mid(arg.startsWith(QStringLiteral("--")) ? 2 : 1);
        QString value;
        bool    hasvalue = false;
        int     index    = key.indexOf('=');
        if (index > -1)
        {
            value    = key.mid(index + 1);
            key      = key.left(index);
            hasvalue = true;
        }

        QHash<QString,QString>::const_iterator alias = m_aliases.constFind(key);
        if (alias == m_aliases.constEnd())
        {
            cerr << "Unknown command line option '" << arg.toLocal8Bit().constData() << "'" << endl;
            return MKR_EXIT_INVALID_CMDLINE;
        }

        MkrArgument &argument = m_options[alias.value()];

        if (argument.m_value.type() == QVariant::Bool)
        {
            if (hasvalue)
            {
                cerr << "Option '" << key.toLocal8Bit().constData() << "' does not take a value" << endl;
                return MKR_EXIT_INVALID_CMDLINE;
            }

            argument.m_value = QVariant(true);
        }
        else
        {
            if (!hasvalue)
            {
                if (i + 1 >= argc || QString::fromLocal8Bit(argv[i + 1]).startsWith(QStringLiteral("--")))
                {
                    cerr << "Missing value for option '" << key.toLocal8Bit().constData() << "'" << endl;
                    return MKR_EXIT_INVALID_CMDLINE;
                }
                value = QString::fromLocal8Bit(argv[++i]);
            }

            if (argument.m_value.type() == QVariant::Int)
            {
                bool ok = false;
                int number = value.toInt(&ok);
                if (!ok)
                {
                    cerr << "Invalid number '" << value.toLocal8Bit().constData() << "' for option '" << key.toLocal8Bit().constData() << "'" << endl;
                    return MKR_EXIT_INVALID_CMDLINE;
                }
                argument.m_value = QVariant(number);
            }
            else
            {
                argument.m_value = QVariant(value);
            }
        }

        if (argument.m_flags & MkrCommandLine::Verbose)
        {
            int result = ParseVerboseArgument(argument.m_value.toString());
            if (result != MKR_EXIT_OK)
                return result;
        }

        if (argument.m_flags & MkrCommandLine::LogLevel)
        {
            if (GetLogLevel(argument.m_value.toString()) == LOG_UNKNOWN)
            {
                cerr << "Unknown log level '" << value.toLocal8Bit().constData() << "'" << endl;
                return MKR_EXIT_INVALID_CMDLINE;
            }
        }

        if (argument.m_flags & MkrCommandLine::Help)
            printhelp = true;
        if (argument.m_flags & MkrCommandLine::Version)
            printversion = true;
        if (argument.m_exitImmediately)
            Exit = true;
    }

    if (printhelp)
        cout << HelpText().toLocal8Bit().constData();
    if (printversion)
        cout << MKR_MKRELAY.toLocal8Bit().constData() << " " << MKR_VERSION.toLocal8Bit().constData() << endl;

    return MKR_EXIT_OK;
}

QVariant MkrCommandLine::GetValue(const QString &Key) const
{
    QHash<QString,QString>::const_iterator alias = m_aliases.constFind(Key);
    if (alias == m_aliases.constEnd())
        return QVariant();

    return m_options.value(alias.value()).m_value;
}
