/* Class MkrConfig
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

// Qt
#include <QFileInfo>
#include <QSettings>
#include <QStringList>

// Mkr
#include "mkrlogging.h"
#include "mkrexitcodes.h"
#include "mkrlocaldefs.h"
#include "mkrconfig.h"

/*! \class MkrConfig
 *  \brief The relay's view of the Machinekit INI file.
 *
 * The local instance UUID and the remote access flag are read from the [MACHINEKIT] section. The
 * optional [MKRELAY] section sets the HTTP port and any additional service types to browse.
 * Command line overrides are applied with the setters before Validate is called.
*/

static QString StripBraces(const QString &Uuid)
{
    QString result = Uuid.trimmed();
    if (result.startsWith('{'))
        result = result.mid(1);
    if (result.endsWith('}'))
        result.chop(1);
    return result.trimmed();
}

/// Return the configuration path, in order of preference from the command line, the environment or the default.
QString MkrConfig::ResolvePath(const QString &CommandLinePath)
{
    if (!CommandLinePath.isEmpty())
        return CommandLinePath;

    QString environment = qgetenv(MKR_INI_ENVIRONMENT);
    if (!environment.isEmpty())
        return environment;

    return MKR_DEFAULT_INI;
}

MkrConfig::MkrConfig()
  : m_path(),
    m_errorString(),
    m_uuid(),
    m_remote(false),
    m_port(MKR_DEFAULT_PORT),
    m_browseTypes()
{
    m_browseTypes << MKR_DEFAULT_TYPE;
}

int MkrConfig::Load(const QString &Path)
{
    m_path = Path;

    QFileInfo info(Path);
    if (!info.exists() || !info.isFile() || !info.isReadable())
    {
        m_errorString = QStringLiteral("Configuration file '%1' is missing or unreadable").arg(Path);
        LOG(VB_GENERAL, LOG_ERR, m_errorString);
        return MKR_EXIT_INVALID_CONFIG;
    }

    QSettings settings(Path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError)
    {
        m_errorString = QStringLiteral("Failed to parse configuration file '%1'").arg(Path);
        LOG(VB_GENERAL, LOG_ERR, m_errorString);
        return MKR_EXIT_INVALID_CONFIG;
    }

    m_uuid   = StripBraces(settings.value(MKR_INI_UUID).toString());
    m_remote = settings.value(MKR_INI_REMOTE, 0).toInt() != 0;

    if (settings.contains(MKR_INI_PORT))
    {
        bool ok = false;
        int port = settings.value(MKR_INI_PORT).toInt(&ok);
        if (ok && port >= 0 && port < 65536)
            m_port = port;
        else
            LOG(VB_GENERAL, LOG_WARNING, QStringLiteral("Ignoring invalid port '%1'").arg(settings.value(MKR_INI_PORT).toString()));
    }

    // an unquoted comma separated value is returned as a list
    QVariant browse = settings.value(MKR_INI_BROWSE);
    if (browse.type() == QVariant::StringList)
        AddBrowseTypes(browse.toStringList().join(','));
    else
        AddBrowseTypes(browse.toString());

    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Loaded configuration from '%1'").arg(Path));
    return MKR_EXIT_OK;
}

int MkrConfig::Validate(void)
{
    if (m_uuid.isEmpty())
    {
        m_errorString = QStringLiteral("No MKUUID found in '%1'").arg(m_path);
        return MKR_EXIT_INVALID_CONFIG;
    }

    if (!m_remote)
    {
        m_errorString = QStringLiteral("Remote communication is disabled in '%1' - set REMOTE=1").arg(m_path);
        return MKR_EXIT_REMOTE_DISABLED;
    }

    if (m_port < 0 || m_port > 65535)
    {
        m_errorString = QStringLiteral("Invalid HTTP port %1").arg(m_port);
        return MKR_EXIT_INVALID_CONFIG;
    }

    m_errorString = QString();
    return MKR_EXIT_OK;
}

QString MkrConfig::GetErrorString(void) const
{
    return m_errorString;
}

QString MkrConfig::GetPath(void) const
{
    return m_path;
}

QString MkrConfig::GetUuid(void) const
{
    return m_uuid;
}

bool MkrConfig::GetRemoteEnabled(void) const
{
    return m_remote;
}

int MkrConfig::GetPort(void) const
{
    return m_port;
}

QList<QByteArray> MkrConfig::GetBrowseTypes(void) const
{
    return m_browseTypes;
}

void MkrConfig::SetUuid(const QString &Uuid)
{
    m_uuid = StripBraces(Uuid);
}

void MkrConfig::SetPort(int Port)
{
    m_port = Port;
}

void MkrConfig::AddBrowseTypes(const QString &Types)
{
    foreach (const QString &type, Types.split(',', QString::SkipEmptyParts))
    {
        QByteArray trimmed = type.trimmed().toLatin1();
        if (!trimmed.isEmpty() && !m_browseTypes.contains(trimmed))
            m_browseTypes << trimmed;
    }
}
