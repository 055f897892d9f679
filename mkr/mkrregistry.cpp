/* Class MkrRegistry
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

// Mkr
#include "mkrlogging.h"
#include "mkrregistry.h"

/*! \class MkrRegistry
 *  \brief The set of live services announced by this machinekit instance.
 *
 * Services are keyed on their service id ('command', 'status' etc) and the first advertisement
 * for a given id wins until it is removed again. Advertisements that are incomplete or that are
 * owned by another instance (a different uuid) are ignored without complaint - they are expected
 * on any shared network segment.
 *
 * Every method takes the same lock for the duration of a single map operation. Lookups return copies
 * so that callers never hold on to registry state.
*/
MkrRegistry::MkrRegistry(const QString &SelfUuid)
  : m_selfUuid(SelfUuid),
    m_lock(),
    m_services()
{
    LOG(VB_GENERAL, LOG_INFO, QString("Registry accepting services for '%1'").arg(m_selfUuid));
}

MkrRegistry::~MkrRegistry()
{
    QMutexLocker locker(&m_lock);
    m_services.clear();
}

bool MkrRegistry::Accept(const QVariantMap &Attributes)
{
    MkrServiceDescriptor descriptor(Attributes);
    if (!descriptor.IsValid() || descriptor.GetOwnerUuid() != m_selfUuid)
        return false;

    QMutexLocker locker(&m_lock);
    if (m_services.contains(descriptor.GetServiceId()))
        return false;

    m_services.insert(descriptor.GetServiceId(), descriptor);
    locker.unlock();

    LOG(VB_DISCOVERY, LOG_DEBUG, QString("Added '%1' (%2) at '%3'")
        .arg(descriptor.GetServiceId(), descriptor.GetName(), descriptor.GetConnectionUri()));
    return true;
}

bool MkrRegistry::Remove(const QString &Name)
{
    QMutexLocker locker(&m_lock);
    QMap<QString,MkrServiceDescriptor>::iterator it = m_services.begin();
    for ( ; it != m_services.end(); ++it)
    {
        if (it.value().GetName() == Name)
        {
            QString serviceid = it.key();
            m_services.erase(it);
            locker.unlock();
            LOG(VB_DISCOVERY, LOG_DEBUG, QString("Removed '%1' (%2)").arg(serviceid, Name));
            return true;
        }
    }

    return false;
}

QMap<QString,MkrServiceDescriptor> MkrRegistry::LookupAll(void)
{
    QMutexLocker locker(&m_lock);
    return m_services;
}

bool MkrRegistry::LookupByServiceId(const QString &ServiceId, MkrServiceDescriptor &Descriptor)
{
    QMutexLocker locker(&m_lock);
    QMap<QString,MkrServiceDescriptor>::const_iterator it = m_services.constFind(ServiceId);
    if (it == m_services.constEnd())
        return false;

    Descriptor = it.value();
    return true;
}

/// Return every service whose instance id or owner uuid matches Key.
QMap<QString,MkrServiceDescriptor> MkrRegistry::LookupByOwnerKey(const QString &Key)
{
    QMap<QString,MkrServiceDescriptor> result;

    QMutexLocker locker(&m_lock);
    QMap<QString,MkrServiceDescriptor>::const_iterator it = m_services.constBegin();
    for ( ; it != m_services.constEnd(); ++it)
        if (it.value().GetInstanceId() == Key || it.value().GetOwnerUuid() == Key)
            result.insert(it.key(), it.value());
    return result;
}

QString MkrRegistry::GetSelfUuid(void) const
{
    return m_selfUuid;
}

int MkrRegistry::Count(void)
{
    QMutexLocker locker(&m_lock);
    return m_services.size();
}
