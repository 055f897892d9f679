/* Class MkrServiceMonitor
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
#include <QStringList>

// Mkr
#include "mkrlogging.h"
#include "mkrevent.h"
#include "mkrlocaldefs.h"
#include "mkrlocalcontext.h"
#include "mkrregistry.h"
#include "mkrbonjour.h"
#include "mkrservicemonitor.h"

/*! \class MkrServiceMonitor
 *  \brief Feeds discovery results into the registry.
 *
 * MkrBonjour runs in its own thread and posts MkrEvent's to this object. They are delivered
 * on the thread this object lives in, so the registry is only ever updated from one place
 * and never from within a dns_sd callback.
*/
MkrServiceMonitor::MkrServiceMonitor(MkrRegistry *Registry)
  : QObject(),
    m_registry(Registry),
    m_discoveryThread(nullptr)
{
}

MkrServiceMonitor::~MkrServiceMonitor()
{
    Stop();
}

void MkrServiceMonitor::Start(const QList<QByteArray> &Types)
{
    if (m_discoveryThread)
        Stop();

    QStringList types;
    foreach (const QByteArray &type, Types)
        types << type;
    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Browsing for '%1'").arg(types.join(QStringLiteral(", "))));

    m_discoveryThread = new MkrDiscoveryThread(this, Types);
    m_discoveryThread->start();
}

void MkrServiceMonitor::Stop(void)
{
    if (!m_discoveryThread)
        return;

    m_discoveryThread->quit();
    m_discoveryThread->wait();
    delete m_discoveryThread;
    m_discoveryThread = nullptr;
}

bool MkrServiceMonitor::event(QEvent *Event)
{
    if (Event && Event->type() == MkrEvent::MkrEventType)
    {
        MkrEvent *mkrevent = static_cast<MkrEvent*>(Event);
        int event = mkrevent->GetEvent();

        if (event == Mkr::ServiceDiscovered)
        {
            if (m_registry && m_registry->Accept(mkrevent->Data()))
                LOG(VB_DISCOVERY, LOG_INFO, QStringLiteral("Added '%1'").arg(mkrevent->Data().value(MKR_TXT_NAME).toString()));
            return true;
        }
        else if (event == Mkr::ServiceWentAway)
        {
            QString name = mkrevent->Data().value(MKR_TXT_NAME).toString();
            if (m_registry && m_registry->Remove(name))
                LOG(VB_DISCOVERY, LOG_INFO, QStringLiteral("Removed '%1'").arg(name));
            return true;
        }
    }

    return QObject::event(Event);
}
