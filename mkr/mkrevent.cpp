/* Class MkrEvent
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
#include "mkrevent.h"

QEvent::Type MkrEvent::MkrEventType = (QEvent::Type)QEvent::registerEventType();

/*! \class MkrEvent
 *  \brief A general purpose event object.
 *
 * MkrEvent carries one of the Mkr::Actions values plus an optional map of data. It is the
 * only thing that crosses from the Discovery thread to the registry owner and is always
 * delivered with QCoreApplication::postEvent, which takes ownership.
*/
MkrEvent::MkrEvent(int Event, const QVariantMap &Data)
  : QEvent(MkrEventType),
    m_event(Event),
    m_data(Data)
{
}

int MkrEvent::GetEvent(void) const
{
    return m_event;
}

QVariantMap& MkrEvent::Data(void)
{
    return m_data;
}
