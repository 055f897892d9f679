/* Class MkrQThread
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
#include "mkrqthread.h"

/*! \class MkrQThread
 *  \brief A named QThread that registers itself for logging.
 *
 * Subclasses create their thread-affine objects in Start and destroy them in Finish, both of which
 * are called from within the new thread. The thread then runs a standard Qt event loop.
*/
MkrQThread::MkrQThread(const QString &Name)
  : QThread()
{
    setObjectName(Name);
}

void MkrQThread::run(void)
{
    Initialise();
    Start();
    exec();
    Finish();
    Deinitialise();
}

void MkrQThread::Initialise(void)
{
    RegisterLoggingThread();
    LOG(VB_GENERAL, LOG_DEBUG, QString("Thread '%1' starting").arg(objectName()));
}

void MkrQThread::Deinitialise(void)
{
    LOG(VB_GENERAL, LOG_DEBUG, QString("Thread '%1' exiting").arg(objectName()));
    DeregisterLoggingThread();
}
