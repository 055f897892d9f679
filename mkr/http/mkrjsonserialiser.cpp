/* Class MkrJSONSerialiser
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
#include <QJsonDocument>

// Mkr
#include "mkrjsonserialiser.h"

/*! \class MkrJSONSerialiser
 *  \brief Serialise a QVariant into compact JSON text.
 *
 * The output is always terminated with a newline. An empty map serialises to '{}'.
*/

HTTPResponseType MkrJSONSerialiser::ResponseType(void) const
{
    return HTTPResponseJSON;
}

void MkrJSONSerialiser::Serialise(QByteArray &Dest, const QVariant &Data) const
{
    Dest = QJsonDocument::fromVariant(Data).toJson(QJsonDocument::Compact);
    if (Dest.isEmpty())
        Dest = QByteArray("{}");
    Dest.append('\n');
}
