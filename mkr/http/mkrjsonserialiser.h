#ifndef MKRJSONSERIALISER_H
#define MKRJSONSERIALISER_H

// Qt
#include <QVariant>
#include <QByteArray>

// Mkr
#include "mkrhttprequest.h"

class MkrJSONSerialiser
{
  public:
    MkrJSONSerialiser() = default;
   ~MkrJSONSerialiser() = default;

    HTTPResponseType ResponseType (void) const;
    void             Serialise    (QByteArray &Dest, const QVariant &Data) const;
};

#endif // MKRJSONSERIALISER_H
