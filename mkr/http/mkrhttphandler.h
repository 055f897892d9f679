#ifndef MKRHTTPHANDLER_H
#define MKRHTTPHANDLER_H

// Qt
#include <QString>

// Mkr
#include "mkrhttprequest.h"

class MkrHTTPHandler
{
  public:
    MkrHTTPHandler(const QString &Signature, const QString &Name);
    virtual ~MkrHTTPHandler() = default;

    QString             Signature          (void) const;
    QString             Name               (void) const;
    virtual void        ProcessHTTPRequest (const QString &PeerAddress, int PeerPort, const QString &LocalAddress, int LocalPort, MkrHTTPRequest &Request) = 0;

  protected:
    static void         HandleOptions      (MkrHTTPRequest &Request, int Allowed);
    static void         HandleNotAllowed   (MkrHTTPRequest &Request, int Allowed);

  protected:
    QString             m_signature;
    QString             m_name;
};

#endif // MKRHTTPHANDLER_H
