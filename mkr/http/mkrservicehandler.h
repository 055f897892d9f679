#ifndef MKRSERVICEHANDLER_H
#define MKRSERVICEHANDLER_H

// Qt
#include <QVariantMap>

// Mkr
#include "mkrhttphandler.h"

class MkrRegistry;

class MkrServiceHandler : public MkrHTTPHandler
{
  public:
    explicit MkrServiceHandler(MkrRegistry *Registry);
   ~MkrServiceHandler() = default;

    void        ProcessHTTPRequest (const QString &PeerAddress, int PeerPort, const QString &LocalAddress, int LocalPort, MkrHTTPRequest &Request) override;
    QVariantMap Lookup             (const QString &Key) const;

  private:
    MkrRegistry *m_registry;
};

#endif // MKRSERVICEHANDLER_H
