#ifndef MKRREGISTRY_H
#define MKRREGISTRY_H

// Qt
#include <QMap>
#include <QMutex>

// Mkr
#include "mkrservicedescriptor.h"

class MkrRegistry
{
  public:
    explicit MkrRegistry(const QString &SelfUuid);
   ~MkrRegistry();

    bool                               Accept            (const QVariantMap &Attributes);
    bool                               Remove            (const QString &Name);
    QMap<QString,MkrServiceDescriptor> LookupAll         (void);
    bool                               LookupByServiceId (const QString &ServiceId, MkrServiceDescriptor &Descriptor);
    QMap<QString,MkrServiceDescriptor> LookupByOwnerKey  (const QString &Key);
    QString                            GetSelfUuid       (void) const;
    int                                Count             (void);

  private:
    Q_DISABLE_COPY(MkrRegistry)
    QString                            m_selfUuid;
    QMutex                             m_lock;
    QMap<QString,MkrServiceDescriptor> m_services;
};

#endif // MKRREGISTRY_H
