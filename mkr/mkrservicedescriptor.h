#ifndef MKRSERVICEDESCRIPTOR_H
#define MKRSERVICEDESCRIPTOR_H

// Qt
#include <QString>
#include <QVariant>

class MkrServiceDescriptor
{
  public:
    MkrServiceDescriptor();
    explicit MkrServiceDescriptor(const QVariantMap &Attributes);
   ~MkrServiceDescriptor() = default;

    bool        IsValid          (void) const;
    QString     GetName          (void) const;
    QString     GetServiceId     (void) const;
    QString     GetInstanceId    (void) const;
    QString     GetOwnerUuid     (void) const;
    QString     GetConnectionUri (void) const;
    QVariantMap GetExtras        (void) const;
    QVariantMap ToVariant        (void) const;

  private:
    bool        m_valid;
    bool        m_hasName;
    QString     m_name;
    QString     m_serviceId;
    QString     m_instanceId;
    QString     m_ownerUuid;
    QString     m_connectionUri;
    QVariantMap m_extras;
};

#endif // MKRSERVICEDESCRIPTOR_H
