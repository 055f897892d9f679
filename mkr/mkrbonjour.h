#ifndef MKRBONJOUR_H
#define MKRBONJOUR_H

// Qt
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QVariant>
#include <QSocketNotifier>

// DNS Service Discovery
#include <dns_sd.h>

// Mkr
#include "mkrqthread.h"

class MkrBonjourService
{
  public:
    enum ServiceType
    {
        Browse,  //!< A service type we are actively trying to discover
        Resolve  //!< Text record resolution for a discovered service
    };

  public:
    MkrBonjourService();
    MkrBonjourService(const MkrBonjourService &Other);
    MkrBonjourService(ServiceType BonjourType, DNSServiceRef DNSSRef, const QByteArray &Name, const QByteArray &Type);
    MkrBonjourService(ServiceType BonjourType, const QByteArray &Name, const QByteArray &Type, const QByteArray &Domain, uint32_t InterfaceIndex);
    MkrBonjourService& operator =(const MkrBonjourService &Other);
   ~MkrBonjourService() = default;
    void SetFileDescriptor(int FileDescriptor, QObject *Object);
    void Deregister(void);

  public:
    ServiceType      m_serviceType;
    DNSServiceRef    m_dnssRef;
    QByteArray       m_name;
    QByteArray       m_type;
    QByteArray       m_txt;
    QByteArray       m_domain;
    uint32_t         m_interfaceIndex;
    bool             m_finished;
    bool             m_failed;
    int              m_fd;
    QSocketNotifier *m_socketNotifier;
};

class MkrBonjour : public QObject
{
    Q_OBJECT

  public:
    static  QByteArray       MapToTxtRecord   (const QMap<QByteArray,QByteArray> &Map);
    static  QMap<QByteArray,QByteArray> TxtRecordToMap(const QByteArray &TxtRecord);
    static  QVariantMap      TxtRecordToAttributes (const QByteArray &Name, const QByteArray &TxtRecord);

    explicit MkrBonjour(QObject *Observer);
    virtual ~MkrBonjour();

    quint32 Browse          (const QByteArray &Type);
    void    Deregister      (quint32 Reference);

    // callback handlers
    void AddBrowseResult(DNSServiceRef Reference, const MkrBonjourService &Service);
    void RemoveBrowseResult(DNSServiceRef Reference, const MkrBonjourService &Service);
    void Resolve(DNSServiceRef Reference, DNSServiceErrorType ErrorType, const char *Fullname,
                 uint16_t TxtLen, const unsigned char *TxtRecord);

  public slots:
    void    socketReadyRead (int Socket);

  private slots:
    void    ReleaseResolved (void);

  protected:
    void    ReleaseAll      (void);

    // dns_sd entry points
    virtual DNSServiceErrorType StartBrowse   (DNSServiceRef *Reference, const QByteArray &Type);
    virtual DNSServiceErrorType StartResolve  (DNSServiceRef *Reference, const MkrBonjourService &Service);
    virtual DNSServiceErrorType ProcessResult (DNSServiceRef Reference);
    virtual int                 SocketFor     (DNSServiceRef Reference);
    virtual void                Release       (MkrBonjourService &Service);

  private:
    Q_DISABLE_COPY(MkrBonjour)
    bool    IsKnownBrowser  (DNSServiceRef Reference);

  private:
    QObject                         *m_observer;
    QMutex                           m_serviceLock;
    QMap<quint32,MkrBonjourService>  m_services;
    QMutex                           m_discoveredLock;
    QMap<quint32,MkrBonjourService>  m_discoveredServices;
};

class MkrDiscoveryThread : public MkrQThread
{
  public:
    MkrDiscoveryThread(QObject *Observer, const QList<QByteArray> &Types);
   ~MkrDiscoveryThread() = default;

    void Start  (void) override;
    void Finish (void) override;

  private:
    QObject           *m_observer;
    QList<QByteArray>  m_types;
    MkrBonjour        *m_bonjour;
};

#endif // MKRBONJOUR_H
