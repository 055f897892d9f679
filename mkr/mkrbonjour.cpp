/* Class MkrBonjour
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
#include <QCoreApplication>
#include <QMutableMapIterator>

// Mkr
#include "mkrlogging.h"
#include "mkrevent.h"
#include "mkrlocaldefs.h"
#include "mkrlocalcontext.h"
#include "mkrbonjour.h"

void DNSSD_API BonjourBrowseCallback   (DNSServiceRef        Ref,
                                        DNSServiceFlags      Flags,
                                        uint32_t             InterfaceIndex,
                                        DNSServiceErrorType  ErrorCode,
                                        const char          *Name,
                                        const char          *Type,
                                        const char          *Domain,
                                        void                *Object);
void DNSSD_API BonjourResolveCallback  (DNSServiceRef        Ref,
                                        DNSServiceFlags      Flags,
                                        uint32_t             InterfaceIndex,
                                        DNSServiceErrorType  ErrorCode,
                                        const char          *Fullname,
                                        const char          *HostTarget,
                                        uint16_t             Port,
                                        uint16_t             TxtLen,
                                        const unsigned char *TxtRecord,
                                        void                *Object);

/*! \class MkrBonjourService
 *  \brief Wrapper around a DNS service reference, either a browser or a pending resolve.
 *
 * MkrBonjourService takes ownership of both the DNSServiceRef and QSocketNotifier object - to
 * ensure resources are properly released, Deregister must be called. Copies never carry the
 * socket notifier.
 *
 * \sa MkrBonjour
*/
MkrBonjourService::MkrBonjourService()
  : m_serviceType(Browse),
    m_dnssRef(nullptr),
    m_name(),
    m_type(),
    m_txt(),
    m_domain(),
    m_interfaceIndex(0),
    m_finished(false),
    m_failed(false),
    m_fd(-1),
    m_socketNotifier(nullptr)
{
}

MkrBonjourService::MkrBonjourService(const MkrBonjourService &Other)
  : m_serviceType(Other.m_serviceType),
    m_dnssRef(Other.m_dnssRef),
    m_name(Other.m_name),
    m_type(Other.m_type),
    m_txt(Other.m_txt),
    m_domain(Other.m_domain),
    m_interfaceIndex(Other.m_interfaceIndex),
    m_finished(Other.m_finished),
    m_failed(Other.m_failed),
    m_fd(-1),                 // NB
    m_socketNotifier(nullptr) // NB
{
}

MkrBonjourService& MkrBonjourService::operator =(const MkrBonjourService &Other)
{
    m_serviceType    = Other.m_serviceType;
    m_dnssRef        = Other.m_dnssRef;
    m_name           = Other.m_name;
    m_type           = Other.m_type;
    m_txt            = Other.m_txt;
    m_domain         = Other.m_domain;
    m_interfaceIndex = Other.m_interfaceIndex;
    m_finished       = Other.m_finished;
    m_failed         = Other.m_failed;
    m_fd             = -1;      // NB
    m_socketNotifier = nullptr; // NB
    return *this;
}

MkrBonjourService::MkrBonjourService(ServiceType BonjourType, DNSServiceRef DNSSRef, const QByteArray &Name, const QByteArray &Type)
  : m_serviceType(BonjourType),
    m_dnssRef(DNSSRef),
    m_name(Name),
    m_type(Type),
    m_txt(),
    m_domain(),
    m_interfaceIndex(0),
    m_finished(false),
    m_failed(false),
    m_fd(-1),
    m_socketNotifier(nullptr)
{
}

MkrBonjourService::MkrBonjourService(ServiceType BonjourType,
                   const QByteArray &Name, const QByteArray &Type,
                   const QByteArray &Domain, uint32_t InterfaceIndex)
  : m_serviceType(BonjourType),
    m_dnssRef(nullptr),
    m_name(Name),
    m_type(Type),
    m_txt(),
    m_domain(Domain),
    m_interfaceIndex(InterfaceIndex),
    m_finished(false),
    m_failed(false),
    m_fd(-1),
    m_socketNotifier(nullptr)
{
}

/*! \fn    MkrBonjourService::SetFileDescriptor
 *  \brief Sets the file descriptor and creates a QSocketNotifier to listen for socket events
*/
void MkrBonjourService::SetFileDescriptor(int FileDescriptor, QObject *Object)
{
    if (FileDescriptor != -1 && Object)
    {
        m_fd = FileDescriptor;
        m_socketNotifier = new QSocketNotifier(FileDescriptor, QSocketNotifier::Read, Object);
        QObject::connect(m_socketNotifier, SIGNAL(activated(int)),
                         Object, SLOT(socketReadyRead(int)));
        m_socketNotifier->setEnabled(true);
    }
}

/*! \fn    MkrBonjourService::Deregister
 *  \brief Release all resources associated with this service.
 */
void MkrBonjourService::Deregister(void)
{
    if (m_socketNotifier)
        m_socketNotifier->setEnabled(false);

    if (m_dnssRef)
    {
        if (m_serviceType == Browse)
            LOG(VB_GENERAL, LOG_INFO, QString("Cancelling browse for '%1'").arg(m_type.data()));
        else if (!m_finished)
            LOG(VB_DISCOVERY, LOG_INFO, QString("Cancelling resolve for '%1'").arg(m_name.data()));

        DNSServiceRefDeallocate(m_dnssRef);
        m_dnssRef = nullptr;
    }

    if (m_socketNotifier)
        m_socketNotifier->deleteLater();
    m_socketNotifier = nullptr;
    m_fd = -1;
}

/*! \fn    BonjourBrowseCallback
 *  \brief Handles browse callbacks from Bonjour
*/
void BonjourBrowseCallback(DNSServiceRef Ref, DNSServiceFlags Flags,
                           uint32_t InterfaceIndex,
                           DNSServiceErrorType ErrorCode, const char *Name,
                           const char *Type, const char *Domain, void *Object)
{
    MkrBonjour *bonjour = static_cast<MkrBonjour*>(Object);
    if (!bonjour)
    {
        LOG(VB_GENERAL, LOG_ERR, "Received browse callback for unknown object");
        return;
    }

    if (ErrorCode != kDNSServiceErr_NoError)
    {
        LOG(VB_GENERAL, LOG_ERR, QString("Browse callback error: %1").arg(ErrorCode));
        return;
    }

    MkrBonjourService service(MkrBonjourService::Resolve, Name, Type, Domain, InterfaceIndex);
    if (Flags & kDNSServiceFlagsAdd)
        bonjour->AddBrowseResult(Ref, service);
    else
        bonjour->RemoveBrowseResult(Ref, service);
}

/*! \fn    BonjourResolveCallback
 *  \brief Handles text record resolution callbacks from Bonjour
*/
void BonjourResolveCallback(DNSServiceRef Ref, DNSServiceFlags Flags,
                            uint32_t InterfaceIndex, DNSServiceErrorType ErrorCode,
                            const char *Fullname, const char *HostTarget,
                            uint16_t Port, uint16_t TxtLen,
                            const unsigned char *TxtRecord, void *Object)
{
    (void)Flags;
    (void)InterfaceIndex;
    (void)HostTarget;
    (void)Port;

    MkrBonjour *bonjour = static_cast<MkrBonjour*>(Object);
    if (!bonjour)
    {
        LOG(VB_GENERAL, LOG_ERR, "Received resolve callback for unknown object");
        return;
    }

    bonjour->Resolve(Ref, ErrorCode, Fullname, TxtLen, TxtRecord);
}

/*! \class MkrBonjour
 *  \brief Searches for machinekit services via Bonjour (aka Zero Configuration Networking/Avahi)
 *
 * MkrBonjour returns opaque references for use by client objects. Each browse result is resolved
 * once to retrieve its text record. A Mkr::ServiceDiscovered event, carrying the text record
 * attributes plus the raw service name as 'name', is posted to the observer when a service
 * is resolved and a Mkr::ServiceWentAway event (carrying 'name' and 'type') when the service
 * has been withdrawn from every interface it was seen on.
 *
 * Events are always posted (never sent) so the observer handles them in its own thread and
 * nothing the observer does can run inside a dns_sd callback.
 *
 * \note MkrBonjour must be created, used and destroyed in the same thread.
 *
 * \sa MkrDiscoveryThread
 * \sa MkrServiceMonitor
*/

/*! \fn    MkrBonjour::MapToTxtRecord
 *  \brief Serialises a QMap into a Bonjour Txt record format.
*/
QByteArray MkrBonjour::MapToTxtRecord(const QMap<QByteArray, QByteArray> &Map)
{
    QByteArray result;

    QMap<QByteArray,QByteArray>::const_iterator it = Map.begin();
    for ( ; it != Map.end(); ++it)
    {
        QByteArray entry = it.key() + "=" + it.value();
        if (entry.size() > 255)
        {
            LOG(VB_DISCOVERY, LOG_WARNING, QString("Txt record entry '%1' too long - ignoring").arg(it.key().data()));
            continue;
        }
        result.append((char)entry.size());
        result.append(entry);
    }

    return result;
}

/*! \fn    MkrBonjour::TxtRecordToMap
 *  \brief Extracts a QMap from a properly formatted Bonjour Txt record
 *
 * Each entry is split at the first '=' only, so values may contain '='. An entry without '='
 * is a key with an empty value. Entries with an empty key are ignored, as is a truncated
 * final entry.
*/
QMap<QByteArray,QByteArray> MkrBonjour::TxtRecordToMap(const QByteArray &TxtRecord)
{
    QMap<QByteArray,QByteArray> result;

    int position = 0;
    while (position < TxtRecord.size())
    {
        int size = (unsigned char)TxtRecord[position++];
        if (position + size > TxtRecord.size())
        {
            LOG(VB_DISCOVERY, LOG_WARNING, "Truncated txt record");
            break;
        }

        QByteArray entry = TxtRecord.mid(position, size);
        position += size;

        int equals = entry.indexOf('=');
        QByteArray key   = equals < 0 ? entry : entry.left(equals);
        QByteArray value = equals < 0 ? QByteArray() : entry.mid(equals + 1);
        if (!key.isEmpty() && !result.contains(key))
            result.insert(key, value);
    }

    return result;
}

/// Convert a raw text record into the attribute map handed to MkrRegistry::Accept.
QVariantMap MkrBonjour::TxtRecordToAttributes(const QByteArray &Name, const QByteArray &TxtRecord)
{
    QVariantMap result;
    QMap<QByteArray,QByteArray> map = TxtRecordToMap(TxtRecord);
    QMap<QByteArray,QByteArray>::const_iterator it = map.constBegin();
    for ( ; it != map.constEnd(); ++it)
        result.insert(QString::fromUtf8(it.key()), QString::fromUtf8(it.value()));
    result.insert(MKR_TXT_NAME, QString::fromUtf8(Name));
    return result;
}

MkrBonjour::MkrBonjour(QObject *Observer)
  : QObject(nullptr),
    m_observer(Observer),
    m_serviceLock(QMutex::Recursive),
    m_services(),
    m_discoveredLock(QMutex::Recursive),
    m_discoveredServices()
{
    // the Avahi compatability layer on *nix will spam us with warnings
    qputenv("AVAHI_COMPAT_NOWARN", "1");
}

MkrBonjour::~MkrBonjour()
{
    LOG(VB_GENERAL, LOG_INFO, "Closing Bonjour");
    ReleaseAll();
}

/// Cancel every browse and pending resolve.
void MkrBonjour::ReleaseAll(void)
{
    {
        QMutexLocker locker(&m_serviceLock);
        QMap<quint32,MkrBonjourService>::iterator it = m_services.begin();
        for (; it != m_services.end(); ++it)
            Release(*it);
        m_services.clear();
    }

    // deallocate resolve queries
    {
        QMutexLocker locker(&m_discoveredLock);
        QMap<quint32,MkrBonjourService>::iterator it = m_discoveredServices.begin();
        for (; it != m_discoveredServices.end(); ++it)
            Release(*it);
        m_discoveredServices.clear();
    }
}

DNSServiceErrorType MkrBonjour::StartBrowse(DNSServiceRef *Reference, const QByteArray &Type)
{
    return DNSServiceBrowse(Reference, 0, kDNSServiceInterfaceIndexAny,
                            Type.constData(), nullptr, BonjourBrowseCallback, this);
}

DNSServiceErrorType MkrBonjour::StartResolve(DNSServiceRef *Reference, const MkrBonjourService &Service)
{
    return DNSServiceResolve(Reference, 0, Service.m_interfaceIndex,
                             Service.m_name.constData(), Service.m_type.constData(),
                             Service.m_domain.constData(), BonjourResolveCallback, this);
}

DNSServiceErrorType MkrBonjour::ProcessResult(DNSServiceRef Reference)
{
    return DNSServiceProcessResult(Reference);
}

int MkrBonjour::SocketFor(DNSServiceRef Reference)
{
    return DNSServiceRefSockFD(Reference);
}

void MkrBonjour::Release(MkrBonjourService &Service)
{
    Service.Deregister();
}

/*! \fn MkrBonjour::Browse
 *  \brief Search for a service advertised via Bonjour
 *
 * Initiates a browse request for the service named by Type. Browsing for a type that is
 * already being browsed does nothing and returns the existing reference.
 *
 * \param   Type      A string describing the Bonjour service type (e.g. _machinekit._tcp).
 * \returns An opaque reference to be used via Deregister on success, 0 on failure.
 *
 * \sa Deregister
*/
quint32 MkrBonjour::Browse(const QByteArray &Type)
{
    static QByteArray dummy("browser");

    if (Type.isEmpty())
    {
        LOG(VB_GENERAL, LOG_ERR, "Cannot browse for an empty service type");
        return 0;
    }

    QMutexLocker locker(&m_serviceLock);

    QMap<quint32,MkrBonjourService>::const_iterator it = m_services.constBegin();
    for ( ; it != m_services.constEnd(); ++it)
    {
        if ((*it).m_type == Type)
        {
            LOG(VB_DISCOVERY, LOG_INFO, QString("Already browsing for '%1'").arg(Type.data()));
            return it.key();
        }
    }

    DNSServiceRef dnssref = nullptr;
    DNSServiceErrorType result = StartBrowse(&dnssref, Type);
    if (kDNSServiceErr_NoError != result)
    {
        LOG(VB_GENERAL, LOG_ERR, QString("Browse error: %1").arg(result));
        if (dnssref)
        {
            MkrBonjourService failed(MkrBonjourService::Browse, dnssref, dummy, Type);
            Release(failed);
        }
    }
    else
    {
        quint32 reference = 1;
        while (m_services.contains(reference))
            reference++;
        MkrBonjourService service(MkrBonjourService::Browse, dnssref, dummy, Type);
        m_services.insert(reference, service);
        m_services[reference].SetFileDescriptor(SocketFor(dnssref), this);
        LOG(VB_GENERAL, LOG_INFO, QString("Browsing for '%1'").arg(Type.data()));
        return reference;
    }

    LOG(VB_GENERAL, LOG_ERR, QString("Failed to browse for '%1'").arg(Type.data()));
    return 0;
}

/*! \fn    MkrBonjour::Deregister
 *  \brief Cancel a Bonjour browse request and any resolves started by it.
 *
 * \param Reference A MkrBonjour reference previously obtained via a call to Browse
 * \sa Browse
*/
void MkrBonjour::Deregister(quint32 Reference)
{
    if (!Reference)
        return;

    QByteArray type;

    {
        QMutexLocker locker(&m_serviceLock);
        if (m_services.contains(Reference))
        {
            type = m_services[Reference].m_type;
            Release(m_services[Reference]);
            m_services.remove(Reference);
        }
    }

    if (type.isEmpty())
    {
        LOG(VB_GENERAL, LOG_WARNING, "Trying to de-register an unknown browser.");
        return;
    }

    // Remove any resolve requests associated with this type
    {
        QMutexLocker locker(&m_discoveredLock);
        QMutableMapIterator<quint32,MkrBonjourService> it(m_discoveredServices);
        while (it.hasNext())
        {
            it.next();
            if (it.value().m_type == type)
            {
                Release(it.value());
                it.remove();
            }
        }
    }
}

/*! \fn    MkrBonjour::socketReadyRead
 *  \brief Process pending results for the dns_sd reference that owns Socket.
*/
void MkrBonjour::socketReadyRead(int Socket)
{
    {
        // match Socket to a browser
        QMutexLocker lock(&m_serviceLock);
        QMap<quint32,MkrBonjourService>::iterator it = m_services.begin();
        for ( ; it != m_services.end(); ++it)
        {
            if ((*it).m_fd == Socket)
            {
                DNSServiceErrorType res = ProcessResult((*it).m_dnssRef);
                if (kDNSServiceErr_NoError != res)
                {
                    // the socket stays readable once the daemon has gone
                    LOG(VB_GENERAL, LOG_ERR, QString("Read Error: %1 - stopped browsing for '%2'")
                        .arg(res).arg((*it).m_type.data()));
                    Release(*it);
                    m_services.erase(it);
                }
                return;
            }
        }
    }

    {
        // match Socket to a pending resolve
        QMutexLocker lock(&m_discoveredLock);
        QMap<quint32,MkrBonjourService>::iterator it = m_discoveredServices.begin();
        for ( ; it != m_discoveredServices.end(); ++it)
        {
            if ((*it).m_fd == Socket && (*it).m_dnssRef && !(*it).m_finished)
            {
                DNSServiceErrorType res = ProcessResult((*it).m_dnssRef);
                if (kDNSServiceErr_NoError != res && !(*it).m_finished)
                {
                    LOG(VB_GENERAL, LOG_ERR, QString("Read Error: %1 - failed to resolve '%2'")
                        .arg(res).arg((*it).m_name.data()));
                    (*it).m_finished = true;
                    (*it).m_failed   = true;
                    if ((*it).m_socketNotifier)
                        (*it).m_socketNotifier->setEnabled(false);
                    QMetaObject::invokeMethod(this, "ReleaseResolved", Qt::QueuedConnection);
                }
                return;
            }
        }
    }

    LOG(VB_DISCOVERY, LOG_DEBUG, "Read request on unknown socket");
}

bool MkrBonjour::IsKnownBrowser(DNSServiceRef Reference)
{
    QMutexLocker locker(&m_serviceLock);
    QMap<quint32,MkrBonjourService>::const_iterator it = m_services.constBegin();
    for ( ; it != m_services.constEnd(); ++it)
        if ((*it).m_dnssRef == Reference)
            return true;
    return false;
}

/*! \fn    MkrBonjour::AddBrowseResult
 *  \brief Handle newly discovered service.
 *
 * Services that have not been seen before (on this interface) are added to the list of known services
 * and a resolve is kicked off. If the resolve cannot be started, the service is dropped.
*/
void MkrBonjour::AddBrowseResult(DNSServiceRef Reference, const MkrBonjourService &Service)
{
    if (!IsKnownBrowser(Reference))
    {
        LOG(VB_GENERAL, LOG_INFO, "Browser result for unknown browser");
        return;
    }

    // have we already seen this service?
    QMutexLocker locker(&m_discoveredLock);
    QMap<quint32,MkrBonjourService>::iterator it = m_discoveredServices.begin();
    for( ; it != m_discoveredServices.end(); ++it)
    {
        if ((*it).m_name == Service.m_name &&
            (*it).m_type == Service.m_type &&
            (*it).m_domain == Service.m_domain &&
            (*it).m_interfaceIndex == Service.m_interfaceIndex)
        {
            LOG(VB_DISCOVERY, LOG_INFO, QString("Service '%1' already discovered - ignoring")
                .arg(Service.m_name.data()));
            return;
        }
    }

    // kick off resolve
    DNSServiceRef reference = nullptr;
    DNSServiceErrorType error = StartResolve(&reference, Service);
    if (error != kDNSServiceErr_NoError)
    {
        LOG(VB_GENERAL, LOG_ERR, QString("Service resolution call failed for '%1' (Error %2)")
            .arg(Service.m_name.data()).arg(error));
        if (reference)
        {
            MkrBonjourService failed = Service;
            failed.m_dnssRef = reference;
            Release(failed);
        }
        return;
    }

    MkrBonjourService service = Service;
    quint32 ref = 1;
    while (m_discoveredServices.contains(ref))
        ref++;
    service.m_dnssRef = reference;
    m_discoveredServices.insert(ref, service);
    m_discoveredServices[ref].SetFileDescriptor(SocketFor(reference), this);
    LOG(VB_DISCOVERY, LOG_INFO, QString("Resolving '%1' on interface %2")
        .arg(service.m_name.data()).arg(service.m_interfaceIndex));
}

/*! \fn    MkrBonjour::RemoveBrowseResult
 *  \brief Handle removed services.
 *
 * The service is forgotten for the interface it was withdrawn from. Only once it has gone from
 * every interface is the observer told that it went away.
*/
void MkrBonjour::RemoveBrowseResult(DNSServiceRef Reference,
                        const MkrBonjourService &Service)
{
    if (!IsKnownBrowser(Reference))
    {
        LOG(VB_GENERAL, LOG_INFO, "Browser result for unknown browser");
        return;
    }

    QMutexLocker locker(&m_discoveredLock);
    bool removed = false;
    QMutableMapIterator<quint32,MkrBonjourService> it(m_discoveredServices);
    while (it.hasNext())
    {
        it.next();
        if (it.value().m_type == Service.m_type &&
            it.value().m_name == Service.m_name &&
            it.value().m_domain == Service.m_domain &&
            it.value().m_interfaceIndex == Service.m_interfaceIndex)
        {
            Release(it.value());
            it.remove();
            removed = true;
        }
    }

    if (!removed)
        return;

    it.toFront();
    while (it.hasNext())
    {
        it.next();
        if (it.value().m_type == Service.m_type && it.value().m_name == Service.m_name)
        {
            LOG(VB_DISCOVERY, LOG_INFO, QString("Service '%1' withdrawn from interface %2 - still available elsewhere")
                .arg(Service.m_name.data()).arg(Service.m_interfaceIndex));
            return;
        }
    }

    LOG(VB_GENERAL, LOG_INFO, QString("Service '%1' (%2) went away")
        .arg(Service.m_name.data()).arg(Service.m_type.data()));

    QVariantMap data;
    data.insert(MKR_TXT_NAME, QString::fromUtf8(Service.m_name));
    data.insert(QStringLiteral("type"), QString::fromUtf8(Service.m_type));
    if (m_observer)
        QCoreApplication::postEvent(m_observer, new MkrEvent(Mkr::ServiceWentAway, data));
}

/*! \fn    MkrBonjour::Resolve
 *  \brief Handle resolution responses from Bonjour
 *
 * Only the first answer is of interest. The resolve reference is released once the callback
 * has returned (it cannot safely be deallocated from within its own callback). A failed resolve
 * is dropped and will not be retried unless the service is advertised again.
*/
void MkrBonjour::Resolve(DNSServiceRef Reference, DNSServiceErrorType ErrorType, const char *Fullname,
                         uint16_t TxtLen, const unsigned char *TxtRecord)
{
    if (!Reference)
        return;

    QMutexLocker locker(&m_discoveredLock);
    QMap<quint32,MkrBonjourService>::iterator it = m_discoveredServices.begin();
    for( ; it != m_discoveredServices.end(); ++it)
    {
        if ((*it).m_dnssRef != Reference || (*it).m_finished)
            continue;

        (*it).m_finished = true;
        if ((*it).m_socketNotifier)
            (*it).m_socketNotifier->setEnabled(false);
        QMetaObject::invokeMethod(this, "ReleaseResolved", Qt::QueuedConnection);

        if (ErrorType != kDNSServiceErr_NoError)
        {
            LOG(VB_GENERAL, LOG_ERR, QString("Failed to resolve '%1' (Error %2)")
                .arg((*it).m_name.data()).arg(ErrorType));
            (*it).m_failed = true;
            return;
        }

        (*it).m_txt = QByteArray((const char *)TxtRecord, TxtLen);
        LOG(VB_DISCOVERY, LOG_INFO, QString("Resolved '%1' with %2 bytes of text record")
            .arg(Fullname).arg(TxtLen));

        if (m_observer)
        {
            QVariantMap data = TxtRecordToAttributes((*it).m_name, (*it).m_txt);
            QCoreApplication::postEvent(m_observer, new MkrEvent(Mkr::ServiceDiscovered, data));
        }
        return;
    }
}

/// Free the dns_sd references of completed resolves and forget those that failed.
void MkrBonjour::ReleaseResolved(void)
{
    QMutexLocker locker(&m_discoveredLock);
    QMutableMapIterator<quint32,MkrBonjourService> it(m_discoveredServices);
    while (it.hasNext())
    {
        it.next();
        if (!it.value().m_finished)
            continue;

        Release(it.value());
        if (it.value().m_failed)
            it.remove();
    }
}

/*! \class MkrDiscoveryThread
 *  \brief The thread that owns MkrBonjour and all of its dns_sd references.
*/
MkrDiscoveryThread::MkrDiscoveryThread(QObject *Observer, const QList<QByteArray> &Types)
  : MkrQThread(MKR_DISCOVERY_THREAD),
    m_observer(Observer),
    m_types(Types),
    m_bonjour(nullptr)
{
}

void MkrDiscoveryThread::Start(void)
{
    m_bonjour = new MkrBonjour(m_observer);
    foreach (const QByteArray &type, m_types)
        (void)m_bonjour->Browse(type);
}

void MkrDiscoveryThread::Finish(void)
{
    delete m_bonjour;
    m_bonjour = nullptr;
}
