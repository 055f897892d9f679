// Std
#include <unistd.h>

// Qt
#include <QtTest/QtTest>
#include <QCoreApplication>

// Mkr
#include "mkrevent.h"
#include "mkrlocalcontext.h"
#include "mkrbonjour.h"
#include "testbonjour.h"

static const QByteArray kType("_machinekit._tcp");
static const QByteArray kName("Status on host");

// Collects the events posted by MkrBonjour
class EventRecorder : public QObject
{
  public:
    QList<int>         m_events;
    QList<QVariantMap> m_data;

    bool event(QEvent *Event) override
    {
        if (Event && Event->type() == MkrEvent::MkrEventType)
        {
            MkrEvent *event = static_cast<MkrEvent*>(Event);
            m_events.append(event->GetEvent());
            m_data.append(event->Data());
            return true;
        }
        return QObject::event(Event);
    }

    void Flush(void)
    {
        QCoreApplication::sendPostedEvents(this, MkrEvent::MkrEventType);
    }
};

// MkrBonjour with the dns_sd calls replaced, so the browse and resolve bookkeeping runs
// without an mDNS daemon.
class OfflineBonjour : public MkrBonjour
{
  public:
    explicit OfflineBonjour(QObject *Observer)
      : MkrBonjour(Observer),
        m_nextReference(1),
        m_browses(0),
        m_processed(0),
        m_released(0),
        m_socket(-1),
        m_resolveError(kDNSServiceErr_NoError),
        m_browsers(),
        m_resolves()
    {
    }

   ~OfflineBonjour()
    {
        ReleaseAll();
    }

    DNSServiceRef NewReference(void)
    {
        return reinterpret_cast<DNSServiceRef>(static_cast<quintptr>(m_nextReference++));
    }

    MkrBonjourService Result(uint32_t Interface)
    {
        return MkrBonjourService(MkrBonjourService::Resolve, kName, kType, "local.", Interface);
    }

    void Answer(DNSServiceRef Reference, const QByteArray &Txt, DNSServiceErrorType Error = kDNSServiceErr_NoError)
    {
        Resolve(Reference, Error, "Status on host._machinekit._tcp.local.", Txt.size(),
                reinterpret_cast<const unsigned char*>(Txt.constData()));
        // run the queued release
        QCoreApplication::processEvents();
    }

  protected:
    DNSServiceErrorType StartBrowse(DNSServiceRef *Reference, const QByteArray &Type) override
    {
        m_browses++;
        *Reference = NewReference();
        m_browsers.insert(Type, *Reference);
        return kDNSServiceErr_NoError;
    }

    DNSServiceErrorType StartResolve(DNSServiceRef *Reference, const MkrBonjourService&) override
    {
        if (m_resolveError != kDNSServiceErr_NoError)
            return m_resolveError;
        *Reference = NewReference();
        m_resolves.append(*Reference);
        return kDNSServiceErr_NoError;
    }

    DNSServiceErrorType ProcessResult(DNSServiceRef) override
    {
        m_processed++;
        return kDNSServiceErr_Unknown;
    }

    int SocketFor(DNSServiceRef) override
    {
        return m_socket;
    }

    void Release(MkrBonjourService &Service) override
    {
        if (Service.m_dnssRef)
            m_released++;
        Service.m_dnssRef = nullptr;
        Service.Deregister();
    }

  public:
    quintptr                        m_nextReference;
    int                             m_browses;
    int                             m_processed;
    int                             m_released;
    int                             m_socket;
    DNSServiceErrorType             m_resolveError;
    QMap<QByteArray,DNSServiceRef>  m_browsers;
    QList<DNSServiceRef>            m_resolves;
};

static QByteArray Entry(const QByteArray &Data)
{
    QByteArray result;
    result.append((char)Data.size());
    result.append(Data);
    return result;
}

void TestBonjour::testTxtRecordToMap(void)
{
    QByteArray txt = Entry("service=status") + Entry("instance=bbb") + Entry("uuid=U") +
                     Entry("dsn=tcp://h:1");

    QMap<QByteArray,QByteArray> map = MkrBonjour::TxtRecordToMap(txt);
    QCOMPARE(map.size(), 4);
    QCOMPARE(map.value("service"), QByteArray("status"));
    QCOMPARE(map.value("instance"), QByteArray("bbb"));
    QCOMPARE(map.value("uuid"), QByteArray("U"));
    QCOMPARE(map.value("dsn"), QByteArray("tcp://h:1"));
}

void TestBonjour::testTxtRecordEdgeCases(void)
{
    // split at the first '=' only
    QMap<QByteArray,QByteArray> map = MkrBonjour::TxtRecordToMap(Entry("dsn=tcp://h:1?a=b"));
    QCOMPARE(map.value("dsn"), QByteArray("tcp://h:1?a=b"));

    // boolean attribute and empty key
    map = MkrBonjour::TxtRecordToMap(Entry("flag") + Entry("=nothing"));
    QCOMPARE(map.size(), 1);
    QVERIFY(map.contains("flag"));
    QVERIFY(map.value("flag").isEmpty());

    // first occurrence wins
    map = MkrBonjour::TxtRecordToMap(Entry("uuid=U") + Entry("uuid=V"));
    QCOMPARE(map.value("uuid"), QByteArray("U"));

    // truncated final entry is dropped
    QByteArray truncated = Entry("uuid=U");
    truncated.append((char)20);
    truncated.append("dsn=");
    map = MkrBonjour::TxtRecordToMap(truncated);
    QCOMPARE(map.size(), 1);
    QCOMPARE(map.value("uuid"), QByteArray("U"));

    // lengths above 127 are not negative
    QByteArray longvalue(150, 'x');
    map = MkrBonjour::TxtRecordToMap(Entry("long=" + longvalue));
    QCOMPARE(map.value("long"), longvalue);

    QVERIFY(MkrBonjour::TxtRecordToMap(QByteArray()).isEmpty());
}

void TestBonjour::testMapToTxtRecord(void)
{
    QMap<QByteArray,QByteArray> map;
    map.insert("service", "status");
    map.insert("toolong", QByteArray(300, 'x'));

    QByteArray txt = MkrBonjour::MapToTxtRecord(map);
    QCOMPARE(txt, Entry("service=status"));
    QCOMPARE(MkrBonjour::TxtRecordToMap(txt).value("service"), QByteArray("status"));
}

void TestBonjour::testTxtRecordToAttributes(void)
{
    QByteArray txt = Entry("service=status") + Entry("uuid=U");
    QVariantMap attributes = MkrBonjour::TxtRecordToAttributes("Status on host", txt);
    QCOMPARE(attributes.size(), 3);
    QCOMPARE(attributes.value("name").toString(), QString("Status on host"));
    QCOMPARE(attributes.value("service").toString(), QString("status"));
    QCOMPARE(attributes.value("uuid").toString(), QString("U"));
}

void TestBonjour::testBrowseSameTypeTwice(void)
{
    EventRecorder recorder;
    OfflineBonjour bonjour(&recorder);

    quint32 first = bonjour.Browse(kType);
    QVERIFY(first != 0);
    QCOMPARE(bonjour.Browse(kType), first);
    QCOMPARE(bonjour.m_browses, 1);

    quint32 other = bonjour.Browse("_http._tcp");
    QVERIFY(other != 0 && other != first);
    QCOMPARE(bonjour.m_browses, 2);

    QCOMPARE(bonjour.Browse(QByteArray()), (quint32)0);
    QCOMPARE(bonjour.m_browses, 2);
}

void TestBonjour::testResolvePostsDiscovered(void)
{
    EventRecorder recorder;
    OfflineBonjour bonjour(&recorder);
    QVERIFY(bonjour.Browse(kType));
    DNSServiceRef browser = bonjour.m_browsers.value(kType);

    // one resolve per interface, repeats on the same interface are ignored
    bonjour.AddBrowseResult(browser, bonjour.Result(2));
    bonjour.AddBrowseResult(browser, bonjour.Result(2));
    bonjour.AddBrowseResult(browser, bonjour.Result(3));
    QCOMPARE(bonjour.m_resolves.size(), 2);

    QByteArray txt = Entry("service=status") + Entry("instance=bbb") + Entry("uuid=U") + Entry("dsn=tcp://h:1");
    bonjour.Answer(bonjour.m_resolves.first(), txt);
    recorder.Flush();

    QCOMPARE(recorder.m_events.size(), 1);
    QCOMPARE(recorder.m_events.first(), (int)Mkr::ServiceDiscovered);
    QVariantMap data = recorder.m_data.first();
    QCOMPARE(data.value("name").toString(), QString(kName));
    QCOMPARE(data.value("service").toString(), QString("status"));
    QCOMPARE(data.value("dsn").toString(), QString("tcp://h:1"));

    // the reference is released once answered but the service is still known
    QCOMPARE(bonjour.m_released, 1);
    bonjour.AddBrowseResult(browser, bonjour.Result(2));
    QCOMPARE(bonjour.m_resolves.size(), 2);

    // a second answer for the same resolve is ignored
    bonjour.Answer(bonjour.m_resolves.first(), txt);
    recorder.Flush();
    QCOMPARE(recorder.m_events.size(), 1);
}

void TestBonjour::testFailedResolveIsForgotten(void)
{
    EventRecorder recorder;
    OfflineBonjour bonjour(&recorder);
    QVERIFY(bonjour.Browse(kType));
    DNSServiceRef browser = bonjour.m_browsers.value(kType);

    bonjour.AddBrowseResult(browser, bonjour.Result(2));
    QCOMPARE(bonjour.m_resolves.size(), 1);
    bonjour.Answer(bonjour.m_resolves.first(), Entry("service=status"), kDNSServiceErr_Unknown);
    recorder.Flush();
    QVERIFY(recorder.m_events.isEmpty());
    QCOMPARE(bonjour.m_released, 1);

    // forgotten, so a fresh advertisement is resolved again
    bonjour.AddBrowseResult(browser, bonjour.Result(2));
    QCOMPARE(bonjour.m_resolves.size(), 2);

    // nor is it remembered when the resolve cannot even be started
    bonjour.m_resolveError = kDNSServiceErr_Unknown;
    bonjour.AddBrowseResult(browser, bonjour.Result(4));
    bonjour.m_resolveError = kDNSServiceErr_NoError;
    bonjour.AddBrowseResult(browser, bonjour.Result(4));
    QCOMPARE(bonjour.m_resolves.size(), 3);

    // withdrawing a service that was never tracked says nothing
    bonjour.RemoveBrowseResult(browser, bonjour.Result(7));
    recorder.Flush();
    QVERIFY(recorder.m_events.isEmpty());
}

void TestBonjour::testWentAwayAfterLastInterface(void)
{
    EventRecorder recorder;
    OfflineBonjour bonjour(&recorder);
    QVERIFY(bonjour.Browse(kType));
    DNSServiceRef browser = bonjour.m_browsers.value(kType);

    bonjour.AddBrowseResult(browser, bonjour.Result(2));
    bonjour.AddBrowseResult(browser, bonjour.Result(3));

    bonjour.RemoveBrowseResult(browser, bonjour.Result(2));
    recorder.Flush();
    QVERIFY(recorder.m_events.isEmpty());

    bonjour.RemoveBrowseResult(browser, bonjour.Result(3));
    recorder.Flush();
    QCOMPARE(recorder.m_events.size(), 1);
    QCOMPARE(recorder.m_events.first(), (int)Mkr::ServiceWentAway);
    QCOMPARE(recorder.m_data.first().value("name").toString(), QString(kName));
    QCOMPARE(recorder.m_data.first().value("type").toString(), QString(kType));

    // both pending resolves were cancelled
    QCOMPARE(bonjour.m_released, 2);
}

void TestBonjour::testResultForUnknownBrowser(void)
{
    EventRecorder recorder;
    OfflineBonjour bonjour(&recorder);
    QVERIFY(bonjour.Browse(kType));

    DNSServiceRef stranger = bonjour.NewReference();
    bonjour.AddBrowseResult(stranger, bonjour.Result(2));
    QVERIFY(bonjour.m_resolves.isEmpty());
}

void TestBonjour::testDeregisterCancelsResolves(void)
{
    EventRecorder recorder;
    OfflineBonjour bonjour(&recorder);
    quint32 reference = bonjour.Browse(kType);
    DNSServiceRef browser = bonjour.m_browsers.value(kType);

    bonjour.AddBrowseResult(browser, bonjour.Result(2));
    bonjour.AddBrowseResult(browser, bonjour.Result(3));
    bonjour.Deregister(reference);

    // the browser and both resolves
    QCOMPARE(bonjour.m_released, 3);

    // a late result from the cancelled browser is ignored
    bonjour.AddBrowseResult(browser, bonjour.Result(5));
    QCOMPARE(bonjour.m_resolves.size(), 2);

    // and browsing can start over
    QVERIFY(bonjour.Browse(kType) != 0);
    QCOMPARE(bonjour.m_browses, 2);
}

void TestBonjour::testReadErrorStopsBrowser(void)
{
    int fds[2];
    QCOMPARE(pipe(fds), 0);
    QCOMPARE((int)write(fds[1], "x", 1), 1);

    {
        EventRecorder recorder;
        OfflineBonjour bonjour(&recorder);

        // the read end stays readable, as a dead daemon's socket does
        bonjour.m_socket = fds[0];
        QVERIFY(bonjour.Browse(kType) != 0);
        bonjour.m_socket = -1;

        for (int i = 0; i < 10; ++i)
            QTest::qWait(20);

        QCOMPARE(bonjour.m_processed, 1);
        QCOMPARE(bonjour.m_released, 1);

        // the failed browser is gone so the type can be browsed again
        QVERIFY(bonjour.Browse(kType) != 0);
        QCOMPARE(bonjour.m_browses, 2);
    }

    close(fds[0]);
    close(fds[1]);
}
