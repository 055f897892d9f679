// Qt
#include <QtTest/QtTest>
#include <QCoreApplication>

// Mkr
#include "mkrevent.h"
#include "mkrregistry.h"
#include "mkrlocalcontext.h"
#include "mkrservicemonitor.h"
#include "testservicemonitor.h"

static QVariantMap Service(const QString &Name)
{
    QVariantMap attributes;
    attributes.insert("name",     Name);
    attributes.insert("service",  "status");
    attributes.insert("instance", "bbb");
    attributes.insert("uuid",     "U");
    attributes.insert("dsn",      "tcp://h:1");
    return attributes;
}

void TestServiceMonitor::testServiceDiscovered(void)
{
    MkrRegistry registry("U");
    MkrServiceMonitor monitor(&registry);

    QCoreApplication::postEvent(&monitor, new MkrEvent(Mkr::ServiceDiscovered, Service("status-raw-name")));
    QCOMPARE(registry.Count(), 0);
    QCoreApplication::sendPostedEvents(&monitor, MkrEvent::MkrEventType);
    QCOMPARE(registry.Count(), 1);

    // foreign advertisements never reach the registry
    QVariantMap foreign = Service("other");
    foreign.insert("uuid", "V");
    foreign.insert("service", "command");
    QCoreApplication::postEvent(&monitor, new MkrEvent(Mkr::ServiceDiscovered, foreign));
    QCoreApplication::sendPostedEvents(&monitor, MkrEvent::MkrEventType);
    QCOMPARE(registry.Count(), 1);
}

void TestServiceMonitor::testServiceWentAway(void)
{
    MkrRegistry registry("U");
    MkrServiceMonitor monitor(&registry);
    QVERIFY(registry.Accept(Service("status-raw-name")));

    QVariantMap gone;
    gone.insert("name", "status-raw-name");
    gone.insert("type", "_machinekit._tcp");
    QCoreApplication::postEvent(&monitor, new MkrEvent(Mkr::ServiceWentAway, gone));
    QCoreApplication::sendPostedEvents(&monitor, MkrEvent::MkrEventType);
    QCOMPARE(registry.Count(), 0);

    // a second removal is a no-op
    QCoreApplication::postEvent(&monitor, new MkrEvent(Mkr::ServiceWentAway, gone));
    QCoreApplication::sendPostedEvents(&monitor, MkrEvent::MkrEventType);
    QCOMPARE(registry.Count(), 0);
}

void TestServiceMonitor::testUnrelatedEvents(void)
{
    MkrRegistry registry("U");
    MkrServiceMonitor monitor(&registry);

    QCoreApplication::postEvent(&monitor, new MkrEvent(Mkr::Stop, Service("status-raw-name")));
    QCoreApplication::sendPostedEvents(&monitor, MkrEvent::MkrEventType);
    QCOMPARE(registry.Count(), 0);
    QCOMPARE(Mkr::ActionToString(Mkr::ServiceDiscovered), QString("ServiceDiscovered"));
}
