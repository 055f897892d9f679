// Qt
#include <QtTest/QtTest>
#include <QCoreApplication>
#include <QThread>

// Mkr
#include "mkrlogging.h"
#include "mkrlocaldefs.h"
#include "testservicedescriptor.h"
#include "testregistry.h"
#include "testbonjour.h"
#include "testservicemonitor.h"
#include "testservicehandler.h"
#include "testhttpserver.h"
#include "testconfig.h"
#include "testcommandline.h"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QThread::currentThread()->setObjectName(MKR_MAIN_THREAD);
    StartLogging(QString(), QStringLiteral("err"));

    TestServiceDescriptor testServiceDescriptor;
    TestRegistry testRegistry;
    TestBonjour testBonjour;
    TestServiceMonitor testServiceMonitor;
    TestServiceHandler testServiceHandler;
    TestHTTPServer testHTTPServer;
    TestConfig testConfig;
    TestCommandLine testCommandLine;
    int status = QTest::qExec(&testServiceDescriptor);
    status    |= QTest::qExec(&testRegistry);
    status    |= QTest::qExec(&testBonjour);
    status    |= QTest::qExec(&testServiceMonitor);
    status    |= QTest::qExec(&testServiceHandler);
    status    |= QTest::qExec(&testHTTPServer);
    status    |= QTest::qExec(&testConfig);
    status    |= QTest::qExec(&testCommandLine);
    StopLogging();
    return status;
}
