#ifndef TESTSERVICEHANDLER_H
#define TESTSERVICEHANDLER_H

#include <QObject>

class TestServiceHandler : public QObject
{
    Q_OBJECT

  private slots:
    void testAggregate(void);
    void testAggregateEmpty(void);
    void testServiceIdLookup(void);
    void testOwnerKeyLookup(void);
    void testNotFound(void);
    void testHead(void);
    void testOptions(void);
    void testMethodNotAllowed(void);
    void testUnknownPath(void);
    void testResponseHeaders(void);
    void testConnectionHeaderCase(void);
    void testEndToEnd(void);
};

#endif // TESTSERVICEHANDLER_H
