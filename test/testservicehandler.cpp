// Qt
#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QJsonObject>

// Mkr
#include "mkrregistry.h"
#include "mkrhttpserver.h"
#include "mkrhttprequest.h"
#include "mkrservicehandler.h"
#include "testservicehandler.h"

static QVariantMap Service(const QString &Id, const QString &Name, const QString &Instance = QString("bbb"))
{
    QVariantMap attributes;
    attributes.insert("name",     Name);
    attributes.insert("service",  Id);
    attributes.insert("instance", Instance);
    attributes.insert("uuid",     "U");
    attributes.insert("dsn",      "tcp://h:1");
    return attributes;
}

static void Process(MkrServiceHandler &Handler, MkrHTTPRequest &Request)
{
    Handler.ProcessHTTPRequest("127.0.0.1", 40000, "127.0.0.1", 8088, Request);
}

static QVariantMap Body(const MkrHTTPRequest &Request)
{
    return QJsonDocument::fromJson(Request.GetResponseContent()).toVariant().toMap();
}

void TestServiceHandler::testAggregate(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);
    QVERIFY(registry.Accept(Service("status", "a")));
    QVERIFY(registry.Accept(Service("command", "b")));

    MkrHTTPRequest request("GET /machinekit HTTP/1.1", QMap<QString,QString>());
    QCOMPARE(request.GetPath(), QString("/"));
    QCOMPARE(request.GetMethod(), QString("machinekit"));
    Process(handler, request);

    QCOMPARE(request.GetHTTPStatus(), HTTP_OK);
    QVariantMap body = Body(request);
    QCOMPARE(body.size(), 2);
    QCOMPARE(body.value("status").toMap().value("name").toString(), QString("a"));
    QCOMPARE(body.value("command").toMap().value("dsn").toString(), QString("tcp://h:1"));
}

void TestServiceHandler::testAggregateEmpty(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);

    MkrHTTPRequest request("GET /machinekit HTTP/1.1", QMap<QString,QString>());
    Process(handler, request);
    QCOMPARE(request.GetHTTPStatus(), HTTP_NotFound);
    QCOMPARE(request.GetResponseContent(), QByteArray("{}\n"));
}

void TestServiceHandler::testServiceIdLookup(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);
    QVERIFY(registry.Accept(Service("status", "a")));
    QVERIFY(registry.Accept(Service("command", "b")));

    MkrHTTPRequest request("GET /status HTTP/1.1", QMap<QString,QString>());
    Process(handler, request);
    QCOMPARE(request.GetHTTPStatus(), HTTP_OK);
    QVariantMap body = Body(request);
    QCOMPARE(body.size(), 1);
    QCOMPARE(body.value("status").toMap().value("service").toString(), QString("status"));
}

void TestServiceHandler::testOwnerKeyLookup(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);
    QVERIFY(registry.Accept(Service("status",  "a", "bbb")));
    QVERIFY(registry.Accept(Service("command", "b", "ccc")));

    QCOMPARE(QStringList(handler.Lookup("bbb").keys()), QStringList() << "status");
    QCOMPARE(handler.Lookup("U").size(), 2);

    MkrHTTPRequest request("GET /ccc HTTP/1.1", QMap<QString,QString>());
    Process(handler, request);
    QCOMPARE(request.GetHTTPStatus(), HTTP_OK);
    QCOMPARE(QStringList(Body(request).keys()), QStringList() << "command");
}

void TestServiceHandler::testNotFound(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);
    QVERIFY(registry.Accept(Service("status", "a")));

    MkrHTTPRequest request("GET /unknown HTTP/1.1", QMap<QString,QString>());
    Process(handler, request);
    QCOMPARE(request.GetHTTPStatus(), HTTP_NotFound);
    QCOMPARE(request.GetResponseContent(), QByteArray("{}\n"));

    // the bare root is a lookup for the empty key
    MkrHTTPRequest root("GET / HTTP/1.1", QMap<QString,QString>());
    Process(handler, root);
    QCOMPARE(root.GetHTTPStatus(), HTTP_NotFound);
}

void TestServiceHandler::testHead(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);
    QVERIFY(registry.Accept(Service("status", "a")));

    MkrHTTPRequest get("GET /machinekit HTTP/1.1", QMap<QString,QString>());
    MkrHTTPRequest head("HEAD /machinekit HTTP/1.1", QMap<QString,QString>());
    Process(handler, get);
    Process(handler, head);
    QCOMPARE(head.GetHTTPStatus(), get.GetHTTPStatus());
    QCOMPARE(head.GetResponseContent(), get.GetResponseContent());

    QByteArray headers = head.GetResponseHeaders();
    QVERIFY(headers.contains(QByteArray("Content-Length: ") + QByteArray::number(get.GetResponseContent().size())));
}

void TestServiceHandler::testOptions(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);

    MkrHTTPRequest request("OPTIONS /machinekit HTTP/1.1", QMap<QString,QString>());
    Process(handler, request);
    QCOMPARE(request.GetHTTPStatus(), HTTP_OK);
    QByteArray headers = request.GetResponseHeaders();
    QVERIFY(headers.contains("Allow: GET, HEAD, OPTIONS\r\n"));
}

void TestServiceHandler::testMethodNotAllowed(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);

    QStringList methods;
    methods << "POST" << "PUT" << "DELETE";
    foreach (const QString &method, methods)
    {
        MkrHTTPRequest request(method + " /machinekit HTTP/1.1", QMap<QString,QString>());
        Process(handler, request);
        QCOMPARE(request.GetHTTPStatus(), HTTP_MethodNotAllowed);
        QCOMPARE(request.GetResponseContent(), QByteArray("{}\n"));
        QVERIFY(request.GetResponseHeaders().contains("Allow: GET, HEAD, OPTIONS\r\n"));
    }
}

void TestServiceHandler::testUnknownPath(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);
    QVERIFY(registry.Accept(Service("status", "a")));
    MkrHTTPServer server(0);
    server.RegisterHandler(&handler);

    MkrHTTPRequest request("GET /a/status HTTP/1.1", QMap<QString,QString>());
    server.HandleRequest("127.0.0.1", 40000, "127.0.0.1", 8088, request);
    QCOMPARE(request.GetResponseType(), HTTPResponseUnknown);

    QByteArray headers = request.GetResponseHeaders();
    QVERIFY(headers.startsWith("HTTP/1.1 404 Not Found\r\n"));
    QCOMPARE(request.GetResponseContent(), QByteArray("{}\n"));

    server.DeregisterHandler(&handler);
}

void TestServiceHandler::testResponseHeaders(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);
    QVERIFY(registry.Accept(Service("status", "a")));

    MkrHTTPRequest request("GET /status HTTP/1.1", QMap<QString,QString>());
    Process(handler, request);
    QVERIFY(request.GetResponseContent().endsWith('\n'));

    QByteArray headers = request.GetResponseHeaders();
    QVERIFY(headers.startsWith("HTTP/1.1 200 OK\r\n"));
    QVERIFY(headers.contains("Content-Type: application/json\r\n"));
    QVERIFY(headers.contains("Connection: keep-alive\r\n"));
    QVERIFY(headers.contains("Cache-Control: private, no-cache, no-store, must-revalidate\r\n"));
    QVERIFY(headers.contains("\r\nDate: "));
    QVERIFY(headers.contains("\r\nServer: "));
    QVERIFY(headers.endsWith("\r\n\r\n"));

    QMap<QString,QString> close;
    close.insert("Connection", "close");
    MkrHTTPRequest closing("GET /status HTTP/1.1", close);
    QCOMPARE(closing.GetConnection(), HTTPConnectionClose);

    MkrHTTPRequest old("GET /status HTTP/1.0", QMap<QString,QString>());
    QCOMPARE(old.GetConnection(), HTTPConnectionClose);
}

void TestServiceHandler::testConnectionHeaderCase(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);
    QVERIFY(registry.Accept(Service("status", "a")));

    QMap<QString,QString> lower;
    lower.insert("connection", "close");
    MkrHTTPRequest closing("GET /status HTTP/1.1", lower);
    QCOMPARE(closing.GetConnection(), HTTPConnectionClose);
    Process(handler, closing);
    QVERIFY(closing.GetResponseHeaders().contains("Connection: close\r\n"));

    QMap<QString,QString> mixed;
    mixed.insert("CONNECTION", "Keep-Alive");
    MkrHTTPRequest keepalive("GET /status HTTP/1.0", mixed);
    QCOMPARE(keepalive.GetConnection(), HTTPConnectionKeepAlive);
}

void TestServiceHandler::testEndToEnd(void)
{
    MkrRegistry registry("U");
    MkrServiceHandler handler(&registry);

    QVariantMap attributes;
    attributes.insert("name",     "status-raw-name");
    attributes.insert("service",  "status");
    attributes.insert("instance", "bbb");
    attributes.insert("uuid",     "U");
    attributes.insert("dsn",      "tcp://h:1");
    QVERIFY(registry.Accept(attributes));

    MkrHTTPRequest first("GET /machinekit HTTP/1.1", QMap<QString,QString>());
    Process(handler, first);
    QCOMPARE(first.GetHTTPStatus(), HTTP_OK);
    QVariantMap body = Body(first);
    QCOMPARE(QStringList(body.keys()), QStringList() << "status");
    QCOMPARE(body.value("status").toMap(), attributes);

    QVERIFY(registry.Remove("status-raw-name"));

    MkrHTTPRequest second("GET /machinekit HTTP/1.1", QMap<QString,QString>());
    Process(handler, second);
    QCOMPARE(second.GetHTTPStatus(), HTTP_NotFound);
    QVERIFY(QJsonDocument::fromJson(second.GetResponseContent()).object().isEmpty());
}
