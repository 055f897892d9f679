// Qt
#include <QtTest/QtTest>

// Mkr
#include "mkrservicedescriptor.h"
#include "testservicedescriptor.h"

static QVariantMap Attributes(void)
{
    QVariantMap attributes;
    attributes.insert("name",     "Status on host");
    attributes.insert("service",  "status");
    attributes.insert("instance", "bbb");
    attributes.insert("uuid",     "U");
    attributes.insert("dsn",      "tcp://h:1");
    return attributes;
}

void TestServiceDescriptor::testRequiredFields(void)
{
    MkrServiceDescriptor empty;
    QVERIFY(!empty.IsValid());

    MkrServiceDescriptor full(Attributes());
    QVERIFY(full.IsValid());
    QCOMPARE(full.GetName(),          QString("Status on host"));
    QCOMPARE(full.GetServiceId(),     QString("status"));
    QCOMPARE(full.GetInstanceId(),    QString("bbb"));
    QCOMPARE(full.GetOwnerUuid(),     QString("U"));
    QCOMPARE(full.GetConnectionUri(), QString("tcp://h:1"));

    // the raw name is not required
    QVariantMap noname = Attributes();
    noname.remove("name");
    QVERIFY(MkrServiceDescriptor(noname).IsValid());

    QStringList required;
    required << "service" << "instance" << "uuid" << "dsn";
    foreach (const QString &key, required)
    {
        QVariantMap missing = Attributes();
        missing.remove(key);
        QVERIFY2(!MkrServiceDescriptor(missing).IsValid(), key.toLatin1().constData());
    }
}

void TestServiceDescriptor::testEmptyFieldIsMissing(void)
{
    QVariantMap attributes = Attributes();
    attributes.insert("dsn", "");
    QVERIFY(!MkrServiceDescriptor(attributes).IsValid());
}

void TestServiceDescriptor::testExtrasPreserved(void)
{
    QVariantMap attributes = Attributes();
    attributes.insert("version", "1");
    attributes.insert("txtvers", "");

    MkrServiceDescriptor descriptor(attributes);
    QVERIFY(descriptor.IsValid());
    QCOMPARE(descriptor.GetExtras().size(), 2);
    QCOMPARE(descriptor.GetExtras().value("version").toString(), QString("1"));
    QVERIFY(descriptor.GetExtras().contains("txtvers"));
    QVERIFY(!descriptor.GetExtras().contains("service"));
}

void TestServiceDescriptor::testSerialisedKeys(void)
{
    QVariantMap attributes = Attributes();
    attributes.insert("version", "1");
    QVariantMap result = MkrServiceDescriptor(attributes).ToVariant();
    QCOMPARE(result.keys(), attributes.keys());
    QCOMPARE(result.value("dsn").toString(), QString("tcp://h:1"));
    QCOMPARE(result.value("version").toString(), QString("1"));

    // no name received, none sent
    attributes.remove("name");
    result = MkrServiceDescriptor(attributes).ToVariant();
    QVERIFY(!result.contains("name"));
    QCOMPARE(result.size(), 5);
}
