// Qt
#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>

// Mkr
#include "mkrexitcodes.h"
#include "mkrconfig.h"
#include "testconfig.h"

static QString WriteIni(QTemporaryDir &Dir, const QByteArray &Content)
{
    QString path = Dir.path() + "/machinekit.ini";
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return QString();
    file.write(Content);
    file.close();
    return path;
}

void TestConfig::testLoad(void)
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString path = WriteIni(dir, "[MACHINEKIT]\nMKUUID=a42c8c6b-4025-4f83-ba28-dad21114744a\nREMOTE=1\n");

    MkrConfig config;
    QCOMPARE(config.Load(path), (int)MKR_EXIT_OK);
    QCOMPARE(config.Validate(), (int)MKR_EXIT_OK);
    QCOMPARE(config.GetPath(), path);
    QCOMPARE(config.GetUuid(), QString("a42c8c6b-4025-4f83-ba28-dad21114744a"));
    QVERIFY(config.GetRemoteEnabled());
    QCOMPARE(config.GetPort(), 8088);
    QCOMPARE(config.GetBrowseTypes(), QList<QByteArray>() << QByteArray("_machinekit._tcp"));
}

void TestConfig::testBracesAndBrowse(void)
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString path = WriteIni(dir, "[MACHINEKIT]\nMKUUID={a42c8c6b-4025-4f83-ba28-dad21114744a}\nREMOTE=1\n"
                                 "[MKRELAY]\nPORT=9000\nBROWSE=_http._tcp, _machinekit._tcp ,_ssh._tcp\n");

    MkrConfig config;
    QCOMPARE(config.Load(path), (int)MKR_EXIT_OK);
    QCOMPARE(config.GetUuid(), QString("a42c8c6b-4025-4f83-ba28-dad21114744a"));
    QCOMPARE(config.GetPort(), 9000);

    QList<QByteArray> types = config.GetBrowseTypes();
    QCOMPARE(types.size(), 3);
    QCOMPARE(types.at(0), QByteArray("_machinekit._tcp"));
    QVERIFY(types.contains("_http._tcp"));
    QVERIFY(types.contains("_ssh._tcp"));
}

void TestConfig::testMissingFile(void)
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    MkrConfig config;
    QCOMPARE(config.Load(dir.path() + "/nothere.ini"), (int)MKR_EXIT_INVALID_CONFIG);
    QVERIFY(!config.GetErrorString().isEmpty());
}

void TestConfig::testMissingUuid(void)
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString path = WriteIni(dir, "[MACHINEKIT]\nREMOTE=1\n");

    MkrConfig config;
    QCOMPARE(config.Load(path), (int)MKR_EXIT_OK);
    QCOMPARE(config.Validate(), (int)MKR_EXIT_INVALID_CONFIG);
    QVERIFY(config.GetErrorString().contains("MKUUID"));
}

void TestConfig::testRemoteDisabled(void)
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString path = WriteIni(dir, "[MACHINEKIT]\nMKUUID=U\nREMOTE=0\n");

    MkrConfig config;
    QCOMPARE(config.Load(path), (int)MKR_EXIT_OK);
    QVERIFY(!config.GetRemoteEnabled());
    QCOMPARE(config.Validate(), (int)MKR_EXIT_REMOTE_DISABLED);

    // missing is disabled too
    path = WriteIni(dir, "[MACHINEKIT]\nMKUUID=U\n");
    MkrConfig missing;
    QCOMPARE(missing.Load(path), (int)MKR_EXIT_OK);
    QCOMPARE(missing.Validate(), (int)MKR_EXIT_REMOTE_DISABLED);
}

void TestConfig::testOverrides(void)
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString path = WriteIni(dir, "[MACHINEKIT]\nREMOTE=1\n");

    MkrConfig config;
    QCOMPARE(config.Load(path), (int)MKR_EXIT_OK);
    config.SetUuid("{V}");
    config.SetPort(0);
    config.AddBrowseTypes("_http._tcp,_machinekit._tcp");
    QCOMPARE(config.Validate(), (int)MKR_EXIT_OK);
    QCOMPARE(config.GetUuid(), QString("V"));
    QCOMPARE(config.GetPort(), 0);
    QCOMPARE(config.GetBrowseTypes().size(), 2);

    config.SetPort(70000);
    QCOMPARE(config.Validate(), (int)MKR_EXIT_INVALID_CONFIG);
}

void TestConfig::testResolvePath(void)
{
    QByteArray saved = qgetenv("MACHINEKIT_INI");

    qunsetenv("MACHINEKIT_INI");
    QCOMPARE(MkrConfig::ResolvePath(QString()), QString("/etc/linuxcnc/machinekit.ini"));

    qputenv("MACHINEKIT_INI", "/tmp/env.ini");
    QCOMPARE(MkrConfig::ResolvePath(QString()), QString("/tmp/env.ini"));
    QCOMPARE(MkrConfig::ResolvePath("/tmp/cmd.ini"), QString("/tmp/cmd.ini"));

    if (saved.isEmpty())
        qunsetenv("MACHINEKIT_INI");
    else
        qputenv("MACHINEKIT_INI", saved);
}
