#ifndef MKRLOCALDEFS_H
#define MKRLOCALDEFS_H

#define MKR_MKRELAY          QStringLiteral("mkrelay")
#define MKR_VERSION          QStringLiteral("0.3.1")
#define MKR_MAIN_THREAD      QStringLiteral("MainLoop")
#define MKR_DISCOVERY_THREAD QStringLiteral("Discovery")

// well known path for the complete service list
#define MKR_AGGREGATE_PATH   QStringLiteral("machinekit")
#define MKR_DEFAULT_PORT     8088
#define MKR_DEFAULT_TYPE     QByteArray("_machinekit._tcp")

// each connection holds a pooled thread until it closes or goes idle
#define MKR_HTTP_MAX_THREADS 512
#define MKR_HTTP_IDLE_MS     5000
#define MKR_HTTP_POLL_MS     100

// configuration
#define MKR_DEFAULT_INI      QStringLiteral("/etc/linuxcnc/machinekit.ini")
#define MKR_INI_ENVIRONMENT  "MACHINEKIT_INI"
#define MKR_INI_UUID         QStringLiteral("MACHINEKIT/MKUUID")
#define MKR_INI_REMOTE       QStringLiteral("MACHINEKIT/REMOTE")
#define MKR_INI_PORT         QStringLiteral("MKRELAY/PORT")
#define MKR_INI_BROWSE       QStringLiteral("MKRELAY/BROWSE")

// text record keys as advertised by machinekit
#define MKR_TXT_NAME         QStringLiteral("name")
#define MKR_TXT_SERVICE      QStringLiteral("service")
#define MKR_TXT_INSTANCE     QStringLiteral("instance")
#define MKR_TXT_UUID         QStringLiteral("uuid")
#define MKR_TXT_DSN          QStringLiteral("dsn")

#endif // MKRLOCALDEFS_H
