#ifndef MKRLOCALCONTEXT_H
#define MKRLOCALCONTEXT_H

// Qt
#include <QObject>
#include <QString>

// Mkr
#include "mkrlocaldefs.h"
#include "mkrconfig.h"
#include "mkrcommandline.h"

class MkrRegistry;
class MkrServiceMonitor;
class MkrHTTPServer;
class MkrServiceHandler;

class Mkr
{
    Q_GADGET
    Q_ENUMS(Actions)

  public:
    enum Actions
    {
        None = 0,
        Start,
        Stop,
        // service discovery
        ServiceDiscovered = 3000,
        ServiceWentAway,
        // end of predefined
        MaxMkr = 60000
    };

    static QString ActionToString(enum Actions Action);
};

class MkrLocalContext : public QObject
{
    Q_OBJECT

  public:
    static int               Create              (MkrCommandLine *CommandLine);
    static void              TearDown            (void);
    static void              NotifyEvent         (int Event);
    static void              QtMessage           (QtMsgType Type, const QMessageLogContext &Context, const QString &Message);

  public slots:
    bool                     event               (QEvent *Event) override;

  private:
    explicit MkrLocalContext(MkrCommandLine *CommandLine);
   ~MkrLocalContext();
    Q_DISABLE_COPY(MkrLocalContext)

    int                      Init                (MkrCommandLine *CommandLine);

  private:
    MkrConfig                m_config;
    MkrRegistry             *m_registry;
    MkrServiceMonitor       *m_serviceMonitor;
    MkrHTTPServer           *m_httpServer;
    MkrServiceHandler       *m_serviceHandler;
};

extern MkrLocalContext *gLocalContext;

#endif // MKRLOCALCONTEXT_H
