#ifndef MKRHTTPSERVER_H
#define MKRHTTPSERVER_H

// Qt
#include <QMap>
#include <QObject>
#include <QThreadPool>
#include <QReadWriteLock>

// Mkr
#include "mkrhttprequest.h"

class MkrHTTPHandler;
class MkrHTTPServerListener;

class MkrHTTPServer final : public QObject
{
    Q_OBJECT

  public:
    static QString PlatformName       (void);

  public:
    explicit MkrHTTPServer(int Port);
   ~MkrHTTPServer();

    bool           Open               (void);
    void           Close              (void);
    bool           IsListening        (void) const;
    int            GetPort            (void) const;
    void           RegisterHandler    (MkrHTTPHandler *Handler);
    void           DeregisterHandler  (MkrHTTPHandler *Handler);
    void           HandleRequest      (const QString &PeerAddress, int PeerPort, const QString &LocalAddress, int LocalPort, MkrHTTPRequest &Request);

  public slots:
    void           NewConnection      (qintptr SocketDescriptor);

  private:
    int                           m_port;
    MkrHTTPServerListener        *m_listener;
    QThreadPool                   m_pool;
    int                           m_abort;
    QReadWriteLock                m_handlersLock;
    QMap<QString,MkrHTTPHandler*> m_handlers;

  private:
    Q_DISABLE_COPY(MkrHTTPServer)
};

#endif // MKRHTTPSERVER_H
