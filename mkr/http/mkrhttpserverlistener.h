#ifndef MKRHTTPSERVERLISTENER_H
#define MKRHTTPSERVERLISTENER_H

// Qt
#include <QTcpServer>

class MkrHTTPServer;

class MkrHTTPServerListener final : public QTcpServer
{
    Q_OBJECT

  public:
    MkrHTTPServerListener(MkrHTTPServer *Parent, const QHostAddress &Address, int Port = 0);
   ~MkrHTTPServerListener();

    bool Listen(const QHostAddress &Address, int Port = 0);

  signals:
    void NewConnection(qintptr SocketDescriptor);

  protected:
    void incomingConnection (qintptr SocketDescriptor) override final;
};

#endif // MKRHTTPSERVERLISTENER_H
