#ifndef MKRHTTPCONNECTION_H
#define MKRHTTPCONNECTION_H

// Qt
#include <QRunnable>
#include <QTcpSocket>

class MkrHTTPServer;

class MkrHTTPConnection : public QRunnable
{
  public:
    MkrHTTPConnection(MkrHTTPServer *Parent, qintptr SocketDescriptor, int *Abort);
    virtual ~MkrHTTPConnection() = default;

    void                     run          (void) override;

  protected:
    int                     *m_abort;
    MkrHTTPServer           *m_server;
    qintptr                  m_socketDescriptor;
};

#endif // MKRHTTPCONNECTION_H
