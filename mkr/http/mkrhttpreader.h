#ifndef MKRHTTPREADER_H
#define MKRHTTPREADER_H

// Qt
#include <QMap>
#include <QByteArray>
#include <QTcpSocket>

#define MKR_HTTP_MAX_HEADERS     200
#define MKR_HTTP_MAX_HEADER_SIZE 1000

class MkrHTTPReader
{
  public:
    MkrHTTPReader();
   ~MkrHTTPReader() = default;

    void                   TakeRequest      (QMap<QString,QString> &Headers);
    QString                GetMethod        (void) const;
    bool                   Read             (QTcpSocket *Socket);
    bool                   IsReady          (void) const;
    bool                   HeadersComplete  (void) const;
    void                   Reset            (void);

  private:
    bool                   m_ready;
    bool                   m_requestStarted;
    bool                   m_headersComplete;
    int                    m_headersRead;
    quint64                m_contentLength;
    quint64                m_contentReceived;
    QString                m_method;
    QMap<QString,QString>  m_headers;
};

#endif // MKRHTTPREADER_H
