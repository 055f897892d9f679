#ifndef MKRHTTPREQUEST_H
#define MKRHTTPREQUEST_H

// Qt
#include <QMap>
#include <QString>
#include <QByteArray>

// Mkr
#include "mkrhttpreader.h"

class QTcpSocket;

typedef enum
{
    HTTPRequest,
    HTTPResponse
} HTTPType;

typedef enum
{
    HTTPUnknownType = (0 << 0),
    HTTPHead        = (1 << 0),
    HTTPGet         = (1 << 1),
    HTTPPost        = (1 << 2),
    HTTPPut         = (1 << 3),
    HTTPDelete      = (1 << 4),
    HTTPOptions     = (1 << 5)
} HTTPRequestType;

typedef enum
{
    HTTPResponseUnknown = 0,
    HTTPResponseNone,
    HTTPResponseJSON
} HTTPResponseType;

typedef enum
{
    HTTPUnknownProtocol = 0,
    HTTPZeroDotNine,
    HTTPOneDotZero,
    HTTPOneDotOne
} HTTPProtocol;

typedef enum
{
    HTTP_OK                  = 200,
    HTTP_BadRequest          = 400,
    HTTP_NotFound            = 404,
    HTTP_MethodNotAllowed    = 405
} HTTPStatus;

typedef enum
{
    HTTPConnectionClose     = 0,
    HTTPConnectionKeepAlive = 1
} HTTPConnection;

class MkrHTTPRequest
{
  public:
    static HTTPRequestType RequestTypeFromString    (const QString &Type);
    static QString         RequestTypeToString      (HTTPRequestType Type);
    static HTTPProtocol    ProtocolFromString       (const QString &Protocol);
    static QString         ProtocolToString         (HTTPProtocol Protocol);
    static QString         StatusToString           (HTTPStatus   Status);
    static QString         ResponseTypeToString     (HTTPResponseType Response);
    static QString         AllowedToString          (int Allowed);
    static QString         ConnectionToString       (HTTPConnection Connection);

    static char            DateFormat[];

  public:
    explicit MkrHTTPRequest(MkrHTTPReader *Reader);
    MkrHTTPRequest(const QString &Method, const QMap<QString,QString> &Headers);
   ~MkrHTTPRequest() = default;

    void                   SetConnection            (HTTPConnection Connection);
    void                   SetStatus                (HTTPStatus Status);
    void                   SetResponseType          (HTTPResponseType Type);
    void                   SetResponseContent       (const QByteArray &Content);
    void                   SetResponseHeader        (const QString &Header, const QString &Value);
    void                   SetAllowed               (int Allowed);
    HTTPStatus             GetHTTPStatus            (void) const;
    HTTPType               GetHTTPType              (void) const;
    HTTPRequestType        GetHTTPRequestType       (void) const;
    HTTPConnection         GetConnection            (void) const;
    HTTPResponseType       GetResponseType          (void) const;
    QString                GetUrl                   (void) const;
    QString                GetPath                  (void) const;
    QString                GetMethod                (void) const;
    const QByteArray&      GetResponseContent       (void) const;
    QByteArray             GetResponseHeaders       (void);
    void                   Respond                  (QTcpSocket *Socket);

  protected:
    void                   Initialise               (const QString &Method);

  protected:
    QString                m_fullUrl;
    QString                m_path;
    QString                m_method;
    HTTPType               m_type;
    HTTPRequestType        m_requestType;
    HTTPProtocol           m_protocol;
    HTTPConnection         m_connection;
    QMap<QString,QString>  m_headers;

    int                    m_allowed;
    HTTPResponseType       m_responseType;
    HTTPStatus             m_responseStatus;
    QByteArray             m_responseContent;
    QMap<QString,QString>  m_responseHeaders;

  private:
    Q_DISABLE_COPY(MkrHTTPRequest)
};

#endif // MKRHTTPREQUEST_H
