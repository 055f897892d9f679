#ifndef MKRCONFIG_H
#define MKRCONFIG_H

// Qt
#include <QList>
#include <QString>
#include <QByteArray>

class MkrConfig
{
  public:
    static QString    ResolvePath       (const QString &CommandLinePath);

  public:
    MkrConfig();
   ~MkrConfig() = default;

    int               Load              (const QString &Path);
    int               Validate          (void);
    QString           GetErrorString    (void) const;
    QString           GetPath           (void) const;
    QString           GetUuid           (void) const;
    bool              GetRemoteEnabled  (void) const;
    int               GetPort           (void) const;
    QList<QByteArray> GetBrowseTypes    (void) const;

    void              SetUuid           (const QString &Uuid);
    void              SetPort           (int Port);
    void              AddBrowseTypes    (const QString &Types);

  private:
    QString           m_path;
    QString           m_errorString;
    QString           m_uuid;
    bool              m_remote;
    int               m_port;
    QList<QByteArray> m_browseTypes;
};

#endif // MKRCONFIG_H
