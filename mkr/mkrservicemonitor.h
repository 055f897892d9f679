#ifndef MKRSERVICEMONITOR_H
#define MKRSERVICEMONITOR_H

// Qt
#include <QObject>
#include <QList>
#include <QByteArray>

class MkrRegistry;
class MkrDiscoveryThread;

class MkrServiceMonitor : public QObject
{
    Q_OBJECT

  public:
    explicit MkrServiceMonitor(MkrRegistry *Registry);
   ~MkrServiceMonitor();

    void                Start    (const QList<QByteArray> &Types);
    void                Stop     (void);
    bool                event    (QEvent *Event) override;

  private:
    Q_DISABLE_COPY(MkrServiceMonitor)
    MkrRegistry        *m_registry;
    MkrDiscoveryThread *m_discoveryThread;
};

#endif // MKRSERVICEMONITOR_H
