#ifndef MKREVENT_H
#define MKREVENT_H

// Qt
#include <QMap>
#include <QVariant>
#include <QEvent>

class MkrEvent : public QEvent
{
  public:
    explicit MkrEvent(int Event, const QVariantMap &Data = QVariantMap());
    virtual ~MkrEvent() = default;

    int          GetEvent (void) const;
    QVariantMap& Data     (void);

    static       Type     MkrEventType;

  private:
    Q_DISABLE_COPY(MkrEvent)
    int         m_event;
    QVariantMap m_data;
};

#endif // MKREVENT_H
