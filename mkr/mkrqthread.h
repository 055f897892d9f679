#ifndef MKRQTHREAD_H
#define MKRQTHREAD_H

// Qt
#include <QThread>

class MkrQThread : public QThread
{
  public:
    explicit MkrQThread(const QString &Name);
    virtual ~MkrQThread() = default;

    virtual void Start         (void) = 0;
    virtual void Finish        (void) = 0;

  protected:
    void         run           (void) override;
    void         Initialise    (void);
    void         Deinitialise  (void);
};

#endif // MKRQTHREAD_H
