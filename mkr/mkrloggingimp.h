#ifndef MKRLOGGINGIMP_H
#define MKRLOGGINGIMP_H

#define LOGLINE_MAX (2048-120)

// Qt
#include <QFile>
#include <QWaitCondition>

// Mkr
#include "mkrqthread.h"

class LogItem;

class LoggingThread : public MkrQThread
{
  public:
    LoggingThread();
   ~LoggingThread();

    void Start      (void) override;
    void Finish     (void) override;
    void Stop       (void);
    bool Flush      (int TimeoutMS = 200000);
    void HandleItem (LogItem *Item);

  protected:
    void run        (void) override;

  private:
    QWaitCondition m_waitNotEmpty;
    QWaitCondition m_waitEmpty;
    bool           m_aborted;
};

class LoggerBase
{
  public:
    explicit LoggerBase(const QString &FileName);
    virtual ~LoggerBase() = default;

    virtual bool Logmsg(LogItem *Item) = 0;

  protected:
    virtual bool PrintLine (QByteArray &Line) = 0;
    QByteArray   GetLine(LogItem *Item);

  protected:
    QString      m_fileName;

  private:
    Q_DISABLE_COPY(LoggerBase)
};

class FileLogger : public LoggerBase
{
  public:
    explicit FileLogger(const QString &Filename);
   ~FileLogger();

    bool   Logmsg(LogItem *Item) override;

  protected:
    bool   PrintLine (QByteArray &Line) override;

  protected:
    bool   m_opened;
    QFile  m_file;
};

#endif // MKRLOGGINGIMP_H
