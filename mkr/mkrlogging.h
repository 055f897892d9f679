#ifndef MKRLOGGING_H_
#define MKRLOGGING_H_

#include <QString>
#include <stdint.h>

#include "mkrloggingdefs.h"

#define VERBOSE_LEVEL_CHECK(_MASK_, _LEVEL_) \
    (((gVerboseMask & (_MASK_)) == (_MASK_)) && gLogLevel >= (_LEVEL_))

#define LOG(_MASK_, _LEVEL_, _STRING_)                                  \
    do {                                                                \
        if (VERBOSE_LEVEL_CHECK((_MASK_), (_LEVEL_)) && ((_LEVEL_)>=0)) \
        {                                                               \
            PrintLogLine(_MASK_, (LogLevel)_LEVEL_,                     \
                         __FILE__, __LINE__, __FUNCTION__,              \
                         QString(_STRING_).toLocal8Bit().constData());  \
        }                                                               \
    } while (false)

void PrintLogLine(uint64_t Mask, LogLevel Level, const char *File, int Line,
                  const char *Function, const char *Message);

extern LogLevel   gLogLevel;
extern uint64_t   gVerboseMask;
extern QString    gVerboseString;

void     StartLogging(const QString &Logfile, const QString &Level = QStringLiteral("info"));
void     StopLogging(void);
void     RegisterLoggingThread(void);
void     DeregisterLoggingThread(void);
LogLevel GetLogLevel(const QString &Level);
QString  GetLogLevelName(LogLevel Level);
int      ParseVerboseArgument(const QString &Arg);

#endif

// vim:ts=4:sw=4:ai:et:si:sts=4
