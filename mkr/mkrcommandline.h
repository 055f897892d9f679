#ifndef MKRCOMMANDLINE_H
#define MKRCOMMANDLINE_H

// Qt
#include <QObject>
#include <QVariant>
#include <QHash>

// Mkr
#include "mkrlogging.h"

class MkrArgument;

class MkrCommandLine
{
    Q_GADGET
    Q_FLAGS(Options)

  public:
    enum Option
    {
        None     = (0 << 0),
        Help     = (1 << 0),
        Version  = (1 << 1),
        LogLevel = (1 << 2),
        LogFile  = (1 << 3),
        Verbose  = (1 << 4),
        Ini      = (1 << 5),
        Port     = (1 << 6),
        Browse   = (1 << 7),
        Uuid     = (1 << 8)
    };

    Q_DECLARE_FLAGS(Options, Option)

  public:
    explicit MkrCommandLine(MkrCommandLine::Options Flags);
   ~MkrCommandLine() = default;

    int           Evaluate                     (int argc, const char * const * argv, bool &Exit);
    QVariant      GetValue                     (const QString &Key) const;

  private:
    void          Add                          (const QString &Keys, const QVariant &Default, const QString &HelpText, MkrCommandLine::Options Flags = MkrCommandLine::None, bool ExitImmediately = false);
    QString       HelpText                     (void) const;

  private:
    QHash<QString,MkrArgument> m_options;
    QHash<QString,QString>     m_aliases;
    QHash<QString,QString>     m_help;
    int                        m_maxLength;
};

class MkrArgument
{
  public:
    MkrArgument();
    MkrArgument(const QVariant &Default, const QString &HelpText, MkrCommandLine::Options Flags, bool Exit);

    QVariant                m_value;
    QString                 m_helpText;
    bool                    m_exitImmediately;
    MkrCommandLine::Options m_flags;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(MkrCommandLine::Options)

#endif // MKRCOMMANDLINE_H
