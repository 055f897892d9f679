// Qt
#include <QCoreApplication>
#include <QScopedPointer>
#include <QThread>

// Mkr
#include "mkrlocalcontext.h"
#include "mkrexitcodes.h"
#include "mkrcommandline.h"

int main(int argc, char **argv)
{
    int ret = MKR_EXIT_OK;

    QCoreApplication mkrelay(argc, argv);
    QCoreApplication::setApplicationName(MKR_MKRELAY);
    QCoreApplication::setApplicationVersion(MKR_VERSION);
    QThread::currentThread()->setObjectName(MKR_MAIN_THREAD);

    {
        bool justexit = false;
        QScopedPointer<MkrCommandLine> cmdline(new MkrCommandLine(MkrCommandLine::Help | MkrCommandLine::Version |
                                                                  MkrCommandLine::LogLevel | MkrCommandLine::LogFile |
                                                                  MkrCommandLine::Verbose | MkrCommandLine::Ini |
                                                                  MkrCommandLine::Port | MkrCommandLine::Browse |
                                                                  MkrCommandLine::Uuid));

        if (!cmdline.data())
            return MKR_EXIT_UNKOWN_ERROR;

        ret = cmdline->Evaluate(argc, argv, justexit);

        if (ret != MKR_EXIT_OK)
            return ret;

        if (justexit)
            return ret;

        if (int error = MkrLocalContext::Create(cmdline.data()))
            return error;
    }

    ret = qApp->exec();
    MkrLocalContext::TearDown();

    return ret;
}
