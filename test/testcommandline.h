#ifndef TESTCOMMANDLINE_H
#define TESTCOMMANDLINE_H

#include <QObject>

class TestCommandLine : public QObject
{
    Q_OBJECT

  private slots:
    void testDefaults(void);
    void testOptions(void);
    void testInlineValues(void);
    void testUnknownOption(void);
    void testMissingValue(void);
    void testInvalidNumber(void);
    void testHelpExits(void);
};

#endif // TESTCOMMANDLINE_H
