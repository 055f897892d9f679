#ifndef TESTSERVICEDESCRIPTOR_H
#define TESTSERVICEDESCRIPTOR_H

#include <QObject>

class TestServiceDescriptor : public QObject
{
    Q_OBJECT

  private slots:
    void testRequiredFields(void);
    void testEmptyFieldIsMissing(void);
    void testExtrasPreserved(void);
    void testSerialisedKeys(void);
};

#endif // TESTSERVICEDESCRIPTOR_H
