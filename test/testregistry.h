#ifndef TESTREGISTRY_H
#define TESTREGISTRY_H

#include <QObject>

class TestRegistry : public QObject
{
    Q_OBJECT

  private slots:
    void testAcceptIsIdempotent(void);
    void testFirstWriterWins(void);
    void testSelfFilter(void);
    void testRequiredFieldsGate(void);
    void testRemoveExactName(void);
    void testRemoveUnknown(void);
    void testRemoveOnlyOne(void);
    void testOwnerKeyLookup(void);
    void testServiceIdLookup(void);
    void testSnapshotIndependence(void);
    void testConcurrentAccess(void);
};

#endif // TESTREGISTRY_H
