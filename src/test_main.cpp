/*
 * test_main.cpp
 *
 * Runs every ringview test suite in one process. Exit code is the number of
 * suites that reported failures.
 */

#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "ring_buffer_test.h"
#include "observable_ring_buffer_test.h"
#include "synchronized_view_test.h"

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);

    int failed = 0;

    qDebug() << "\n" << "ring_buffer test";
    failed += (run_tst_ring_buffer(argc, argv) != 0) ? 1 : 0;

    qDebug() << "\n" << "observable_ring_buffer test";
    failed += (run_tst_observable_ring_buffer(argc, argv) != 0) ? 1 : 0;

    qDebug() << "\n" << "synchronized_view test";
    failed += (run_tst_synchronized_view(argc, argv) != 0) ? 1 : 0;

    return failed;
}
