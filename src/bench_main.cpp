#include <QCoreApplication>

#include "single_slot_queue_bench.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    return run_single_slot_queue_bench();
}
