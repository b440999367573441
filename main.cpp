#include <QCoreApplication>
#include <QDebug>

#include "src/slot_buffer_test.h"
#include "src/source_test.h"
#include "src/chunker_test.h"


int main(int argc, char *argv[])
{
    // QProcess-based death tests need applicationFilePath().
    QCoreApplication app(argc, argv);

    int failures = 0;

    qDebug() << "\n" << "slot_buffer test";
    failures += run_tst_slot_buffer_api_paranoid(-1, nullptr);

    qDebug() << "\n" << "source test";
    failures += run_tst_source_api(-1, nullptr);

    qDebug() << "\n" << "chunker test";
    failures += run_tst_chunker_api_paranoid(-1, nullptr);

    if (failures != 0) {
        qDebug() << "\n" << failures << "failed test function(s)";
    }
    return failures == 0 ? 0 : 1;
}
