#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("weave");
    QCoreApplication::setOrganizationDomain("weave.local");
    QCoreApplication::setApplicationName("weave_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/weave_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());
    QStandardPaths::setTestModeEnabled(true);
    Catch::Session session;
    return session.run(argc, argv);
}
