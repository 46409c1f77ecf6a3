#include <QCoreApplication>
#include <catch2/catch_session.hpp>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("sortid");
    QCoreApplication::setApplicationName("sortid_integration_tests");
    Catch::Session session;
    return session.run(argc, argv);
}
