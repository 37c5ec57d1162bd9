#include <QCoreApplication>
#include <catch2/catch_session.hpp>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ksuid_cli_tests");
    Catch::Session session;
    return session.run(argc, argv);
}
