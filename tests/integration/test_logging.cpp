#include <catch2/catch_test_macros.hpp>

#include "crypto/entropy.hpp"
#include "qt/logging.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace sortid;

namespace {

QString read_all(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString{};
    }
    return QString::fromUtf8(f.readAll());
}

} // namespace

TEST_CASE("File logging writes stamped lines", "[integration][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/sortid.log"));

    REQUIRE(qt::install_file_logging(path));
    qCWarning(sortidEntropyLog) << "entropy pool drained";
    qt::uninstall_file_logging();

    const auto contents = read_all(path);
    REQUIRE(contents.contains(QStringLiteral(" W sortid.entropy entropy pool drained")));
    REQUIRE(contents.endsWith(QLatin1Char('\n')));
}

TEST_CASE("Unknown entropy backend is reported in the log", "[integration][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("sortid.log"));

    qputenv("SORTID_ENTROPY_BACKEND", "dice");
    REQUIRE(qt::install_file_logging(path));
    auto source = crypto::create_entropy_source();
    qt::uninstall_file_logging();
    qunsetenv("SORTID_ENTROPY_BACKEND");

    REQUIRE(source != nullptr);
    REQUIRE(read_all(path).contains(QStringLiteral("unknown SORTID_ENTROPY_BACKEND")));
}

TEST_CASE("Backend selection is logged when debugging is enabled", "[integration][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("sortid.log"));

    QLoggingCategory::setFilterRules(QStringLiteral("sortid.entropy.info=true"));
    qputenv("SORTID_DEBUG_ENTROPY", "1");
    qputenv("SORTID_ENTROPY_BACKEND", "simple");
    qputenv("SORTID_ENTROPY_SEED", "42");
    REQUIRE(qt::install_file_logging(path));
    auto source = crypto::create_entropy_source();
    qt::uninstall_file_logging();
    qunsetenv("SORTID_DEBUG_ENTROPY");
    qunsetenv("SORTID_ENTROPY_BACKEND");
    qunsetenv("SORTID_ENTROPY_SEED");

    REQUIRE(read_all(path).contains(QStringLiteral("using simple entropy backend")));
}

TEST_CASE("install_file_logging rejects an empty path", "[integration][logging]") {
    REQUIRE_FALSE(qt::install_file_logging(QString()));
}

TEST_CASE("Log file path comes from SORTID_LOG_FILE", "[integration][logging]") {
    qputenv("SORTID_LOG_FILE", "/tmp/sortid-test.log");
    REQUIRE(qt::log_file_path_from_env() == QStringLiteral("/tmp/sortid-test.log"));
    qunsetenv("SORTID_LOG_FILE");
    REQUIRE(qt::log_file_path_from_env().isEmpty());
}
