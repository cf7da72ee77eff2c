#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QTextStream>

#include "app/console_session.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "network/connection_manager.hpp"
#include "network/rtc_peer_transport.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/project_repository.hpp"
#include "sync/sync_orchestrator.hpp"

#include <memory>

namespace {

QString default_database_path() {
    const auto env = qEnvironmentVariable("TANDEM_DB_PATH");
    if (!env.isEmpty()) {
        return env;
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    QDir().mkpath(base);
    return QDir(base).filePath(QStringLiteral("tandem.db"));
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Tandem");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Tandem");
    app.setOrganizationDomain("tandem.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Tandem peer-to-peer project sync"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets TANDEM_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets TANDEM_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write the log to this file instead of the default location."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    parser.addPositionalArgument(QStringLiteral("mode"),
                                 QStringLiteral("'host' (editor, creates the offer) or 'join' (viewer)."));
    parser.process(app);

    const auto positional = parser.positionalArguments();
    const auto mode_name = positional.isEmpty() ? QString{} : positional.first();
    if (mode_name != QStringLiteral("host") && mode_name != QStringLiteral("join")) {
        QTextStream(stderr) << "usage: tandem [options] host|join\n";
        return 2;
    }
    const auto mode = mode_name == QStringLiteral("host") ? tandem::app::SessionMode::Host
                                                          : tandem::app::SessionMode::Join;

    if (parser.isSet(dbPathOption)) {
        qputenv("TANDEM_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    const bool debugSync = parser.isSet(debugSyncOption);
    if (debugSync) {
        qputenv("TANDEM_DEBUG_SYNC", "1");
    }

    tandem::install_file_logging(parser.value(logFileOption));
    qInfo() << "Tandem: logging to"
            << (parser.isSet(logFileOption) ? parser.value(logFileOption)
                                            : tandem::default_log_file_path());
    if (debugSync) {
        qInfo() << "Tandem: sync debug enabled";
    }

    QSettings settings;
    const auto config = tandem::load_sync_config(settings);
    tandem::store_sync_config(settings, config);

    const auto db_path = default_database_path();
    auto opened = tandem::storage::Database::open(db_path.toStdString());
    if (opened.is_err()) {
        qCritical() << "Failed to open database" << db_path << ":"
                    << opened.unwrap_err().message.c_str();
        return 1;
    }
    auto db = std::move(opened).unwrap();

    auto migrated = tandem::storage::initialize_database(db);
    if (migrated.is_err()) {
        qCritical() << "Failed to migrate database:" << migrated.unwrap_err().message.c_str();
        return 1;
    }

    tandem::storage::ProjectRepository store(db);

    tandem::network::ConnectionManager connection(
        std::make_unique<tandem::network::RtcPeerTransport>(config.ice_servers), config);
    tandem::sync::SyncOrchestrator orchestrator(connection, store, config);
    tandem::app::ConsoleSession session(mode, connection, orchestrator, store);

    QObject::connect(&session, &tandem::app::ConsoleSession::finished, &app,
                     [](int exit_code) { QCoreApplication::exit(exit_code); },
                     Qt::QueuedConnection);

    session.start();
    return app.exec();
}
