#pragma once

#include "network/connection_manager.hpp"
#include "storage/project_store.hpp"
#include "sync/sync_orchestrator.hpp"

#include <QByteArray>
#include <QObject>
#include <QSocketNotifier>
#include <QString>
#include <QStringList>
#include <QTextStream>

namespace tandem::app {

enum class SessionMode {
    Host,  // editor, produces the offer
    Join   // viewer, answers an offer
};

/**
 * ConsoleSession - line-oriented front end on stdin/stdout.
 *
 * First runs the manual handshake (print a code, read the peer's code),
 * then reads commands until `quit` or end of input. Published state
 * changes of the orchestrator are printed as they happen.
 */
class ConsoleSession : public QObject {
    Q_OBJECT

public:
    ConsoleSession(SessionMode mode,
                   network::ConnectionManager& connection,
                   sync::SyncOrchestrator& orchestrator,
                   storage::ProjectStore& store,
                   QObject* parent = nullptr);

    void start();

    /**
     * Execute one command line. Returns false once the session should end.
     */
    bool execute(const QString& line);

signals:
    void finished(int exit_code);

private slots:
    void onStdinReadable();

private:
    enum class Stage {
        Starting,
        AwaitingPeerCode,
        Connecting,
        Commands,
        Leaving
    };

    SessionMode mode_;
    network::ConnectionManager& connection_;
    sync::SyncOrchestrator& orchestrator_;
    storage::ProjectStore& store_;
    QSocketNotifier stdin_notifier_;
    QTextStream out_;
    QByteArray input_;
    Stage stage_ = Stage::Starting;

    void wireOrchestrator();
    void handlePeerCode(const QString& code);
    void printLocalCode(const Result<network::LocalDescriptor>& result);
    void printHelp();
    void printStatus();
    void printItems();
    void report(const Result<void>& result, const QString& success);
    void quit(int exit_code);

    void cmdAdd(const QStringList& args);
    void cmdAttach(const QStringList& args);
    void cmdRename(const QStringList& args);
    void cmdRemove(const QStringList& args);
};

} // namespace tandem::app
