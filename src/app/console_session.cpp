#include "app/console_session.hpp"

#include "core/item.hpp"
#include "core/logging.hpp"
#include "network/signaling_codec.hpp"

#include <QCoreApplication>
#include <QDebug>
#include <QFile>

#include <unistd.h>

#include <algorithm>
#include <cstdio>

namespace tandem::app {

using sync::PeerRole;
using sync::RoleTransferPhase;
using sync::ReconnectionPhase;
using sync::SyncPhase;

namespace {

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

QString errorText(const Error& error) {
    return qs(error.message);
}

} // namespace

ConsoleSession::ConsoleSession(SessionMode mode,
                               network::ConnectionManager& connection,
                               sync::SyncOrchestrator& orchestrator,
                               storage::ProjectStore& store,
                               QObject* parent)
    : QObject(parent)
    , mode_(mode)
    , connection_(connection)
    , orchestrator_(orchestrator)
    , store_(store)
    , stdin_notifier_(STDIN_FILENO, QSocketNotifier::Read)
    , out_(stdout)
{
    connect(&stdin_notifier_, &QSocketNotifier::activated, this, &ConsoleSession::onStdinReadable);
    wireOrchestrator();
}

void ConsoleSession::wireOrchestrator() {
    connect(&connection_, &network::ConnectionManager::stateChanged, this,
            [this](network::ConnectionState state) {
        out_ << "* connection: " << network::connectionStateName(state) << Qt::endl;
        if (state == network::ConnectionState::Connected && stage_ == Stage::Connecting) {
            stage_ = Stage::Commands;
            out_ << "* connected; type 'help' for commands" << Qt::endl;
        }
        if ((state == network::ConnectionState::Disconnected ||
             state == network::ConnectionState::Error) &&
            stage_ == Stage::Connecting) {
            out_ << "* handshake failed" << Qt::endl;
            quit(1);
        }
    });
    connect(&connection_, &network::ConnectionManager::errorOccurred, this,
            [this](const Error& error) {
        out_ << "! " << errorText(error) << Qt::endl;
    });

    connect(&orchestrator_, &sync::SyncOrchestrator::progressChanged, this,
            [this](const sync::SyncProgress& progress) {
        switch (progress.phase) {
            case SyncPhase::Transferring:
                if (progress.total_bytes_total > 0 && sync_debug_enabled()) {
                    out_ << "* sync " << progress.total_bytes_transferred << "/"
                         << progress.total_bytes_total << " bytes" << Qt::endl;
                }
                break;
            case SyncPhase::Complete:
                out_ << "* sync complete"
                     << (orchestrator_.hasStagedSnapshot() ? "; 'commit' or 'discard'" : "")
                     << Qt::endl;
                break;
            case SyncPhase::Error:
                out_ << "* sync failed: " << qs(progress.error.value_or("unknown error"))
                     << Qt::endl;
                break;
            default:
                break;
        }
    });
    connect(&orchestrator_, &sync::SyncOrchestrator::pendingRequestChanged, this, [this]() {
        const auto& request = orchestrator_.pendingRequest();
        if (!request) return;
        out_ << "* incoming sync: " << request->items.size() << " items, "
             << request->total_bytes << " bytes; 'accept' or 'reject'" << Qt::endl;
    });
    connect(&orchestrator_, &sync::SyncOrchestrator::syncRejected, this,
            [this](const QString& reason) {
        out_ << "* peer rejected sync: " << reason << Qt::endl;
    });
    connect(&orchestrator_, &sync::SyncOrchestrator::projectReloaded, this, [this]() {
        out_ << "* project replaced from peer" << Qt::endl;
    });
    connect(&orchestrator_, &sync::SyncOrchestrator::itemTransferFailed, this,
            [this](const QString& id, const QString& message) {
        out_ << "! payload of " << id << " lost: " << message << Qt::endl;
    });
    connect(&orchestrator_, &sync::SyncOrchestrator::roleChanged, this, [this]() {
        if (auto role = orchestrator_.role()) {
            out_ << "* role: " << sync::peerRoleName(*role) << Qt::endl;
        }
    });
    connect(&orchestrator_, &sync::SyncOrchestrator::roleTransferChanged, this, [this]() {
        const auto& transfer = orchestrator_.roleTransfer();
        switch (transfer.phase) {
            case RoleTransferPhase::PendingApproval:
                out_ << "* peer requests the editor role";
                if (transfer.reason) out_ << " (" << qs(*transfer.reason) << ")";
                out_ << "; 'grant' or 'deny'" << Qt::endl;
                break;
            case RoleTransferPhase::Denied:
                out_ << "* role request denied";
                if (transfer.reason) out_ << ": " << qs(*transfer.reason);
                out_ << Qt::endl;
                break;
            default:
                break;
        }
    });
    connect(&orchestrator_, &sync::SyncOrchestrator::reconnectionChanged, this, [this]() {
        const auto& state = orchestrator_.reconnection();
        if (state.phase == ReconnectionPhase::Idle) return;
        out_ << "* " << sync::reconnectionPhaseName(state.phase);
        if (state.reason) out_ << ": " << qs(*state.reason);
        out_ << Qt::endl;
    });
    connect(&orchestrator_, &sync::SyncOrchestrator::errorOccurred, this,
            [this](const Error& error) {
        out_ << "! " << errorText(error) << Qt::endl;
    });
}

void ConsoleSession::start() {
    if (mode_ == SessionMode::Host) {
        orchestrator_.setPreferredRole(PeerRole::Editor);
        out_ << "* gathering connection candidates..." << Qt::endl;
        connection_.initiate([this](Result<network::LocalDescriptor> result) {
            printLocalCode(result);
            if (result.is_err()) {
                quit(1);
                return;
            }
            out_ << "* paste the peer's answer code:" << Qt::endl;
            stage_ = Stage::AwaitingPeerCode;
        });
    } else {
        orchestrator_.setPreferredRole(PeerRole::Viewer);
        out_ << "* paste the host's offer code:" << Qt::endl;
        stage_ = Stage::AwaitingPeerCode;
    }
}

void ConsoleSession::printLocalCode(const Result<network::LocalDescriptor>& result) {
    if (result.is_err()) {
        out_ << "! " << errorText(result.unwrap_err()) << Qt::endl;
        return;
    }
    out_ << "* share this code with your peer:" << Qt::endl
         << qs(result.unwrap().code) << Qt::endl;
}

void ConsoleSession::handlePeerCode(const QString& code) {
    auto decoded = network::decodeDescriptor(code.trimmed().toStdString());
    if (decoded.is_err()) {
        out_ << "! " << errorText(decoded.unwrap_err()) << "; try again" << Qt::endl;
        return;
    }

    if (mode_ == SessionMode::Host) {
        auto completed = connection_.complete(decoded.unwrap());
        if (completed.is_err()) {
            out_ << "! " << errorText(completed.unwrap_err()) << "; try again" << Qt::endl;
            return;
        }
        stage_ = Stage::Connecting;
        out_ << "* connecting..." << Qt::endl;
        return;
    }

    stage_ = Stage::Connecting;
    out_ << "* preparing answer..." << Qt::endl;
    connection_.accept(decoded.unwrap(), [this](Result<network::LocalDescriptor> result) {
        printLocalCode(result);
        if (result.is_err()) {
            stage_ = Stage::AwaitingPeerCode;
            out_ << "* paste the host's offer code:" << Qt::endl;
        }
    });
}

void ConsoleSession::onStdinReadable() {
    char buffer[4096];
    const auto n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n <= 0) {
        stdin_notifier_.setEnabled(false);
        if (stage_ != Stage::Leaving) {
            execute(QStringLiteral("quit"));
        }
        return;
    }
    input_.append(buffer, static_cast<qsizetype>(n));

    qsizetype newline;
    while ((newline = input_.indexOf('\n')) >= 0) {
        const auto line = QString::fromUtf8(input_.left(newline)).trimmed();
        input_.remove(0, newline + 1);
        if (line.isEmpty()) continue;
        if (!execute(line)) break;
    }
}

bool ConsoleSession::execute(const QString& line) {
    if (stage_ == Stage::Leaving) return false;

    if (stage_ == Stage::AwaitingPeerCode) {
        if (line == QStringLiteral("quit")) {
            quit(0);
            return false;
        }
        handlePeerCode(line);
        return true;
    }

    auto args = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (args.isEmpty()) return true;
    const auto command = args.takeFirst().toLower();
    const auto rest = args.join(QLatin1Char(' '));
    const auto optional_reason = [&]() -> std::optional<std::string> {
        if (rest.isEmpty()) return std::nullopt;
        return rest.toStdString();
    };

    if (command == QStringLiteral("quit")) {
        if (connection_.isConnected()) {
            stage_ = Stage::Leaving;
            out_ << "* leaving session..." << Qt::endl;
            orchestrator_.endSession([this]() { quit(0); });
        } else {
            quit(0);
        }
        return false;
    }
    if (command == QStringLiteral("help")) {
        printHelp();
    } else if (command == QStringLiteral("status")) {
        printStatus();
    } else if (command == QStringLiteral("list")) {
        printItems();
    } else if (command == QStringLiteral("sync")) {
        report(orchestrator_.startSync(), QStringLiteral("sync requested"));
    } else if (command == QStringLiteral("accept")) {
        report(orchestrator_.acceptSync(), QStringLiteral("sync accepted"));
    } else if (command == QStringLiteral("reject")) {
        report(orchestrator_.rejectSync(rest.isEmpty() ? std::string("declined") : rest.toStdString()),
               QStringLiteral("sync rejected"));
    } else if (command == QStringLiteral("commit")) {
        report(orchestrator_.commitSync(), QStringLiteral("snapshot committed"));
    } else if (command == QStringLiteral("discard")) {
        report(orchestrator_.discardSync(), QStringLiteral("snapshot discarded"));
    } else if (command == QStringLiteral("request")) {
        report(orchestrator_.requestRole(optional_reason()), QStringLiteral("editor role requested"));
    } else if (command == QStringLiteral("grant")) {
        report(orchestrator_.grantRole(), QStringLiteral("editor role granted"));
    } else if (command == QStringLiteral("deny")) {
        report(orchestrator_.denyRole(optional_reason()), QStringLiteral("role request denied"));
    } else if (command == QStringLiteral("add")) {
        cmdAdd(args);
    } else if (command == QStringLiteral("attach")) {
        cmdAttach(args);
    } else if (command == QStringLiteral("rename")) {
        cmdRename(args);
    } else if (command == QStringLiteral("remove")) {
        cmdRemove(args);
    } else {
        out_ << "! unknown command '" << command << "'" << Qt::endl;
    }
    return true;
}

void ConsoleSession::printHelp() {
    out_ << "  sync                 offer the project to the viewer (editor)\n"
            "  accept | reject [r]  answer an incoming sync (viewer)\n"
            "  commit | discard     install or drop the received snapshot\n"
            "  request [r]          ask for the editor role (viewer)\n"
            "  grant | deny [r]     answer a role request (editor)\n"
            "  add <label>          create an item\n"
            "  attach <id> <file>   replace an item's payload with a file\n"
            "  rename <id> <label>  change an item's label\n"
            "  remove <id>          delete an item\n"
            "  list | status        show items or session state\n"
            "  quit                 leave the session"
         << Qt::endl;
}

void ConsoleSession::printStatus() {
    const auto role = orchestrator_.role();
    const auto& progress = orchestrator_.progress();
    out_ << "  connection:    " << network::connectionStateName(connection_.state()) << "\n"
         << "  role:          " << (role ? sync::peerRoleName(*role) : "-") << "\n"
         << "  can edit:      " << (orchestrator_.canEdit() ? "yes" : "no") << "\n"
         << "  sync:          " << sync::syncPhaseName(progress.phase);
    if (progress.error) out_ << " (" << qs(*progress.error) << ")";
    out_ << "\n"
         << "  staged:        " << (orchestrator_.hasStagedSnapshot() ? "yes" : "no") << "\n"
         << "  role transfer: " << sync::roleTransferPhaseName(orchestrator_.roleTransfer().phase) << "\n"
         << "  link:          " << sync::reconnectionPhaseName(orchestrator_.reconnection().phase)
         << Qt::endl;
}

void ConsoleSession::printItems() {
    auto items = store_.load_items();
    if (items.is_err()) {
        out_ << "! " << errorText(items.unwrap_err()) << Qt::endl;
        return;
    }
    if (items.unwrap().empty()) {
        out_ << "  (no items)" << Qt::endl;
        return;
    }
    for (const auto& item : items.unwrap()) {
        const auto size = store_.payload_size(item.id).value_or(0);
        out_ << "  " << item.order << ". " << qs(item.label) << "  [" << qs(item.id) << "]";
        if (size > 0) out_ << "  " << size << " bytes";
        out_ << Qt::endl;
    }
}

void ConsoleSession::report(const Result<void>& result, const QString& success) {
    if (result.is_err()) {
        out_ << "! " << errorText(result.unwrap_err()) << Qt::endl;
    } else {
        out_ << "* " << success << Qt::endl;
    }
}

void ConsoleSession::cmdAdd(const QStringList& args) {
    if (args.isEmpty()) {
        out_ << "! usage: add <label>" << Qt::endl;
        return;
    }
    int next_order = 0;
    if (auto items = store_.load_items(); items.is_ok()) {
        for (const auto& item : items.unwrap()) {
            next_order = std::max(next_order, item.order + 1);
        }
    }
    auto created = orchestrator_.createItem(create_item(args.join(QLatin1Char(' ')).toStdString(),
                                                        next_order));
    if (created.is_err()) {
        out_ << "! " << errorText(created.unwrap_err()) << Qt::endl;
        return;
    }
    out_ << "* added " << qs(created.unwrap().id) << Qt::endl;
}

void ConsoleSession::cmdAttach(const QStringList& args) {
    if (args.size() < 2) {
        out_ << "! usage: attach <id> <file>" << Qt::endl;
        return;
    }
    QFile file(args.mid(1).join(QLatin1Char(' ')));
    if (!file.open(QIODevice::ReadOnly)) {
        out_ << "! cannot read " << file.fileName() << ": " << file.errorString() << Qt::endl;
        return;
    }
    const auto contents = file.readAll();
    Bytes payload(contents.begin(), contents.end());

    auto replaced = orchestrator_.replaceItemPayload(args.first().toStdString(), PayloadMetadata{},
                                                     std::move(payload));
    if (replaced.is_err()) {
        out_ << "! " << errorText(replaced.unwrap_err()) << Qt::endl;
        return;
    }
    out_ << "* attached " << contents.size() << " bytes" << Qt::endl;
}

void ConsoleSession::cmdRename(const QStringList& args) {
    if (args.size() < 2) {
        out_ << "! usage: rename <id> <label>" << Qt::endl;
        return;
    }
    ItemChanges changes;
    changes.label = args.mid(1).join(QLatin1Char(' ')).toStdString();
    auto updated = orchestrator_.updateItem(args.first().toStdString(), changes);
    if (updated.is_err()) {
        out_ << "! " << errorText(updated.unwrap_err()) << Qt::endl;
        return;
    }
    out_ << "* renamed" << Qt::endl;
}

void ConsoleSession::cmdRemove(const QStringList& args) {
    if (args.isEmpty()) {
        out_ << "! usage: remove <id>" << Qt::endl;
        return;
    }
    report(orchestrator_.deleteItem(args.first().toStdString()), QStringLiteral("removed"));
}

void ConsoleSession::quit(int exit_code) {
    stage_ = Stage::Leaving;
    stdin_notifier_.setEnabled(false);
    emit finished(exit_code);
}

} // namespace tandem::app
