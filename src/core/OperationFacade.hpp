#pragma once

#include "Deferred.hpp"
#include "correlation/CorrelationIdGenerator.hpp"
#include "correlation/PendingOperationTable.hpp"
#include "dialog/DialogResultChannel.hpp"
#include "transfer/TransferRegistry.hpp"
#include "transport/TransportAdapter.hpp"
#include "../common/Config.hpp"

#include <QFuture>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QVariant>

#include <optional>

namespace hostbridge {

    // Caller-facing API over the one-directional host channel. Every returned future settles exactly once:
    // with the host's data, or with an OperationError.
    class OperationFacade : public QObject {
        Q_OBJECT

      public:
        struct Options {
            int        apiTimeoutMs         = API_REQUEST_TIMEOUT_MS;
            int        dialogTimeoutMs      = DIALOG_TIMEOUT_MS;
            int        dialogPollIntervalMs = DIALOG_POLL_INTERVAL_MS;
            int        dialogPollAttempts   = DIALOG_TIMEOUT_MS / DIALOG_POLL_INTERVAL_MS;
            DialogMode dialogMode           = DialogMode::Poll;
            QString    sessionId            = QString::fromLatin1(DEFAULT_SESSION_ID);

            static Options fromConfig(const Config& config);
        };

        struct DialogOptions {
            QString okText;
            QString cancelText;
        };

        OperationFacade(transport::TransportAdapter& transport, correlation::PendingOperationTable& pending, dialog::DialogResultChannel& dialogs,
                        transfer::TransferRegistry& transfers, correlation::CorrelationIdGenerator& ids, Options options, QObject* parent = nullptr);

        // API requests: { action: "api_request", requestId, method, path, body?, headers? }
        QFuture<QJsonValue> request(const QString& method, const QString& path, const QJsonValue& body = QJsonValue::Undefined, const QJsonObject& headers = {});
        QFuture<QJsonValue> get(const QString& path, const QJsonObject& headers = {});
        QFuture<QJsonValue> post(const QString& path, const QJsonValue& body = QJsonValue::Undefined, const QJsonObject& headers = {});
        QFuture<QJsonValue> patch(const QString& path, const QJsonValue& body = QJsonValue::Undefined, const QJsonObject& headers = {});
        QFuture<QJsonValue> del(const QString& path, const QJsonObject& headers = {});

        // Modal dialogs: { action: "show_dialog", type, title, message, requestId, okText, cancelText }
        QFuture<QVariant>   showDialog(const QString& type, const QString& title, const QString& message, const DialogOptions& options = {});
        QFuture<bool>       showConfirm(const QString& title, const QString& message, const DialogOptions& options = {});
        QFuture<bool>       showOkCancel(const QString& title, const QString& message);
        QFuture<int>        showYesNoCancel(const QString& title, const QString& message);
        QFuture<QVariant>   showInfo(const QString& title, const QString& message);
        QFuture<QVariant>   showWarning(const QString& title, const QString& message);
        QFuture<QVariant>   showError(const QString& title, const QString& message);

        // Fire-and-forget; throws OperationError (TransportUnavailable, SendFailure)
        void                sendMessage(const QString& action, const QJsonObject& data = {});
        void                showInFolder(const QString& filename);

        // Transfers
        QString                startTransfer(const QString& url, const QString& filename = {}, const QJsonObject& headers = {});
        std::optional<QString> retryTransfer(const QString& key);

        // Fails every outstanding request and dialog with CoreShutdown
        void        cleanup();

        std::size_t pendingCount() const;
        bool        hostAvailable() const;

      private:
        QJsonObject mergedHeaders(const QJsonObject& headers) const;

        transport::TransportAdapter&         m_transport;
        correlation::PendingOperationTable&  m_pending;
        dialog::DialogResultChannel&         m_dialogs;
        transfer::TransferRegistry&          m_transfers;
        correlation::CorrelationIdGenerator& m_ids;
        Options                              m_options;
    };

} // namespace hostbridge
