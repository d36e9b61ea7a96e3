#include "OperationFacade.hpp"

#include <QDateTime>
#include <QDebug>

#include <print>
#include <utility>

namespace hostbridge {

    OperationFacade::Options OperationFacade::Options::fromConfig(const Config& config) {
        Options options;
        options.apiTimeoutMs         = config.apiTimeoutMs;
        options.dialogTimeoutMs      = config.dialogTimeoutMs;
        options.dialogPollIntervalMs = config.dialogPollIntervalMs;
        options.dialogPollAttempts   = config.dialogPollAttempts();
        options.dialogMode           = config.dialogMode;
        options.sessionId            = config.sessionId;
        return options;
    }

    OperationFacade::OperationFacade(transport::TransportAdapter& transport, correlation::PendingOperationTable& pending, dialog::DialogResultChannel& dialogs,
                                     transfer::TransferRegistry& transfers, correlation::CorrelationIdGenerator& ids, Options options, QObject* parent) :
        QObject(parent), m_transport(transport), m_pending(pending), m_dialogs(dialogs), m_transfers(transfers), m_ids(ids), m_options(std::move(options)) {}

    QFuture<QJsonValue> OperationFacade::request(const QString& method, const QString& path, const QJsonValue& body, const QJsonObject& headers) {
        // Fail before touching the table so no timer is left behind
        if (!m_transport.available()) {
            std::print(stderr, "IPC not available - rejecting {} {}\n", method.toStdString(), path.toStdString());
            return Deferred<QJsonValue>::failed(OperationError::transportUnavailable());
        }

        const QString        requestId = m_ids.next();
        Deferred<QJsonValue> deferred;

        // Registered before sending: a response may arrive as soon as the host reads the envelope
        const bool registered = m_pending.registerOperation(
            requestId, [deferred](const QJsonValue& data) { deferred.succeed(data); }, [deferred](const OperationError& error) { deferred.fail(error); },
            m_options.apiTimeoutMs);
        if (!registered) {
            return Deferred<QJsonValue>::failed(OperationError::sendFailure(QString("duplicate request id %1").arg(requestId)));
        }

        QJsonObject envelope{{"action", "api_request"}, {"requestId", requestId}, {"method", method}, {"path", path}, {"headers", mergedHeaders(headers)}};
        if (!body.isUndefined()) {
            envelope["body"] = body;
        }

        qDebug() << "IPC API request:" << method << path << requestId;

        try {
            m_transport.send(envelope);
        } catch (const OperationError& error) {
            std::print(stderr, "IPC send failed for {}: {}\n", requestId.toStdString(), error.message().toStdString());
            m_pending.reject(requestId, error);
        }

        return deferred.future();
    }

    QFuture<QJsonValue> OperationFacade::get(const QString& path, const QJsonObject& headers) {
        return request("GET", path, QJsonValue::Undefined, headers);
    }

    QFuture<QJsonValue> OperationFacade::post(const QString& path, const QJsonValue& body, const QJsonObject& headers) {
        return request("POST", path, body, headers);
    }

    QFuture<QJsonValue> OperationFacade::patch(const QString& path, const QJsonValue& body, const QJsonObject& headers) {
        return request("PATCH", path, body, headers);
    }

    QFuture<QJsonValue> OperationFacade::del(const QString& path, const QJsonObject& headers) {
        return request("DELETE", path, QJsonValue::Undefined, headers);
    }

    QFuture<QVariant> OperationFacade::showDialog(const QString& type, const QString& title, const QString& message, const DialogOptions& options) {
        if (!m_transport.available()) {
            return Deferred<QVariant>::failed(OperationError::transportUnavailable());
        }

        const QString requestId = m_ids.next();
        QJsonObject   envelope{{"action", "show_dialog"},
                               {"type", type},
                               {"title", title},
                               {"message", message},
                               {"requestId", requestId},
                               {"okText", options.okText.isEmpty() ? QString::fromLatin1(DEFAULT_OK_TEXT) : options.okText},
                               {"cancelText", options.cancelText.isEmpty() ? QString::fromLatin1(DEFAULT_CANCEL_TEXT) : options.cancelText}};

        qDebug() << "Showing dialog via IPC:" << type << title << requestId;

        if (m_options.dialogMode == DialogMode::Push) {
            Deferred<QVariant> deferred;
            const bool         registered = m_pending.registerOperation(
                requestId, [deferred, type](const QJsonValue& data) { deferred.succeed(dialog::DialogResultChannel::parseResult(type, data)); },
                [deferred](const OperationError& error) { deferred.fail(error); }, m_options.dialogTimeoutMs, ErrorKind::DialogTimeout);
            if (!registered) {
                return Deferred<QVariant>::failed(OperationError::sendFailure(QString("duplicate request id %1").arg(requestId)));
            }

            try {
                m_transport.send(envelope);
            } catch (const OperationError& error) {
                m_pending.reject(requestId, error);
            }
            return deferred.future();
        }

        try {
            m_transport.send(envelope);
        } catch (const OperationError& error) {
            std::print(stderr, "Failed to send dialog request {}: {}\n", requestId.toStdString(), error.message().toStdString());
            return Deferred<QVariant>::failed(error);
        }

        const int interval = m_options.dialogPollIntervalMs > 0 ? m_options.dialogPollIntervalMs : DIALOG_POLL_INTERVAL_MS;
        return m_dialogs.await(requestId, type, m_options.dialogPollAttempts, interval);
    }

    QFuture<bool> OperationFacade::showConfirm(const QString& title, const QString& message, const DialogOptions& options) {
        return showDialog("confirm", title, message, options).then([](const QVariant& result) { return result.toBool(); });
    }

    QFuture<bool> OperationFacade::showOkCancel(const QString& title, const QString& message) {
        return showDialog("ok_cancel", title, message).then([](const QVariant& result) { return result.toBool(); });
    }

    QFuture<int> OperationFacade::showYesNoCancel(const QString& title, const QString& message) {
        return showDialog("yes_no_cancel", title, message).then([](const QVariant& result) { return result.toInt(); });
    }

    QFuture<QVariant> OperationFacade::showInfo(const QString& title, const QString& message) {
        return showDialog("info", title, message);
    }

    QFuture<QVariant> OperationFacade::showWarning(const QString& title, const QString& message) {
        return showDialog("warning", title, message);
    }

    QFuture<QVariant> OperationFacade::showError(const QString& title, const QString& message) {
        return showDialog("error", title, message);
    }

    void OperationFacade::sendMessage(const QString& action, const QJsonObject& data) {
        QJsonObject envelope = data;
        envelope["action"]   = action;
        m_transport.send(envelope);
        qDebug() << "IPC message sent:" << action;
    }

    void OperationFacade::showInFolder(const QString& filename) {
        sendMessage("show_in_folder", QJsonObject{{"filename", filename}, {"timestamp", QDateTime::currentMSecsSinceEpoch()}});
    }

    QString OperationFacade::startTransfer(const QString& url, const QString& filename, const QJsonObject& headers) {
        return m_transfers.startTransfer(url, filename, headers);
    }

    std::optional<QString> OperationFacade::retryTransfer(const QString& key) {
        return m_transfers.retry(key);
    }

    void OperationFacade::cleanup() {
        const std::size_t requests = m_pending.size();
        const std::size_t dialogs  = m_dialogs.activeCount();

        m_pending.cleanup();
        m_dialogs.cancelAll();

        if (requests > 0 || dialogs > 0) {
            std::print("Cleanup: failed {} pending request(s) and {} dialog(s)\n", requests, dialogs);
        }
    }

    std::size_t OperationFacade::pendingCount() const {
        return m_pending.size() + m_dialogs.activeCount();
    }

    bool OperationFacade::hostAvailable() const {
        return m_transport.available();
    }

    QJsonObject OperationFacade::mergedHeaders(const QJsonObject& headers) const {
        QJsonObject merged{{"X-Session-Id", m_options.sessionId}, {"Content-Type", QString::fromLatin1(DEFAULT_CONTENT_TYPE)}};
        for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
            merged.insert(it.key(), it.value());
        }
        return merged;
    }

} // namespace hostbridge
