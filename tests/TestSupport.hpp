#pragma once

#include "../src/core/OperationError.hpp"
#include "../src/core/transport/TransportAdapter.hpp"

#include <QFuture>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>

#include <optional>
#include <stdexcept>

namespace hostbridge::test {

    // Stands in for the host end of the channel: records every envelope the core sends
    class RecordingHost {
      public:
        transport::TransportAdapter::SendFn sendFn() {
            return [this](const QByteArray& payload) {
                if (throwOnSend) {
                    throw std::runtime_error("pipe closed");
                }
                if (rejectSend) {
                    return false;
                }
                sent.append(QJsonDocument::fromJson(payload).object());
                return true;
            };
        }

        QJsonObject last() const {
            return sent.isEmpty() ? QJsonObject{} : sent.last();
        }

        QString lastRequestId() const {
            return last().value("requestId").toString();
        }

        QList<QJsonObject> sent;
        bool               rejectSend  = false;
        bool               throwOnSend = false;
    };

    // Only call on a finished future: waitForFinished rethrows the stored OperationError
    template <typename T>
    std::optional<ErrorKind> failureKind(QFuture<T> future) {
        try {
            future.waitForFinished();
        } catch (const OperationError& error) {
            return error.kind();
        }
        return std::nullopt;
    }

    template <typename T>
    QString failureMessage(QFuture<T> future) {
        try {
            future.waitForFinished();
        } catch (const OperationError& error) {
            return error.message();
        }
        return {};
    }

} // namespace hostbridge::test
