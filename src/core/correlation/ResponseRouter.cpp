#include "ResponseRouter.hpp"

#include <QDebug>

namespace hostbridge::correlation {

    ResponseRouter::ResponseRouter(PendingOperationTable& table) : m_table(table) {}

    bool ResponseRouter::isResponse(const QJsonObject& msg) {
        return msg.value("requestId").isString() && !msg.value("requestId").toString().isEmpty();
    }

    bool ResponseRouter::route(const QJsonObject& msg) {
        if (!isResponse(msg)) {
            return false;
        }

        const QString requestId = msg.value("requestId").toString();

        // The host only sets success:false explicitly
        const bool    success = msg.value("success").toBool(true);
        const QString error   = msg.value("error").toString();

        qDebug() << "IPC response received:" << requestId << "success:" << success;

        // Envelopes without a data field resolve with the whole response, as the host does for plain acks
        const QJsonValue data = msg.contains("data") ? msg.value("data") : QJsonValue(msg);
        return m_table.resolve(requestId, success, data, error);
    }

} // namespace hostbridge::correlation
