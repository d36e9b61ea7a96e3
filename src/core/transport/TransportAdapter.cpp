#include "TransportAdapter.hpp"
#include "../OperationError.hpp"

#include <QJsonDocument>

#include <exception>
#include <utility>

namespace hostbridge::transport {

    TransportAdapter::TransportAdapter(bool available, SendFn sendFn) : m_available(available && static_cast<bool>(sendFn)), m_sendFn(std::move(sendFn)) {}

    bool TransportAdapter::available() const {
        return m_available;
    }

    void TransportAdapter::send(const QJsonObject& envelope) {
        if (!m_available) {
            throw OperationError::transportUnavailable();
        }

        bool sent = false;
        try {
            sent = m_sendFn(serialize(envelope));
        } catch (const std::exception& e) {
            throw OperationError::sendFailure(QString::fromUtf8(e.what()));
        }

        if (!sent) {
            throw OperationError::sendFailure("host channel rejected the message");
        }
    }

    QByteArray TransportAdapter::serialize(const QJsonObject& envelope) {
        return QJsonDocument(envelope).toJson(QJsonDocument::Compact);
    }

} // namespace hostbridge::transport
