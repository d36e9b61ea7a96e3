#include "InboundDispatcher.hpp"
#include "correlation/ResponseRouter.hpp"
#include "transfer/TransferRecord.hpp"

#include <QDebug>

namespace hostbridge {

    void InboundDispatcher::registerHandler(const QString& kind, HandlerFn handler) {
        m_handlers.insert(kind, std::move(handler));
    }

    bool InboundDispatcher::dispatch(const QJsonObject& msg) const {
        const QString kind = classify(msg);

        auto          it = m_handlers.constFind(kind);
        if (it == m_handlers.constEnd()) {
            qDebug() << "No handler for inbound message kind" << kind;
            return false;
        }

        return it.value()(msg);
    }

    QString InboundDispatcher::classify(const QJsonObject& msg) {
        const QString type = msg.value("type").toString();
        if (!type.isEmpty()) {
            return type;
        }

        if (correlation::ResponseRouter::isResponse(msg)) {
            return RESPONSE;
        }

        if (transfer::ProgressEvent::looksLikeProgress(msg)) {
            return PROGRESS;
        }

        return {};
    }

} // namespace hostbridge
