#include "HostBridge.hpp"
#include "../common/Constants.hpp"

#include <QDebug>

#include <print>

namespace hostbridge {

    HostBridge::HostBridge(const Config& config, bool hostAvailable, transport::TransportAdapter::SendFn sendFn, QObject* parent) :
        QObject(parent),
        m_config(config),
        m_transport(hostAvailable, std::move(sendFn)),
        m_router(m_pending),
        m_dialogChannel(m_dialogStore),
        m_transfers(m_transport),
        m_facade(m_transport, m_pending, m_dialogChannel, m_transfers, m_ids, OperationFacade::Options::fromConfig(config)) {

        m_dispatcher.registerHandler(InboundDispatcher::RESPONSE, [this](const QJsonObject& msg) { return m_router.route(msg); });
        m_dispatcher.registerHandler(InboundDispatcher::PROGRESS, [this](const QJsonObject& msg) { return m_transfers.handleProgressMessage(msg); });
        m_dispatcher.registerHandler(InboundDispatcher::DIALOG_RESULT, [this](const QJsonObject& msg) { return acceptDialogResult(msg); });
    }

    HostBridge::~HostBridge() {
        m_facade.cleanup();
    }

    std::unique_ptr<HostBridge> HostBridge::connectToHost(const Config& config) {
        auto       channel   = std::make_unique<transport::LocalSocketChannel>(config.socketPath);
        const bool connected = channel->connectToHost(HOST_CONNECT_TIMEOUT_MS);

        transport::LocalSocketChannel* raw    = channel.get();
        auto                           bridge = std::make_unique<HostBridge>(config, connected, [raw](const QByteArray& payload) { return raw->write(payload); });

        QObject::connect(raw, &transport::LocalSocketChannel::messageReceived, bridge.get(), [b = bridge.get()](const QJsonObject& msg) { b->deliver(msg); });
        QObject::connect(raw, &transport::LocalSocketChannel::disconnected, bridge.get(), [b = bridge.get()]() {
            std::print(stderr, "Host channel closed\n");
            emit b->hostDisconnected();
        });

        bridge->m_channel = std::move(channel);
        return bridge;
    }

    bool HostBridge::deliver(const QJsonObject& msg) {
        return m_dispatcher.dispatch(msg);
    }

    bool HostBridge::acceptDialogResult(const QJsonObject& msg) {
        const QString requestId = msg.value("requestId").toString();
        if (requestId.isEmpty()) {
            return false;
        }

        // A write for a finished poll would never be read
        if (!m_dialogChannel.isAwaiting(requestId)) {
            qDebug() << "Dropping dialog result for inactive dialog" << requestId;
            return false;
        }

        const QJsonValue value = msg.value("value");
        QString          raw;
        if (value.isBool()) {
            raw = value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
        } else if (value.isDouble()) {
            raw = QString::number(value.toInt());
        } else {
            raw = value.toString();
        }

        m_dialogStore.write(requestId, raw);
        return true;
    }

    OperationFacade& HostBridge::facade() {
        return m_facade;
    }

    transfer::TransferRegistry& HostBridge::transfers() {
        return m_transfers;
    }

    dialog::DialogResultStore& HostBridge::dialogResults() {
        return m_dialogStore;
    }

    correlation::PendingOperationTable& HostBridge::pending() {
        return m_pending;
    }

    const Config& HostBridge::config() const {
        return m_config;
    }

} // namespace hostbridge
