#pragma once

#include "InboundDispatcher.hpp"
#include "OperationFacade.hpp"
#include "correlation/CorrelationIdGenerator.hpp"
#include "correlation/PendingOperationTable.hpp"
#include "correlation/ResponseRouter.hpp"
#include "dialog/DialogResultChannel.hpp"
#include "dialog/DialogResultStore.hpp"
#include "transfer/TransferRegistry.hpp"
#include "transport/LocalSocketChannel.hpp"
#include "transport/TransportAdapter.hpp"
#include "../common/Config.hpp"

#include <QObject>

#include <memory>

namespace hostbridge {

    // Composition root: owns one instance of every component and wires inbound messages to them
    class HostBridge : public QObject {
        Q_OBJECT

      public:
        // hostAvailable is the single capability flag; sendFn carries serialized envelopes to the host
        HostBridge(const Config& config, bool hostAvailable, transport::TransportAdapter::SendFn sendFn, QObject* parent = nullptr);
        ~HostBridge() override;

        // Connects to config.socketPath. The bridge is still returned when the host is absent;
        // every operation then fails with TransportUnavailable.
        static std::unique_ptr<HostBridge> connectToHost(const Config& config);

        // Inbound entry point for every host message
        bool                                deliver(const QJsonObject& msg);

        OperationFacade&                    facade();
        transfer::TransferRegistry&         transfers();
        dialog::DialogResultStore&          dialogResults();
        correlation::PendingOperationTable& pending();
        const Config&                       config() const;

      signals:
        void hostDisconnected();

      private:
        bool                                             acceptDialogResult(const QJsonObject& msg);

        Config                                           m_config;
        std::unique_ptr<transport::LocalSocketChannel>   m_channel;
        correlation::CorrelationIdGenerator              m_ids;
        transport::TransportAdapter                      m_transport;
        correlation::PendingOperationTable               m_pending;
        correlation::ResponseRouter                      m_router;
        dialog::DialogResultStore                        m_dialogStore;
        dialog::DialogResultChannel                      m_dialogChannel;
        transfer::TransferRegistry                       m_transfers;
        OperationFacade                                  m_facade;
        InboundDispatcher                                m_dispatcher;
    };

} // namespace hostbridge
