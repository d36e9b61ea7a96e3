#pragma once

#include <QByteArray>
#include <QJsonObject>

#include <functional>

namespace hostbridge::transport {

    // Outbound half of the host channel. The capability flag is fixed at construction;
    // the adapter never receives anything and never looks inside the envelope.
    class TransportAdapter {
      public:
        // Returns false if the payload could not be handed to the channel
        using SendFn = std::function<bool(const QByteArray&)>;

        TransportAdapter(bool available, SendFn sendFn);

        bool available() const;

        // Throws OperationError: TransportUnavailable when unavailable, SendFailure when the channel rejects the payload
        void send(const QJsonObject& envelope);

        static QByteArray serialize(const QJsonObject& envelope);

      private:
        bool   m_available;
        SendFn m_sendFn;
    };

} // namespace hostbridge::transport
