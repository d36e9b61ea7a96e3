#pragma once

#include "LineDecoder.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QLocalSocket>
#include <QObject>

namespace hostbridge::transport {

    // Newline-delimited compact JSON over a local socket to the host process
    class LocalSocketChannel : public QObject {
        Q_OBJECT

      public:
        explicit LocalSocketChannel(const QString& socketPath, QObject* parent = nullptr);

        // Blocks up to timeoutMs for the connection
        bool connectToHost(int timeoutMs);
        bool isConnected() const;
        void close();

        // Appends the line terminator; returns false if the socket is not connected or the write fails
        bool write(const QByteArray& payload);

      signals:
        void messageReceived(const QJsonObject& msg);
        void disconnected();

      private:
        void onReadyRead();

        QString      m_socketPath;
        QLocalSocket m_socket;
        LineDecoder  m_decoder;
    };

} // namespace hostbridge::transport
