#include "LocalSocketChannel.hpp"

#include <print>

namespace hostbridge::transport {

    LocalSocketChannel::LocalSocketChannel(const QString& socketPath, QObject* parent) : QObject(parent), m_socketPath(socketPath) {
        connect(&m_socket, &QLocalSocket::readyRead, this, &LocalSocketChannel::onReadyRead);
        connect(&m_socket, &QLocalSocket::disconnected, this, [this]() {
            m_decoder.reset();
            emit disconnected();
        });
    }

    bool LocalSocketChannel::connectToHost(int timeoutMs) {
        if (isConnected()) {
            return true;
        }

        m_socket.connectToServer(m_socketPath);
        if (!m_socket.waitForConnected(timeoutMs)) {
            std::print(stderr, "host channel: cannot connect to {}: {}\n", m_socketPath.toStdString(), m_socket.errorString().toStdString());
            return false;
        }
        return true;
    }

    bool LocalSocketChannel::isConnected() const {
        return m_socket.state() == QLocalSocket::ConnectedState;
    }

    void LocalSocketChannel::close() {
        if (m_socket.state() != QLocalSocket::UnconnectedState) {
            m_socket.disconnectFromServer();
        }
    }

    bool LocalSocketChannel::write(const QByteArray& payload) {
        if (!isConnected()) {
            return false;
        }

        QByteArray data = payload;
        data.append('\n');

        if (m_socket.write(data) == -1) {
            return false;
        }
        m_socket.flush();
        return true;
    }

    void LocalSocketChannel::onReadyRead() {
        for (const QJsonObject& msg : m_decoder.feed(m_socket.readAll())) {
            emit messageReceived(msg);
        }
    }

} // namespace hostbridge::transport
