#include "LineDecoder.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

#include <print>

namespace hostbridge::transport {

    LineDecoder::LineDecoder(std::size_t maxLineSize) : m_maxLineSize(maxLineSize) {}

    QList<QJsonObject> LineDecoder::feed(const QByteArray& chunk) {
        QList<QJsonObject> messages;
        m_buffer.append(chunk);

        qsizetype newline = -1;
        while ((newline = m_buffer.indexOf('\n')) != -1) {
            const QByteArray line = m_buffer.left(newline).trimmed();
            m_buffer.remove(0, newline + 1);

            // Tail of a line already dropped for size
            if (m_discarding) {
                m_discarding = false;
                continue;
            }

            if (static_cast<std::size_t>(newline) > m_maxLineSize) {
                std::print(stderr, "host channel: dropping oversized message ({} bytes)\n", newline);
                continue;
            }

            if (line.isEmpty()) {
                continue;
            }

            QJsonParseError     parseError;
            const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
            if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
                std::print(stderr, "host channel: dropping invalid payload: {}\n", parseError.errorString().toStdString());
                continue;
            }

            messages.append(doc.object());
        }

        if (static_cast<std::size_t>(m_buffer.size()) > m_maxLineSize) {
            std::print(stderr, "host channel: dropping oversized message ({} bytes)\n", m_buffer.size());
            m_buffer.clear();
            m_discarding = true;
        }

        return messages;
    }

    void LineDecoder::reset() {
        m_buffer.clear();
        m_discarding = false;
    }

    std::size_t LineDecoder::buffered() const {
        return static_cast<std::size_t>(m_buffer.size());
    }

} // namespace hostbridge::transport
