#pragma once

#include "../../common/Constants.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QList>

#include <cstddef>

namespace hostbridge::transport {

    // Splits a byte stream into newline-terminated JSON objects.
    // Lines longer than maxLineSize are dropped whole, even when they arrive across several chunks.
    class LineDecoder {
      public:
        explicit LineDecoder(std::size_t maxLineSize = MAX_MESSAGE_SIZE);

        QList<QJsonObject> feed(const QByteArray& chunk);
        void               reset();

        std::size_t        buffered() const;

      private:
        std::size_t m_maxLineSize;
        QByteArray  m_buffer;
        bool        m_discarding = false;
    };

} // namespace hostbridge::transport
