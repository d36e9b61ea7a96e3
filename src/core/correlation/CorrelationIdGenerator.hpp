#pragma once

#include <QString>

#include <functional>

namespace hostbridge::correlation {

    // Issues ids of the form req_<epochMs>_<counter>, unique for the lifetime of the process.
    class CorrelationIdGenerator {
      public:
        using NowFn = std::function<qint64()>;

        CorrelationIdGenerator();
        explicit CorrelationIdGenerator(NowFn nowFn, QString prefix = QStringLiteral("req"));

        QString next();

      private:
        NowFn   m_nowFn;
        QString m_prefix;
        quint64 m_counter = 0;
    };

} // namespace hostbridge::correlation
