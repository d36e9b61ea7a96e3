#include "CorrelationIdGenerator.hpp"

#include <QDateTime>

#include <utility>

namespace hostbridge::correlation {

    CorrelationIdGenerator::CorrelationIdGenerator() : CorrelationIdGenerator([] { return QDateTime::currentMSecsSinceEpoch(); }) {}

    CorrelationIdGenerator::CorrelationIdGenerator(NowFn nowFn, QString prefix) : m_nowFn(std::move(nowFn)), m_prefix(std::move(prefix)) {}

    QString CorrelationIdGenerator::next() {
        return QString("%1_%2_%3").arg(m_prefix).arg(m_nowFn()).arg(++m_counter);
    }

} // namespace hostbridge::correlation
