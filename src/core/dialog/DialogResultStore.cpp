#include "DialogResultStore.hpp"

namespace hostbridge::dialog {

    QString DialogResultStore::keyFor(const QString& requestId) {
        return QStringLiteral("dialogResult_") + requestId;
    }

    void DialogResultStore::write(const QString& requestId, const QString& value) {
        m_values.insert(keyFor(requestId), value);
    }

    std::optional<QString> DialogResultStore::take(const QString& requestId) {
        auto it = m_values.find(keyFor(requestId));
        if (it == m_values.end()) {
            return std::nullopt;
        }

        QString value = it.value();
        m_values.erase(it);
        return value;
    }

    bool DialogResultStore::contains(const QString& requestId) const {
        return m_values.contains(keyFor(requestId));
    }

    bool DialogResultStore::empty() const {
        return m_values.isEmpty();
    }

    std::size_t DialogResultStore::size() const {
        return static_cast<std::size_t>(m_values.size());
    }

} // namespace hostbridge::dialog
