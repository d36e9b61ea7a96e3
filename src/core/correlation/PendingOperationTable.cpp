#include "PendingOperationTable.hpp"

#include <QDebug>

#include <utility>

namespace hostbridge::correlation {

    PendingOperationTable::PendingOperationTable(QObject* parent) : QObject(parent) {}

    PendingOperationTable::~PendingOperationTable() {
        cleanup();
    }

    bool PendingOperationTable::registerOperation(const QString& id, SucceedFn succeed, FailFn fail, int timeoutMs, ErrorKind timeoutKind) {
        if (m_entries.find(id) != m_entries.end()) {
            return false;
        }

        auto* timer = new QTimer(this);
        timer->setSingleShot(true);
        connect(timer, &QTimer::timeout, this, [this, id]() { onTimeout(id); });

        PendingEntry entry;
        entry.succeed     = std::move(succeed);
        entry.fail        = std::move(fail);
        entry.timer       = timer;
        entry.timeoutMs   = timeoutMs;
        entry.timeoutKind = timeoutKind;
        m_entries.emplace(id, std::move(entry));

        timer->start(timeoutMs);
        return true;
    }

    bool PendingOperationTable::resolve(const QString& id, bool success, const QJsonValue& data, const QString& error) {
        auto entry = take(id);
        if (!entry) {
            qDebug() << "Ignoring response for unknown or settled request" << id;
            return false;
        }

        if (success) {
            entry->succeed(data);
        } else {
            entry->fail(OperationError::hostReportedFailure(error));
        }
        return true;
    }

    bool PendingOperationTable::reject(const QString& id, const OperationError& error) {
        auto entry = take(id);
        if (!entry) {
            return false;
        }

        entry->fail(error);
        return true;
    }

    void PendingOperationTable::cleanup() {
        // Detach first so callbacks that register new operations land in a fresh table
        auto entries = std::move(m_entries);
        m_entries.clear();

        for (auto& [id, entry] : entries) {
            releaseTimer(entry.timer);
            entry.fail(OperationError::coreShutdown());
        }
    }

    bool PendingOperationTable::contains(const QString& id) const {
        return m_entries.find(id) != m_entries.end();
    }

    bool PendingOperationTable::empty() const {
        return m_entries.empty();
    }

    std::size_t PendingOperationTable::size() const {
        return m_entries.size();
    }

    std::optional<PendingOperationTable::PendingEntry> PendingOperationTable::take(const QString& id) {
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return std::nullopt;
        }

        PendingEntry entry = std::move(it->second);
        m_entries.erase(it);
        releaseTimer(entry.timer);
        return entry;
    }

    void PendingOperationTable::onTimeout(const QString& id) {
        auto entry = take(id);
        if (!entry) {
            return;
        }

        qDebug() << "Request timeout:" << id << "after" << entry->timeoutMs << "ms";
        emit operationTimedOut(id);

        if (entry->timeoutKind == ErrorKind::DialogTimeout) {
            entry->fail(OperationError::dialogTimeout(id));
        } else {
            entry->fail(OperationError::requestTimeout(id, entry->timeoutMs));
        }
    }

    void PendingOperationTable::releaseTimer(QTimer* timer) {
        if (!timer) {
            return;
        }
        timer->stop();
        // May be called from the timer's own timeout signal
        timer->deleteLater();
    }

} // namespace hostbridge::correlation
