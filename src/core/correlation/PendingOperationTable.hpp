#pragma once

#include "../OperationError.hpp"

#include <QJsonValue>
#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>
#include <optional>
#include <unordered_map>

namespace hostbridge::correlation {

    // Outstanding operations keyed by correlation id. Each entry owns a single-shot timeout timer;
    // whichever of resolve/reject/timeout/cleanup runs first removes the entry and stops the timer.
    class PendingOperationTable : public QObject {
        Q_OBJECT

      public:
        using SucceedFn = std::function<void(const QJsonValue&)>;
        using FailFn    = std::function<void(const OperationError&)>;

        explicit PendingOperationTable(QObject* parent = nullptr);
        ~PendingOperationTable() override;

        // Returns false if the id is already pending
        bool        registerOperation(const QString& id, SucceedFn succeed, FailFn fail, int timeoutMs, ErrorKind timeoutKind = ErrorKind::RequestTimeout);

        // No-op (returns false) for unknown, resolved or timed out ids
        bool        resolve(const QString& id, bool success, const QJsonValue& data, const QString& error = {});
        bool        reject(const QString& id, const OperationError& error);

        // Fails every outstanding entry with CoreShutdown
        void        cleanup();

        bool        contains(const QString& id) const;
        bool        empty() const;
        std::size_t size() const;

      signals:
        void operationTimedOut(const QString& id);

      private:
        struct PendingEntry {
            SucceedFn succeed;
            FailFn    fail;
            QTimer*   timer       = nullptr;
            int       timeoutMs   = 0;
            ErrorKind timeoutKind = ErrorKind::RequestTimeout;
        };

        std::optional<PendingEntry> take(const QString& id);
        void                        onTimeout(const QString& id);
        static void                 releaseTimer(QTimer* timer);

        std::unordered_map<QString, PendingEntry> m_entries;
    };

} // namespace hostbridge::correlation
