#pragma once

#include "DialogResultStore.hpp"
#include "../Deferred.hpp"
#include "../../common/Constants.hpp"

#include <QFuture>
#include <QJsonValue>
#include <QObject>
#include <QTimer>
#include <QVariant>

#include <unordered_map>

namespace hostbridge::dialog {

    // Bounded polling of DialogResultStore for hosts that can only write dialog results, not push them.
    // Every poll ends either with the typed result or with DialogTimeout, so no result is left behind.
    class DialogResultChannel : public QObject {
        Q_OBJECT

      public:
        explicit DialogResultChannel(DialogResultStore& store, QObject* parent = nullptr);
        ~DialogResultChannel() override;

        QFuture<QVariant> await(const QString& id, const QString& dialogType, int maxAttempts = DIALOG_MAX_ATTEMPTS, int intervalMs = DIALOG_POLL_INTERVAL_MS);

        bool              isAwaiting(const QString& id) const;
        std::size_t       activeCount() const;

        // Fails every active poll with CoreShutdown
        void              cancelAll();

        // confirm/ok_cancel -> bool, yes_no_cancel -> int 0|1|2; other types map "true"/"false"/"ok" to bool,
        // integer strings to int and pass anything else through as a string
        static QVariant   parseResult(const QString& dialogType, const QString& raw);
        static QVariant   parseResult(const QString& dialogType, const QJsonValue& value);

      private:
        struct Poll {
            Deferred<QVariant> deferred;
            QString            dialogType;
            QTimer*            timer       = nullptr;
            int                attempts    = 0;
            int                maxAttempts = 0;
        };

        void                                  tick(const QString& id);
        Poll                                  finish(std::unordered_map<QString, Poll>::iterator it);

        DialogResultStore&                    m_store;
        std::unordered_map<QString, Poll>     m_polls;
    };

} // namespace hostbridge::dialog
