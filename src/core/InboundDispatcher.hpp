#pragma once

#include <QHash>
#include <QJsonObject>
#include <QString>

#include <functional>

namespace hostbridge {

    // Routes every inbound host message to the handler registered for its kind
    class InboundDispatcher {
      public:
        using HandlerFn = std::function<bool(const QJsonObject&)>;

        static inline const QString RESPONSE      = QStringLiteral("response");
        static inline const QString PROGRESS      = QStringLiteral("download_progress");
        static inline const QString DIALOG_RESULT = QStringLiteral("dialog_result");

        void    registerHandler(const QString& kind, HandlerFn handler);

        // Returns false if no handler took the message
        bool    dispatch(const QJsonObject& msg) const;

        // Explicit "type" wins; untyped messages are classified by their fields
        static QString classify(const QJsonObject& msg);

      private:
        QHash<QString, HandlerFn> m_handlers;
    };

} // namespace hostbridge
