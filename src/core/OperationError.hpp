#pragma once

#include <QException>
#include <QString>

#include <string>

namespace hostbridge {

    enum class ErrorKind {
        TransportUnavailable,
        RequestTimeout,
        HostReportedFailure,
        SendFailure,
        DialogTimeout,
        CoreShutdown
    };

    // Terminal failure of an operation. Stored in the operation's QFuture and rethrown from result().
    class OperationError : public QException {
      public:
        OperationError(ErrorKind kind, const QString& message);

        [[nodiscard]] ErrorKind kind() const {
            return m_kind;
        }
        [[nodiscard]] QString message() const {
            return m_message;
        }

        const char*     what() const noexcept override;
        void            raise() const override;
        OperationError* clone() const override;

        [[nodiscard]] static QString kindToString(ErrorKind kind);

        static OperationError transportUnavailable();
        static OperationError requestTimeout(const QString& id, int timeoutMs);
        static OperationError hostReportedFailure(const QString& error);
        static OperationError sendFailure(const QString& reason);
        static OperationError dialogTimeout(const QString& id);
        static OperationError coreShutdown();

      private:
        ErrorKind   m_kind;
        QString     m_message;
        std::string m_what;
    };

} // namespace hostbridge
