#include "OperationError.hpp"

namespace hostbridge {

    OperationError::OperationError(ErrorKind kind, const QString& message) :
        m_kind(kind), m_message(message), m_what((kindToString(kind) + ": " + message).toStdString()) {}

    const char* OperationError::what() const noexcept {
        return m_what.c_str();
    }

    void OperationError::raise() const {
        throw *this;
    }

    OperationError* OperationError::clone() const {
        return new OperationError(*this);
    }

    QString OperationError::kindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::TransportUnavailable: return "TransportUnavailable";
            case ErrorKind::RequestTimeout: return "RequestTimeout";
            case ErrorKind::HostReportedFailure: return "HostReportedFailure";
            case ErrorKind::SendFailure: return "SendFailure";
            case ErrorKind::DialogTimeout: return "DialogTimeout";
            case ErrorKind::CoreShutdown: return "CoreShutdown";
        }
        return "Unknown";
    }

    OperationError OperationError::transportUnavailable() {
        return OperationError(ErrorKind::TransportUnavailable, "IPC not available - host channel is missing");
    }

    OperationError OperationError::requestTimeout(const QString& id, int timeoutMs) {
        return OperationError(ErrorKind::RequestTimeout, QString("Request %1 timed out after %2 ms").arg(id).arg(timeoutMs));
    }

    OperationError OperationError::hostReportedFailure(const QString& error) {
        return OperationError(ErrorKind::HostReportedFailure, error.isEmpty() ? QString("API request failed") : error);
    }

    OperationError OperationError::sendFailure(const QString& reason) {
        return OperationError(ErrorKind::SendFailure, QString("Failed to send IPC message: %1").arg(reason));
    }

    OperationError OperationError::dialogTimeout(const QString& id) {
        return OperationError(ErrorKind::DialogTimeout, QString("Dialog %1 timed out").arg(id));
    }

    OperationError OperationError::coreShutdown() {
        return OperationError(ErrorKind::CoreShutdown, "IPC service cleanup");
    }

} // namespace hostbridge
