#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

namespace hostbridge::transfer {

    enum class TransferStatus {
        Idle,
        Downloading,
        Completed,
        Error
    };

    // One progress line as emitted by the host's downloader
    struct ProgressEvent {
        QString url;
        QString filename;
        qint64  totalSize       = 0;
        qint64  downloaded      = 0;
        double  progressPercent = 0.0;
        double  speedBps        = 0.0;
        double  speedMbps       = 0.0;
        QString speedHuman;
        int     connections = 0;
        qint64  etaSeconds  = 0;
        QString etaHuman;
        QString status; // "downloading" | "completed" | "error"
        QString error;

        [[nodiscard]] QString               key() const;

        // Requires url, filename and status
        static std::optional<ProgressEvent> fromJson(const QJsonObject& json);
        static bool                         looksLikeProgress(const QJsonObject& json);
    };

    struct TransferRecord {
        QString        key;
        QString        url;
        QString        filename;
        qint64         totalSize       = 0;
        qint64         downloaded      = 0;
        double         progressPercent = 0.0;
        double         speedBps        = 0.0;
        QString        speedHuman;
        int            connections = 0;
        qint64         etaSeconds  = 0;
        QString        etaHuman;
        TransferStatus status = TransferStatus::Idle;
        QString        error;
        QJsonObject    headers;

        [[nodiscard]] bool           isTerminal() const;
        [[nodiscard]] QJsonObject    toJson() const;

        [[nodiscard]] static QString makeKey(const QString& url, const QString& filename);
        [[nodiscard]] static QString statusToString(TransferStatus status);
        [[nodiscard]] static TransferStatus statusFromHost(const QString& hostStatus);
    };

} // namespace hostbridge::transfer
