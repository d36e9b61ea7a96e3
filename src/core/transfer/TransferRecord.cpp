#include "TransferRecord.hpp"

namespace hostbridge::transfer {

    QString ProgressEvent::key() const {
        return TransferRecord::makeKey(url, filename);
    }

    bool ProgressEvent::looksLikeProgress(const QJsonObject& json) {
        return json.value("url").isString() && json.value("filename").isString() && json.value("status").isString();
    }

    std::optional<ProgressEvent> ProgressEvent::fromJson(const QJsonObject& json) {
        if (!looksLikeProgress(json)) {
            return std::nullopt;
        }

        ProgressEvent event;
        event.url             = json.value("url").toString();
        event.filename        = json.value("filename").toString();
        event.totalSize       = json.value("total_size").toInteger();
        event.downloaded      = json.value("downloaded").toInteger();
        event.progressPercent = json.value("progress_percent").toDouble();
        event.speedBps        = json.value("download_speed_bps").toDouble();
        event.speedMbps       = json.value("download_speed_mbps").toDouble();
        event.speedHuman      = json.value("download_speed_human").toString();
        event.connections     = json.value("connections").toInt();
        event.etaSeconds      = json.value("eta_seconds").toInteger();
        event.etaHuman        = json.value("eta_human").toString();
        event.status          = json.value("status").toString();
        // null and missing both mean no error
        event.error = json.value("error").toString();
        return event;
    }

    bool TransferRecord::isTerminal() const {
        return status == TransferStatus::Completed || status == TransferStatus::Error;
    }

    QJsonObject TransferRecord::toJson() const {
        QJsonObject obj{{"key", key},
                        {"url", url},
                        {"filename", filename},
                        {"totalSize", totalSize},
                        {"downloaded", downloaded},
                        {"progressPercent", progressPercent},
                        {"status", statusToString(status)}};

        if (!speedHuman.isEmpty()) {
            obj["speedHuman"] = speedHuman;
        }
        if (!etaHuman.isEmpty()) {
            obj["etaHuman"] = etaHuman;
        }
        if (connections > 0) {
            obj["connections"] = connections;
        }
        if (!error.isEmpty()) {
            obj["error"] = error;
        }
        return obj;
    }

    QString TransferRecord::makeKey(const QString& url, const QString& filename) {
        return url + "_" + filename;
    }

    QString TransferRecord::statusToString(TransferStatus status) {
        switch (status) {
            case TransferStatus::Idle: return "idle";
            case TransferStatus::Downloading: return "downloading";
            case TransferStatus::Completed: return "completed";
            case TransferStatus::Error: return "error";
        }
        return "idle";
    }

    TransferStatus TransferRecord::statusFromHost(const QString& hostStatus) {
        if (hostStatus == "downloading") {
            return TransferStatus::Downloading;
        }
        if (hostStatus == "completed") {
            return TransferStatus::Completed;
        }
        if (hostStatus == "error") {
            return TransferStatus::Error;
        }
        return TransferStatus::Idle;
    }

} // namespace hostbridge::transfer
