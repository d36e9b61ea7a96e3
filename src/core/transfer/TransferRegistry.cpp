#include "TransferRegistry.hpp"
#include "../OperationError.hpp"

#include <QDateTime>
#include <QDebug>
#include <QUrl>

#include <print>
#include <utility>

namespace hostbridge::transfer {

    TransferRegistry::TransferRegistry(transport::TransportAdapter& transport, QObject* parent) :
        TransferRegistry(transport, [] { return QDateTime::currentMSecsSinceEpoch(); }, parent) {}

    TransferRegistry::TransferRegistry(transport::TransportAdapter& transport, NowFn nowFn, QObject* parent) :
        QObject(parent), m_transport(transport), m_nowFn(std::move(nowFn)) {}

    QString TransferRegistry::startTransfer(const QString& url, const QString& filename, const QJsonObject& headers) {
        const QString finalFilename = filename.isEmpty() ? filenameFromUrl(url) : filename;
        const QString key           = TransferRecord::makeKey(url, finalFilename);

        TransferRecord record;
        record.key             = key;
        record.url             = url;
        record.filename        = finalFilename;
        record.headers         = headers;
        record.status          = TransferStatus::Downloading;
        record.progressPercent = 0.0;
        m_records.insert(key, record);

        QJsonObject envelope{{"action", "start_download"}, {"url", url}, {"filename", finalFilename}, {"timestamp", m_nowFn()}};
        if (!headers.isEmpty()) {
            envelope["headers"] = headers;
        }

        try {
            m_transport.send(envelope);
            std::print("Starting transfer: {} -> {}\n", url.toStdString(), finalFilename.toStdString());
        } catch (const OperationError& e) {
            std::print(stderr, "Transfer {} failed to start: {}\n", key.toStdString(), e.message().toStdString());
            auto& failed  = m_records[key];
            failed.status = TransferStatus::Error;
            failed.error  = e.message();
        }

        emit transferUpdated(key);
        return key;
    }

    std::optional<QString> TransferRegistry::retry(const QString& key) {
        auto it = m_records.constFind(key);
        if (it == m_records.constEnd()) {
            return std::nullopt;
        }

        const TransferRecord previous = it.value();
        return startTransfer(previous.url, previous.filename, previous.headers);
    }

    void TransferRegistry::onProgressEvent(const ProgressEvent& event) {
        const QString key = event.key();

        auto          it = m_records.find(key);
        if (it == m_records.end()) {
            // Late or unsolicited event: track it rather than drop it
            qDebug() << "Progress for unknown transfer, creating record:" << key;
            TransferRecord record;
            record.key      = key;
            record.url      = event.url;
            record.filename = event.filename;
            it              = m_records.insert(key, record);
        }

        TransferRecord& record = it.value();
        record.totalSize       = event.totalSize;
        record.downloaded      = event.downloaded;
        record.speedBps        = event.speedBps;
        record.speedHuman      = event.speedHuman;
        record.connections     = event.connections;
        record.etaSeconds      = event.etaSeconds;
        record.etaHuman        = event.etaHuman;

        // Only a new startTransfer leaves completed or error
        if (record.isTerminal()) {
            qDebug() << "Ignoring state change for finished transfer:" << key << event.status;
            emit transferUpdated(key);
            return;
        }

        const TransferStatus status = TransferRecord::statusFromHost(event.status);
        switch (status) {
            case TransferStatus::Completed:
                record.status          = TransferStatus::Completed;
                record.progressPercent = 100.0;
                record.error.clear();
                break;
            case TransferStatus::Error:
                // Progress stays at the last reported value
                record.status = TransferStatus::Error;
                record.error  = event.error.isEmpty() ? QString("Unknown error") : event.error;
                break;
            case TransferStatus::Downloading:
                record.status          = TransferStatus::Downloading;
                record.progressPercent = event.progressPercent;
                record.error           = event.error;
                break;
            case TransferStatus::Idle:
                // Unrecognized host status: keep the current state
                qDebug() << "Unknown transfer status" << event.status << "for" << key;
                record.progressPercent = event.progressPercent;
                break;
        }

        emit transferUpdated(key);
    }

    bool TransferRegistry::handleProgressMessage(const QJsonObject& msg) {
        const auto event = ProgressEvent::fromJson(msg);
        if (!event) {
            return false;
        }

        onProgressEvent(*event);
        return true;
    }

    std::optional<TransferRecord> TransferRegistry::get(const QString& key) const {
        auto it = m_records.constFind(key);
        if (it == m_records.constEnd()) {
            return std::nullopt;
        }
        return it.value();
    }

    QList<TransferRecord> TransferRegistry::list() const {
        return m_records.values();
    }

    bool TransferRegistry::clear(const QString& key) {
        if (m_records.remove(key) == 0) {
            return false;
        }

        emit transferCleared(key);
        return true;
    }

    bool TransferRegistry::contains(const QString& key) const {
        return m_records.contains(key);
    }

    std::size_t TransferRegistry::size() const {
        return static_cast<std::size_t>(m_records.size());
    }

    QString TransferRegistry::filenameFromUrl(const QString& url) {
        const QString name = QUrl(url).fileName();
        if (!name.isEmpty()) {
            return name;
        }

        const QString lastSegment = url.section('/', -1);
        return lastSegment.isEmpty() ? QString("download") : lastSegment;
    }

} // namespace hostbridge::transfer
