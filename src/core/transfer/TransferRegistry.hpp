#pragma once

#include "TransferRecord.hpp"
#include "../transport/TransportAdapter.hpp"

#include <QList>
#include <QMap>
#include <QObject>

#include <functional>
#include <optional>

namespace hostbridge::transfer {

    // Per-(url, filename) transfer state, driven by host progress events.
    //   idle -> downloading -> completed | error
    // Only a new startTransfer for the same key leaves a terminal state.
    class TransferRegistry : public QObject {
        Q_OBJECT

      public:
        using NowFn = std::function<qint64()>;

        explicit TransferRegistry(transport::TransportAdapter& transport, QObject* parent = nullptr);
        TransferRegistry(transport::TransportAdapter& transport, NowFn nowFn, QObject* parent = nullptr);

        // Creates or overwrites the record, asks the host to start, returns the key.
        // A start request that cannot be sent leaves the record in error.
        QString                       startTransfer(const QString& url, const QString& filename = {}, const QJsonObject& headers = {});

        // Restarts a known transfer with its original url, filename and headers
        std::optional<QString>        retry(const QString& key);

        void                          onProgressEvent(const ProgressEvent& event);

        // Returns false if the message is not a progress event
        bool                          handleProgressMessage(const QJsonObject& msg);

        std::optional<TransferRecord> get(const QString& key) const;
        QList<TransferRecord>         list() const;
        bool                          clear(const QString& key);
        bool                          contains(const QString& key) const;
        std::size_t                   size() const;

        // Last path segment of the url without query or fragment, or "download"
        static QString                filenameFromUrl(const QString& url);

      signals:
        void transferUpdated(const QString& key);
        void transferCleared(const QString& key);

      private:
        transport::TransportAdapter&  m_transport;
        NowFn                         m_nowFn;
        QMap<QString, TransferRecord> m_records;
    };

} // namespace hostbridge::transfer
