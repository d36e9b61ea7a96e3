#include "TestSupport.hpp"
#include "../src/core/transfer/TransferRegistry.hpp"

#include <QtTest/QtTest>

namespace hostbridge {

    namespace {

        QJsonObject progressJson(const QString& url, const QString& filename, double percent, const QString& status = "downloading", const QString& error = {}) {
            QJsonObject event{{"type", "download_progress"},
                              {"url", url},
                              {"filename", filename},
                              {"total_size", 1000},
                              {"downloaded", qRound64(percent * 10)},
                              {"progress_percent", percent},
                              {"download_speed_bps", 2097152.0},
                              {"download_speed_mbps", 2.0},
                              {"download_speed_human", "2.0 MB/s"},
                              {"connections", 4},
                              {"eta_seconds", 3},
                              {"eta_human", "3s"},
                              {"status", status}};
            event["error"] = error.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(error);
            return event;
        }

    } // namespace

    using transfer::TransferRecord;
    using transfer::TransferStatus;

    class TransferRegistryTest : public QObject {
        Q_OBJECT

      private slots:
        void start_createsDownloadingRecordAndSendsStart();
        void start_derivesFilenameFromUrl();
        void start_unsentRequestMarksError();
        void progress_followsLastEvent();
        void progress_completedForcesHundred();
        void progress_errorKeepsProgressAndMessage();
        void progress_unknownKeySynthesizesRecord();
        void progress_distinctKeysDoNotCrossContaminate();
        void progress_completedIsSticky();
        void progress_errorIsSticky();
        void progress_unknownStatusKeepsState();
        void restart_overwritesTerminalRecord();
        void retry_reusesUrlFilenameAndHeaders();
        void clear_removesRecord();
        void parse_rejectsEventsWithoutKeyFields();
    };

    void TransferRegistryTest::start_createsDownloadingRecordAndSendsStart() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport, [] { return qint64(42); });
        QSignalSpy                  updated(&registry, &transfer::TransferRegistry::transferUpdated);

        const QString               key = registry.startTransfer("http://x/file.bin", "file.bin");
        QCOMPARE(key, QString("http://x/file.bin_file.bin"));

        const auto record = registry.get(key);
        QVERIFY(record.has_value());
        QCOMPARE(record->status, TransferStatus::Downloading);
        QCOMPARE(record->progressPercent, 0.0);

        QCOMPARE(host.sent.size(), 1);
        QCOMPARE(host.last().value("action").toString(), QString("start_download"));
        QCOMPARE(host.last().value("url").toString(), QString("http://x/file.bin"));
        QCOMPARE(host.last().value("filename").toString(), QString("file.bin"));
        QCOMPARE(host.last().value("timestamp").toInteger(), qint64(42));
        QVERIFY(!host.last().contains("headers"));
        QCOMPARE(updated.count(), 1);
    }

    void TransferRegistryTest::start_derivesFilenameFromUrl() {
        QCOMPARE(transfer::TransferRegistry::filenameFromUrl("https://files.example.com/proofs/design-12.pdf"), QString("design-12.pdf"));
        QCOMPARE(transfer::TransferRegistry::filenameFromUrl("https://files.example.com/proofs/"), QString("download"));
        QCOMPARE(transfer::TransferRegistry::filenameFromUrl("https://cdn.example.com/a.bin?sig=x#part"), QString("a.bin"));

        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key = registry.startTransfer("https://files.example.com/a/b/report.zip");
        QCOMPARE(key, QString("https://files.example.com/a/b/report.zip_report.zip"));
        QCOMPARE(host.last().value("filename").toString(), QString("report.zip"));
    }

    void TransferRegistryTest::start_unsentRequestMarksError() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(false, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key    = registry.startTransfer("http://x/file.bin", "file.bin");
        const auto                  record = registry.get(key);
        QVERIFY(record.has_value());
        QCOMPARE(record->status, TransferStatus::Error);
        QVERIFY(!record->error.isEmpty());
        QVERIFY(host.sent.isEmpty());
    }

    void TransferRegistryTest::progress_followsLastEvent() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key = registry.startTransfer("http://x/file.bin", "file.bin");

        for (const double percent : {5.0, 12.5, 40.0, 77.7}) {
            QVERIFY(registry.handleProgressMessage(progressJson("http://x/file.bin", "file.bin", percent)));
            const auto record = registry.get(key);
            QCOMPARE(record->progressPercent, percent);
            QCOMPARE(record->status, TransferStatus::Downloading);
        }

        const auto record = registry.get(key);
        QCOMPARE(record->speedHuman, QString("2.0 MB/s"));
        QCOMPARE(record->etaHuman, QString("3s"));
        QCOMPARE(record->totalSize, qint64(1000));
        QCOMPARE(record->downloaded, qint64(777));
        QCOMPARE(record->connections, 4);
        QVERIFY(record->error.isEmpty());
    }

    void TransferRegistryTest::progress_completedForcesHundred() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key = registry.startTransfer("http://x/file.bin", "file.bin");
        registry.handleProgressMessage(progressJson("http://x/file.bin", "file.bin", 10.0));
        registry.handleProgressMessage(progressJson("http://x/file.bin", "file.bin", 55.0));
        registry.handleProgressMessage(progressJson("http://x/file.bin", "file.bin", 99.2, "completed"));

        const auto record = registry.get(key);
        QCOMPARE(record->status, TransferStatus::Completed);
        QCOMPARE(record->progressPercent, 100.0);
        QVERIFY(record->error.isEmpty());
        QVERIFY(record->isTerminal());
    }

    void TransferRegistryTest::progress_errorKeepsProgressAndMessage() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key = registry.startTransfer("http://x/file.bin", "file.bin");
        registry.handleProgressMessage(progressJson("http://x/file.bin", "file.bin", 63.0));
        registry.handleProgressMessage(progressJson("http://x/file.bin", "file.bin", 0.0, "error", "HTTP 403 Forbidden"));

        const auto record = registry.get(key);
        QCOMPARE(record->status, TransferStatus::Error);
        QCOMPARE(record->error, QString("HTTP 403 Forbidden"));
        QCOMPARE(record->progressPercent, 63.0);
    }

    void TransferRegistryTest::progress_unknownKeySynthesizesRecord() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        QJsonObject                 untyped = progressJson("http://x/late.bin", "late.bin", 30.0);
        untyped.remove("type");
        QVERIFY(registry.handleProgressMessage(untyped));

        const auto record = registry.get("http://x/late.bin_late.bin");
        QVERIFY(record.has_value());
        QCOMPARE(record->url, QString("http://x/late.bin"));
        QCOMPARE(record->filename, QString("late.bin"));
        QCOMPARE(record->status, TransferStatus::Downloading);
        QCOMPARE(record->progressPercent, 30.0);
    }

    void TransferRegistryTest::progress_distinctKeysDoNotCrossContaminate() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               a = registry.startTransfer("http://x/a.bin", "a.bin");
        const QString               b = registry.startTransfer("http://x/b.bin", "b.bin");

        registry.handleProgressMessage(progressJson("http://x/a.bin", "a.bin", 20.0));
        const auto before = registry.get(b);

        registry.handleProgressMessage(progressJson("http://x/a.bin", "a.bin", 80.0));
        registry.handleProgressMessage(progressJson("http://x/a.bin", "a.bin", 0.0, "error", "disk full"));

        const auto after = registry.get(b);
        QCOMPARE(after->status, before->status);
        QCOMPARE(after->progressPercent, before->progressPercent);
        QCOMPARE(after->downloaded, before->downloaded);
        QCOMPARE(after->error, before->error);
        QCOMPARE(after->speedHuman, before->speedHuman);

        QCOMPARE(registry.get(a)->status, TransferStatus::Error);
        QCOMPARE(registry.size(), std::size_t(2));
    }

    void TransferRegistryTest::progress_completedIsSticky() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key = registry.startTransfer("http://x/f", "f");
        registry.handleProgressMessage(progressJson("http://x/f", "f", 90.0, "completed"));

        registry.handleProgressMessage(progressJson("http://x/f", "f", 40.0));
        QCOMPARE(registry.get(key)->status, TransferStatus::Completed);
        QCOMPARE(registry.get(key)->progressPercent, 100.0);

        registry.handleProgressMessage(progressJson("http://x/f", "f", 40.0, "error", "late failure"));
        const auto record = registry.get(key);
        QCOMPARE(record->status, TransferStatus::Completed);
        QCOMPARE(record->progressPercent, 100.0);
        QVERIFY(record->error.isEmpty());
    }

    void TransferRegistryTest::progress_errorIsSticky() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key = registry.startTransfer("http://x/f", "f");
        registry.handleProgressMessage(progressJson("http://x/f", "f", 35.0));
        registry.handleProgressMessage(progressJson("http://x/f", "f", 0.0, "error", "HTTP 500"));

        registry.handleProgressMessage(progressJson("http://x/f", "f", 70.0));
        registry.handleProgressMessage(progressJson("http://x/f", "f", 100.0, "completed"));

        const auto record = registry.get(key);
        QCOMPARE(record->status, TransferStatus::Error);
        QCOMPARE(record->progressPercent, 35.0);
        QCOMPARE(record->error, QString("HTTP 500"));
    }

    void TransferRegistryTest::progress_unknownStatusKeepsState() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key = registry.startTransfer("http://x/f", "f");
        registry.handleProgressMessage(progressJson("http://x/f", "f", 20.0));
        registry.handleProgressMessage(progressJson("http://x/f", "f", 25.0, "paused"));

        const auto record = registry.get(key);
        QCOMPARE(record->status, TransferStatus::Downloading);
        QCOMPARE(record->progressPercent, 25.0);
    }

    void TransferRegistryTest::restart_overwritesTerminalRecord() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QString               key = registry.startTransfer("http://x/file.bin", "file.bin");
        registry.handleProgressMessage(progressJson("http://x/file.bin", "file.bin", 50.0, "error", "connection reset"));
        QCOMPARE(registry.get(key)->status, TransferStatus::Error);

        QCOMPARE(registry.startTransfer("http://x/file.bin", "file.bin"), key);

        const auto record = registry.get(key);
        QCOMPARE(record->status, TransferStatus::Downloading);
        QCOMPARE(record->progressPercent, 0.0);
        QVERIFY(record->error.isEmpty());
    }

    void TransferRegistryTest::retry_reusesUrlFilenameAndHeaders() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        const QJsonObject           headers{{"Authorization", "Bearer abc"}};
        const QString               key = registry.startTransfer("http://x/file.bin", "file.bin", headers);
        registry.handleProgressMessage(progressJson("http://x/file.bin", "file.bin", 10.0, "error", "timeout"));

        QCOMPARE(registry.retry(key).value_or(QString()), key);
        QCOMPARE(host.sent.size(), 2);
        QCOMPARE(host.last().value("headers").toObject(), headers);
        QCOMPARE(registry.get(key)->status, TransferStatus::Downloading);

        QVERIFY(!registry.retry("http://x/other_other").has_value());
    }

    void TransferRegistryTest::clear_removesRecord() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);
        QSignalSpy                  cleared(&registry, &transfer::TransferRegistry::transferCleared);

        const QString               key = registry.startTransfer("http://x/file.bin", "file.bin");
        QVERIFY(registry.clear(key));
        QVERIFY(!registry.contains(key));
        QVERIFY(!registry.clear(key));
        QCOMPARE(cleared.count(), 1);
        QVERIFY(registry.list().isEmpty());
    }

    void TransferRegistryTest::parse_rejectsEventsWithoutKeyFields() {
        test::RecordingHost         host;
        transport::TransportAdapter transport(true, host.sendFn());
        transfer::TransferRegistry  registry(transport);

        QVERIFY(!registry.handleProgressMessage(QJsonObject{{"url", "http://x/a"}, {"status", "downloading"}}));
        QVERIFY(!registry.handleProgressMessage(QJsonObject{{"filename", "a"}, {"status", "downloading"}}));
        QCOMPARE(registry.size(), std::size_t(0));

        const auto event = transfer::ProgressEvent::fromJson(progressJson("http://x/a", "a", 1.0));
        QVERIFY(event.has_value());
        QCOMPARE(event->key(), QString("http://x/a_a"));
        QVERIFY(event->error.isEmpty());
    }

} // namespace hostbridge

int runTransferRegistryTests(int argc, char** argv) {
    hostbridge::TransferRegistryTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_transfer_registry.moc"
