#include "../src/common/Config.hpp"
#include "../src/common/Constants.hpp"

#include <QtTest/QtTest>
#include <QFile>
#include <QTemporaryDir>

namespace hostbridge {

    namespace {

        QString writeIni(const QTemporaryDir& dir, const QByteArray& contents) {
            const QString path = dir.filePath("hostbridge.conf");
            QFile         file(path);
            if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
                return {};
            }
            file.write(contents);
            return path;
        }

    } // namespace

    class ConfigTest : public QObject {
        Q_OBJECT

      private slots:
        void defaults_matchBuiltInConstants();
        void file_overridesDefaults();
        void file_missingLeavesDefaults();
        void environment_overridesFile();
        void invalidValuesAreIgnored();
        void dialogMode_parsing();
        void dialogPollAttempts_followsTimeoutAndInterval();
    };

    void ConfigTest::defaults_matchBuiltInConstants() {
        const Config config = Config::defaults();
        QCOMPARE(config.apiTimeoutMs, 5000);
        QCOMPARE(config.dialogTimeoutMs, 60000);
        QCOMPARE(config.dialogPollIntervalMs, 50);
        QVERIFY(config.dialogMode == DialogMode::Poll);
        QCOMPARE(config.sessionId, QString("desktop-session"));
        QVERIFY(config.socketPath.endsWith("hostbridge.sock"));
    }

    void ConfigTest::file_overridesDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        const QString path = writeIni(dir,
                                      "[bridge]\n"
                                      "socket=/tmp/custom.sock\n"
                                      "api_timeout_ms=1500\n"
                                      "dialog_timeout_ms=3000\n"
                                      "dialog_poll_interval_ms=25\n"
                                      "dialog_mode=push\n"
                                      "session_id=kiosk-3\n");
        QVERIFY(!path.isEmpty());

        const Config config = Config::load(path, QProcessEnvironment());
        QCOMPARE(config.socketPath, QString("/tmp/custom.sock"));
        QCOMPARE(config.apiTimeoutMs, 1500);
        QCOMPARE(config.dialogTimeoutMs, 3000);
        QCOMPARE(config.dialogPollIntervalMs, 25);
        QVERIFY(config.dialogMode == DialogMode::Push);
        QCOMPARE(config.sessionId, QString("kiosk-3"));
    }

    void ConfigTest::file_missingLeavesDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        Config config = Config::defaults();
        config.applyFile(dir.filePath("absent.conf"));
        QCOMPARE(config.apiTimeoutMs, API_REQUEST_TIMEOUT_MS);
        QCOMPARE(config.sessionId, QString("desktop-session"));
    }

    void ConfigTest::environment_overridesFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString       path = writeIni(dir, "[bridge]\napi_timeout_ms=1500\nsession_id=from-file\n");

        QProcessEnvironment env;
        env.insert("HOSTBRIDGE_API_TIMEOUT_MS", "250");
        env.insert("HOSTBRIDGE_SESSION_ID", "from-env");
        env.insert("HOSTBRIDGE_SOCKET", "/run/user/1000/other.sock");
        env.insert("HOSTBRIDGE_DIALOG_MODE", "PUSH");

        const Config config = Config::load(path, env);
        QCOMPARE(config.apiTimeoutMs, 250);
        QCOMPARE(config.sessionId, QString("from-env"));
        QCOMPARE(config.socketPath, QString("/run/user/1000/other.sock"));
        QVERIFY(config.dialogMode == DialogMode::Push);
    }

    void ConfigTest::invalidValuesAreIgnored() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString       path = writeIni(dir, "[bridge]\napi_timeout_ms=soon\ndialog_timeout_ms=-5\ndialog_mode=sometimes\n");

        QProcessEnvironment env;
        env.insert("HOSTBRIDGE_DIALOG_TIMEOUT_MS", "0");

        const Config config = Config::load(path, env);
        QCOMPARE(config.apiTimeoutMs, 5000);
        QCOMPARE(config.dialogTimeoutMs, 60000);
        QVERIFY(config.dialogMode == DialogMode::Poll);
    }

    void ConfigTest::dialogMode_parsing() {
        QVERIFY(Config::dialogModeFromString("poll") == DialogMode::Poll);
        QVERIFY(Config::dialogModeFromString(" Push ") == DialogMode::Push);
        QVERIFY(!Config::dialogModeFromString("websocket").has_value());
        QCOMPARE(Config::dialogModeToString(DialogMode::Push), QString("push"));
    }

    void ConfigTest::dialogPollAttempts_followsTimeoutAndInterval() {
        Config config = Config::defaults();
        QCOMPARE(config.dialogPollAttempts(), 1200);

        config.dialogTimeoutMs      = 5000;
        config.dialogPollIntervalMs = 50;
        QCOMPARE(config.dialogPollAttempts(), DIALOG_MAX_ATTEMPTS);

        config.dialogTimeoutMs = 10;
        QCOMPARE(config.dialogPollAttempts(), 1);

        // Non-positive interval falls back to the default 50 ms tick
        config.dialogTimeoutMs      = 1000;
        config.dialogPollIntervalMs = 0;
        QCOMPARE(config.dialogPollAttempts(), 20);
    }

} // namespace hostbridge

int runConfigTests(int argc, char** argv) {
    hostbridge::ConfigTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_config.moc"
