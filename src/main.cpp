#include "common/Config.hpp"
#include "core/HostBridge.hpp"
#include "modes/dialog.hpp"
#include "modes/request.hpp"
#include "modes/transfer.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>

#include <print>

namespace {

    int runCli(QCoreApplication& app) {
        QCommandLineParser parser;
        parser.setApplicationDescription("hostbridge - issue operations to the desktop host process");
        parser.addHelpOption();
        parser.addVersionOption();

        QCommandLineOption optSocket(QStringList{"socket", "s"}, "Override host socket path.", "path");
        QCommandLineOption optConfig(QStringList{"config", "c"}, "Read settings from this ini file.", "file");
        QCommandLineOption optTimeout(QStringList{"timeout"}, "API request timeout in milliseconds.", "ms");

        // API requests
        QCommandLineOption optGet(QStringList{"get"}, "GET the given path.", "path");
        QCommandLineOption optPost(QStringList{"post"}, "POST to the given path.", "path");
        QCommandLineOption optPatch(QStringList{"patch"}, "PATCH the given path.", "path");
        QCommandLineOption optDelete(QStringList{"delete"}, "DELETE the given path.", "path");
        QCommandLineOption optBody(QStringList{"body"}, "JSON request body.", "json");
        QCommandLineOption optHeader(QStringList{"header", "H"}, "Extra request header (repeatable).", "name:value");

        // Dialogs
        QCommandLineOption optDialog(QStringList{"dialog"}, "Show a host dialog (confirm, ok_cancel, yes_no_cancel, info, warning, error).", "type");
        QCommandLineOption optTitle(QStringList{"title"}, "Dialog title.", "text");
        QCommandLineOption optMessage(QStringList{"message"}, "Dialog message.", "text");

        // Transfers
        QCommandLineOption optDownload(QStringList{"download"}, "Download a URL through the host.", "url");
        QCommandLineOption optFilename(QStringList{"filename"}, "Target filename for --download.", "name");
        QCommandLineOption optReveal(QStringList{"reveal"}, "Reveal a downloaded file in the file manager.", "filename");

        parser.addOptions({optSocket, optConfig, optTimeout, optGet, optPost, optPatch, optDelete, optBody, optHeader, optDialog, optTitle, optMessage, optDownload,
                           optFilename, optReveal});

        parser.process(app);

        hostbridge::Config config = hostbridge::Config::load(parser.value(optConfig));
        if (parser.isSet(optSocket)) {
            config.socketPath = parser.value(optSocket);
        }
        if (parser.isSet(optTimeout)) {
            bool      ok      = false;
            const int timeout = parser.value(optTimeout).toInt(&ok);
            if (!ok || timeout <= 0) {
                std::print(stderr, "Invalid --timeout value\n");
                return 2;
            }
            config.apiTimeoutMs = timeout;
        }

        struct MethodOption {
            const QCommandLineOption* option;
            const char*               method;
        };
        const MethodOption methods[] = {{&optGet, "GET"}, {&optPost, "POST"}, {&optPatch, "PATCH"}, {&optDelete, "DELETE"}};

        const bool         hasCommand = parser.isSet(optGet) || parser.isSet(optPost) || parser.isSet(optPatch) || parser.isSet(optDelete) ||
            parser.isSet(optDialog) || parser.isSet(optDownload) || parser.isSet(optReveal);
        if (!hasCommand) {
            parser.showHelp(2);
        }

        auto bridge = hostbridge::HostBridge::connectToHost(config);

        for (const auto& entry : methods) {
            if (parser.isSet(*entry.option)) {
                return modes::runRequest(app, *bridge, entry.method, parser.value(*entry.option), parser.value(optBody), parser.values(optHeader));
            }
        }

        if (parser.isSet(optDialog)) {
            return modes::runDialog(app, *bridge, parser.value(optDialog), parser.value(optTitle), parser.value(optMessage));
        }

        if (parser.isSet(optDownload)) {
            return modes::runTransfer(app, *bridge, parser.value(optDownload), parser.value(optFilename));
        }

        return modes::runReveal(*bridge, parser.value(optReveal));
    }

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("hostbridge");
    app.setApplicationVersion("1.0.0");

    return runCli(app);
}
