#include "DialogResultChannel.hpp"

#include <QDebug>

#include <utility>

namespace hostbridge::dialog {

    DialogResultChannel::DialogResultChannel(DialogResultStore& store, QObject* parent) : QObject(parent), m_store(store) {}

    DialogResultChannel::~DialogResultChannel() {
        cancelAll();
    }

    QFuture<QVariant> DialogResultChannel::await(const QString& id, const QString& dialogType, int maxAttempts, int intervalMs) {
        auto existing = m_polls.find(id);
        if (existing != m_polls.end()) {
            return existing->second.deferred.future();
        }

        Poll poll;
        poll.dialogType  = dialogType;
        poll.maxAttempts = maxAttempts > 0 ? maxAttempts : 1;
        poll.timer       = new QTimer(this);
        poll.timer->setInterval(intervalMs > 0 ? intervalMs : DIALOG_POLL_INTERVAL_MS);
        connect(poll.timer, &QTimer::timeout, this, [this, id]() { tick(id); });

        QTimer* timer  = poll.timer;
        auto    future = poll.deferred.future();
        m_polls.emplace(id, std::move(poll));
        timer->start();

        return future;
    }

    bool DialogResultChannel::isAwaiting(const QString& id) const {
        return m_polls.find(id) != m_polls.end();
    }

    std::size_t DialogResultChannel::activeCount() const {
        return m_polls.size();
    }

    void DialogResultChannel::cancelAll() {
        while (!m_polls.empty()) {
            const QString id   = m_polls.begin()->first;
            Poll          poll = finish(m_polls.begin());
            m_store.take(id);
            poll.deferred.fail(OperationError::coreShutdown());
        }
    }

    void DialogResultChannel::tick(const QString& id) {
        auto it = m_polls.find(id);
        if (it == m_polls.end()) {
            return;
        }

        ++it->second.attempts;

        if (auto raw = m_store.take(id)) {
            qDebug() << "Dialog result received:" << id << *raw << "after" << it->second.attempts << "polls";
            Poll poll = finish(it);
            poll.deferred.succeed(parseResult(poll.dialogType, *raw));
            return;
        }

        if (it->second.attempts >= it->second.maxAttempts) {
            qDebug() << "Dialog timeout:" << id << "after" << it->second.attempts << "polls";
            Poll poll = finish(it);
            poll.deferred.fail(OperationError::dialogTimeout(id));
        }
    }

    DialogResultChannel::Poll DialogResultChannel::finish(std::unordered_map<QString, Poll>::iterator it) {
        Poll poll = std::move(it->second);
        m_polls.erase(it);

        poll.timer->stop();
        poll.timer->deleteLater();
        poll.timer = nullptr;
        return poll;
    }

    QVariant DialogResultChannel::parseResult(const QString& dialogType, const QString& raw) {
        const QString value = raw.trimmed();

        if (dialogType == "confirm" || dialogType == "ok_cancel") {
            return QVariant(value == "true" || value == "ok");
        }

        bool      isInt  = false;
        const int number = value.toInt(&isInt);

        // 0 = yes, 1 = no, 2 = cancel
        if (dialogType == "yes_no_cancel" && isInt) {
            return QVariant(number);
        }

        if (value == "true" || value == "false") {
            return QVariant(value == "true");
        }
        if (value == "ok") {
            return QVariant(true);
        }
        if (isInt) {
            return QVariant(number);
        }
        return QVariant(raw);
    }

    QVariant DialogResultChannel::parseResult(const QString& dialogType, const QJsonValue& value) {
        if (value.isBool()) {
            return QVariant(value.toBool());
        }
        if (value.isDouble()) {
            return parseResult(dialogType, QString::number(value.toInt()));
        }
        return parseResult(dialogType, value.toString());
    }

} // namespace hostbridge::dialog
