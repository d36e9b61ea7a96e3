#pragma once

#include "OperationError.hpp"

#include <QFuture>
#include <QPromise>

#include <memory>

namespace hostbridge {

    // Shared handle on a QPromise. Copies settle the same future; only the first settlement counts.
    template <typename T>
    class Deferred {
      public:
        Deferred() : m_promise(std::make_shared<QPromise<T>>()) {
            m_promise->start();
        }

        QFuture<T> future() const {
            return m_promise->future();
        }

        bool isSettled() const {
            return m_promise->future().isFinished();
        }

        void succeed(const T& value) const {
            if (isSettled()) {
                return;
            }
            m_promise->addResult(value);
            m_promise->finish();
        }

        void fail(const OperationError& error) const {
            if (isSettled()) {
                return;
            }
            m_promise->setException(error);
            m_promise->finish();
        }

        static QFuture<T> failed(const OperationError& error) {
            Deferred deferred;
            deferred.fail(error);
            return deferred.future();
        }

      private:
        std::shared_ptr<QPromise<T>> m_promise;
    };

} // namespace hostbridge
