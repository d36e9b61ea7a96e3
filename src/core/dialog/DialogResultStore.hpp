#pragma once

#include <QHash>
#include <QString>

#include <optional>

namespace hostbridge::dialog {

    // Keyed area the host writes dialog results into. Entries are removed by the reader.
    class DialogResultStore {
      public:
        static QString         keyFor(const QString& requestId);

        void                   write(const QString& requestId, const QString& value);
        std::optional<QString> take(const QString& requestId);
        bool                   contains(const QString& requestId) const;
        bool                   empty() const;
        std::size_t            size() const;

      private:
        QHash<QString, QString> m_values;
    };

} // namespace hostbridge::dialog
