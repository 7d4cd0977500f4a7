#pragma once
#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QJsonValue>

struct ExtensionBag {
    QJsonObject data;

    void set(const QString& key, const QJsonValue& value) { data[key] = value; }
    QJsonValue get(const QString& key) const { return data.value(key); }
    bool has(const QString& key) const { return data.contains(key); }
    void remove(const QString& key) { data.remove(key); }

    // Unmapped top-level keys of a decoded payload, tagged with its format.
    void setPassthrough(const QString& format, const QJsonObject& fields) {
        if (fields.isEmpty()) {
            data.remove(QStringLiteral("passthrough"));
            data.remove(QStringLiteral("passthrough_format"));
            return;
        }
        data[QStringLiteral("passthrough")] = fields;
        data[QStringLiteral("passthrough_format")] = format;
    }
    QJsonObject passthrough() const {
        return data.value(QStringLiteral("passthrough")).toObject();
    }
    QString passthroughFormat() const {
        return data.value(QStringLiteral("passthrough_format")).toString();
    }

    bool operator==(const ExtensionBag&) const = default;
};
