#pragma once
#include "semantic/ports.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QStringList>

// Helpers shared by every wire codec.
namespace WireUtil {
    // Request and response bodies must be JSON objects.
    Result<QJsonObject> parseObject(const QByteArray& body);

    QByteArray compact(const QJsonObject& obj);

    // Top-level keys of root that are not in mappedKeys.
    QJsonObject collectUnmapped(const QJsonObject& root, const QStringList& mappedKeys);

    // Merges the passthrough bag into body when it was decoded from one of
    // the compatible formats. Mapped keys are never overridden. Keys that
    // cannot be carried into another format are logged and dropped.
    void mergePassthrough(QJsonObject& body,
                          const ExtensionBag& extensions,
                          const QStringList& compatibleFormats);

    // Keys of a block other than the listed ones.
    QJsonObject extrasOf(const QJsonObject& block, const QStringList& knownKeys);
    void applyExtras(QJsonObject& block, const QJsonObject& extras);

    // One SSE frame. event may be empty for data-only formats.
    QByteArray sseFrame(const QString& event, const QJsonObject& payload);
    QByteArray sseData(const QByteArray& data);

    // Argument payloads: strings are kept verbatim, objects and arrays are
    // serialized compactly.
    QString argsText(const QJsonValue& value);

    // Reasoning effort <-> thinking budget (low 1024, medium 4096, high 16384).
    int budgetForEffort(const QString& effort);
    QString effortForBudget(int budget);

    QString toDataUri(const MediaRef& media);
    bool parseDataUri(const QString& uri, MediaRef& out);
    MediaRef mediaFromUrl(const QString& url);
    QString mediaUrl(const MediaRef& media);

    QString newId(const QString& prefix);

    UsageEntry maxUsage(const UsageEntry& a, const UsageEntry& b);

    // Rejects segments that belong to another wire format.
    VoidResult checkStructuredOrigin(const Segment& segment,
                                     const QStringList& compatibleFormats);
}
