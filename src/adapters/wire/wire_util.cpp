#include "wire_util.h"
#include "core/log_manager.h"
#include <QJsonParseError>
#include <QUuid>

namespace WireUtil {

Result<QJsonObject> parseObject(const QByteArray& body)
{
    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::decodeFailed(
            QStringLiteral("invalid_json"),
            QStringLiteral("Body is not valid JSON: %1").arg(parseErr.errorString())));
    }
    if (!doc.isObject()) {
        return std::unexpected(DomainFailure::decodeFailed(
            QStringLiteral("invalid_json"),
            QStringLiteral("Body must be a JSON object")));
    }
    return doc.object();
}

QByteArray compact(const QJsonObject& obj)
{
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QJsonObject collectUnmapped(const QJsonObject& root, const QStringList& mappedKeys)
{
    QJsonObject unmapped;
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!mappedKeys.contains(it.key())) {
            unmapped.insert(it.key(), it.value());
        }
    }
    return unmapped;
}

void mergePassthrough(QJsonObject& body,
                      const ExtensionBag& extensions,
                      const QStringList& compatibleFormats)
{
    const QJsonObject fields = extensions.passthrough();
    if (fields.isEmpty()) {
        return;
    }

    const QString origin = extensions.passthroughFormat();
    if (!compatibleFormats.contains(origin)) {
        LOG_WARNING(QStringLiteral("Passthrough fields from format '%1' cannot be carried into '%2', dropped: %3")
                        .arg(origin, compatibleFormats.value(0), fields.keys().join(QStringLiteral(", "))));
        return;
    }

    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        if (!body.contains(it.key())) {
            body.insert(it.key(), it.value());
        }
    }
}

QJsonObject extrasOf(const QJsonObject& block, const QStringList& knownKeys)
{
    return collectUnmapped(block, knownKeys);
}

void applyExtras(QJsonObject& block, const QJsonObject& extras)
{
    for (auto it = extras.constBegin(); it != extras.constEnd(); ++it) {
        if (!block.contains(it.key())) {
            block.insert(it.key(), it.value());
        }
    }
}

QByteArray sseFrame(const QString& event, const QJsonObject& payload)
{
    QByteArray out;
    if (!event.isEmpty()) {
        out += "event: " + event.toUtf8() + '\n';
    }
    out += "data: " + compact(payload) + "\n\n";
    return out;
}

QByteArray sseData(const QByteArray& data)
{
    return "data: " + data + "\n\n";
}

QString argsText(const QJsonValue& value)
{
    if (value.isString()) {
        return value.toString();
    }
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    return QString();
}

int budgetForEffort(const QString& effort)
{
    if (effort == QLatin1String("low"))    return 1024;
    if (effort == QLatin1String("medium")) return 4096;
    if (effort == QLatin1String("high"))   return 16384;
    return 0;
}

QString effortForBudget(int budget)
{
    if (budget <= 0)     return QStringLiteral("minimal");
    if (budget <= 1024)  return QStringLiteral("low");
    if (budget <= 4096)  return QStringLiteral("medium");
    return QStringLiteral("high");
}

QString toDataUri(const MediaRef& media)
{
    return QStringLiteral("data:%1;base64,%2")
        .arg(media.mimeType, QString::fromLatin1(media.inlineData.toBase64()));
}

bool parseDataUri(const QString& uri, MediaRef& out)
{
    if (!uri.startsWith(QLatin1String("data:"))) {
        return false;
    }
    const int comma = uri.indexOf(QLatin1Char(','));
    if (comma < 0) {
        return false;
    }
    const QString header = uri.mid(5, comma - 5);
    if (!header.endsWith(QLatin1String(";base64"))) {
        return false;
    }
    out.mimeType = header.chopped(7);
    out.inlineData = QByteArray::fromBase64(uri.mid(comma + 1).toLatin1());
    out.uri.clear();
    return true;
}

MediaRef mediaFromUrl(const QString& url)
{
    MediaRef ref;
    if (!parseDataUri(url, ref)) {
        ref.uri = url;
    }
    return ref;
}

QString mediaUrl(const MediaRef& media)
{
    return media.inlineData.isEmpty() ? media.uri : toDataUri(media);
}

QString newId(const QString& prefix)
{
    return prefix + QUuid::createUuid().toString(QUuid::Id128).left(24);
}

UsageEntry maxUsage(const UsageEntry& a, const UsageEntry& b)
{
    UsageEntry u;
    u.promptTokens = qMax(a.promptTokens, b.promptTokens);
    u.completionTokens = qMax(a.completionTokens, b.completionTokens);
    u.totalTokens = qMax(a.totalTokens, b.totalTokens);
    return u;
}

VoidResult checkStructuredOrigin(const Segment& segment,
                                 const QStringList& compatibleFormats)
{
    if (segment.kind != SegmentKind::Structured) {
        return {};
    }
    if (compatibleFormats.contains(segment.originFormat)) {
        return {};
    }
    return std::unexpected(DomainFailure::encodeFailed(
        QStringLiteral("unrepresentable_content"),
        QStringLiteral("A '%1' content block cannot be represented in the '%2' format")
            .arg(segment.originFormat, compatibleFormats.value(0))));
}

}
