#include "adapters/inbound/codex.h"
#include "adapters/wire/openai_wire.h"
#include "adapters/wire/responses_wire.h"

QString CodexAdapter::protocol() const
{
    return ResponsesWire::kCodexFormat;
}

bool CodexAdapter::isChatFormat(const QJsonObject& root)
{
    return root.contains(QStringLiteral("messages")) && !root.contains(QStringLiteral("input"));
}

Result<SemanticRequest> CodexAdapter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata)
{
    Result<QJsonObject> root = WireUtil::parseObject(body);
    if (!root) return std::unexpected(root.error());

    if (!isChatFormat(*root))
        return decodeResponsesBody(*root, metadata);

    Result<SemanticRequest> req = OpenAIWire::decodeRequest(*root);
    if (!req) return req;
    req->metadata = metadata;
    return req;
}
