#include "adapters/inbound/openai_native.h"
#include "adapters/wire/openai_wire.h"

QString OpenAINativeAdapter::protocol() const
{
    return QStringLiteral("openai.native");
}

Result<SemanticRequest> OpenAINativeAdapter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata)
{
    Result<QJsonObject> root = WireUtil::parseObject(body);
    if (!root) return std::unexpected(root.error());

    Result<SemanticRequest> req = OpenAIWire::decodeRequest(*root);
    if (!req) return req;
    req->metadata = metadata;
    return req;
}
