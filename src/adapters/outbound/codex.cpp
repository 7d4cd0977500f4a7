#include "codex.h"
#include "adapters/wire/responses_wire.h"

QString CodexOutbound::adapterId() const
{
    return ResponsesWire::kCodexFormat;
}

Result<ProviderRequest> CodexOutbound::buildRequest(const SemanticRequest& request)
{
    Result<ProviderRequest> pr = ResponsesOutbound::buildRequest(request);
    if (pr && !pr->headers.contains(QStringLiteral("openai-beta")))
        pr->headers[QStringLiteral("openai-beta")] = QStringLiteral("responses=experimental");
    return pr;
}

QString CodexOutbound::defaultBaseUrl() const
{
    return QStringLiteral("https://chatgpt.com/backend-api/codex");
}

QStringList CodexOutbound::forwardedHeaders() const
{
    return {QStringLiteral("chatgpt-account-id"), QStringLiteral("openai-beta"),
            QStringLiteral("originator"), QStringLiteral("session_id")};
}

void CodexOutbound::finishBody(QJsonObject& body, const SemanticRequest& request) const
{
    Q_UNUSED(request);
    body[QStringLiteral("store")] = false;
    body[QStringLiteral("stream")] = true;
    if (!body.contains(QStringLiteral("instructions")))
        body[QStringLiteral("instructions")] = QString();
}
