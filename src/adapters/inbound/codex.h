#pragma once
#include "adapters/inbound/openai_responses.h"

// Caller-facing endpoint of Codex clients. Accepts Responses bodies and
// Chat Completions bodies alike and always answers in the Responses shape.
class CodexAdapter : public OpenAIResponsesAdapter {
public:
    CodexAdapter() = default;

    QString protocol() const override;
    Result<SemanticRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) override;

private:
    static bool isChatFormat(const QJsonObject& root);
};
