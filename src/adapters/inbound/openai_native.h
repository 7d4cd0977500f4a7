#pragma once
#include "adapters/inbound/anthropic.h"

// Accepts OpenAI Chat Completions requests but answers in the native
// Anthropic shape (bodies, stream events and errors alike). Backs the
// /openai/v1/chat/completions endpoint, whose clients expect exactly that.
class OpenAINativeAdapter : public AnthropicAdapter {
public:
    OpenAINativeAdapter() = default;

    QString protocol() const override;
    Result<SemanticRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) override;
};
