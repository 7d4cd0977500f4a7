#pragma once
#include "responses.h"

// The ChatGPT Codex backend. Speaks the Responses wire but only streams,
// never stores, and requires instructions to be present.
class CodexOutbound : public ResponsesOutbound {
public:
    CodexOutbound() = default;
    ~CodexOutbound() override = default;

    QString adapterId() const override;
    Result<ProviderRequest> buildRequest(const SemanticRequest& request) override;

protected:
    QString defaultBaseUrl() const override;
    QStringList forwardedHeaders() const override;
    void finishBody(QJsonObject& body, const SemanticRequest& request) const override;
};
