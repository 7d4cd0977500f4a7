#pragma once
#include "wire_util.h"

// OpenAI Chat Completions <-> canonical model.
namespace OpenAIWire {
    inline const QString kFormat = QStringLiteral("openai");

    QStringList compatibleFormats();

    Result<SemanticRequest> decodeRequest(const QJsonObject& root);
    Result<QJsonObject> encodeRequest(const SemanticRequest& request);

    Result<SemanticResponse> decodeResponse(const QJsonObject& root);
    Result<QJsonObject> encodeResponse(const SemanticResponse& response);

    QString finishReason(StopCause cause);
    StopCause stopCause(const QString& finishReason);

    QJsonObject toolCallObject(const ActionCall& call);
    QJsonObject usageObject(const UsageEntry& usage);
    UsageEntry usageFrom(const QJsonObject& usage);

    QJsonObject errorBody(const DomainFailure& failure);
    DomainFailure failureFromError(int httpStatus, const QJsonObject& error);

    ParameterBounds bounds();
}
