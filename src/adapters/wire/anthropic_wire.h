#pragma once
#include "wire_util.h"

// Anthropic Messages API <-> canonical model.
namespace AnthropicWire {
    inline const QString kFormat = QStringLiteral("anthropic");

    // The wire formats whose opaque blocks and passthrough keys this wire
    // can carry.
    QStringList compatibleFormats();

    Result<SemanticRequest> decodeRequest(const QJsonObject& root);
    Result<QJsonObject> encodeRequest(const SemanticRequest& request);

    Result<SemanticResponse> decodeResponse(const QJsonObject& root);
    Result<QJsonObject> encodeResponse(const SemanticResponse& response);

    // Content blocks of one message.
    Result<QJsonArray> encodeBlocks(const QList<Segment>& segments);
    QList<Segment> decodeBlocks(const QJsonArray& blocks);
    Segment decodeBlock(const QJsonObject& block);

    QString stopReason(StopCause cause);
    StopCause stopCause(const QString& reason);

    QJsonObject errorBody(const DomainFailure& failure);
    DomainFailure failureFromError(int httpStatus, const QJsonObject& error);

    ParameterBounds bounds();
}
