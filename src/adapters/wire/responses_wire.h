#pragma once
#include "wire_util.h"

// OpenAI Responses API (and the ChatGPT Codex backend, which speaks the same
// wire) <-> canonical model.
namespace ResponsesWire {
    inline const QString kFormat = QStringLiteral("openai.responses");
    inline const QString kCodexFormat = QStringLiteral("codex");

    QStringList compatibleFormats();

    // formatTag names the passthrough origin (openai.responses or codex).
    Result<SemanticRequest> decodeRequest(const QJsonObject& root, const QString& formatTag);
    Result<QJsonObject> encodeRequest(const SemanticRequest& request);

    Result<SemanticResponse> decodeResponse(const QJsonObject& root, const QString& formatTag);
    Result<QJsonObject> encodeResponse(const SemanticResponse& response);

    // Output items for one assistant turn. withIds adds the item ids and
    // status a server response carries.
    Result<QJsonArray> encodeAssistantItems(const QList<Segment>& segments,
                                            const QList<ActionCall>& calls,
                                            bool withIds);
    QJsonObject functionCallItem(const ActionCall& call, bool withIds);
    QJsonObject messageItem(const QString& itemId, const QString& text, bool completed);
    QJsonObject reasoningItem(const QString& itemId, const QString& summary);

    QString status(StopCause cause);
    QString incompleteReason(StopCause cause);
    StopCause stopCause(const QString& status, const QString& incompleteReason, bool sawToolCall);

    QJsonObject usageObject(const UsageEntry& usage);
    UsageEntry usageFrom(const QJsonObject& usage);

    DomainFailure failureFromError(int httpStatus, const QJsonObject& error);

    ParameterBounds bounds();
}
