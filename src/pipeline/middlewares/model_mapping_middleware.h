#pragma once
#include "pipeline/middleware.h"
#include <QMap>

// Rewrites the caller's model name to the upstream's. Responses are left
// alone so the caller sees the model the upstream actually reports.
class ModelMappingMiddleware : public IPipelineMiddleware {
public:
    explicit ModelMappingMiddleware(const QMap<QString, QString>& modelMap = {})
        : m_modelMap(modelMap) {}
    QString name() const override { return "model_mapping"; }
    Result<SemanticRequest> onRequest(SemanticRequest request) override;

private:
    QMap<QString, QString> m_modelMap;
};
