#include "model_mapping_middleware.h"
#include "core/log_manager.h"

Result<SemanticRequest> ModelMappingMiddleware::onRequest(SemanticRequest request) {
    const auto it = m_modelMap.constFind(request.model);
    if (it != m_modelMap.constEnd() && !it.value().isEmpty()) {
        LOG_DEBUG(QStringLiteral("Model mapping: %1 -> %2").arg(request.model, it.value()));
        request.metadata[QStringLiteral("original_model")] = request.model;
        request.model = it.value();
    }
    return request;
}
