#include "stream_mode_middleware.h"
#include "config/config_types.h"

Result<SemanticRequest> StreamModeMiddleware::onRequest(SemanticRequest request) {
    const QString configured = request.metadata.value(QStringLiteral("upstream.stream"));
    const StreamMode mode = configured.isEmpty() ? m_fallback : streamModeFromName(configured);

    bool upstream = request.stream;
    if (mode == StreamMode::ForceOn)
        upstream = true;
    else if (mode == StreamMode::ForceOff)
        upstream = false;

    request.metadata[QStringLiteral("stream.upstream")] =
        upstream ? QStringLiteral("true") : QStringLiteral("false");
    request.metadata[QStringLiteral("stream.downstream")] =
        request.stream ? QStringLiteral("true") : QStringLiteral("false");
    return request;
}

bool StreamModeMiddleware::upstreamStreams(const SemanticRequest& request) {
    const QString value = request.metadata.value(QStringLiteral("stream.upstream"));
    if (value.isEmpty())
        return request.stream;
    return value == QLatin1String("true");
}
