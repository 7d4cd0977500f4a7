#pragma once
#include "pipeline/middleware.h"

// Decides whether the upstream call streams. The binding's upstream mode
// arrives as metadata "upstream.stream" (follow | always | never) and
// falls back to the mode given here.
class StreamModeMiddleware : public IPipelineMiddleware {
public:
    explicit StreamModeMiddleware(StreamMode fallback = StreamMode::FollowClient)
        : m_fallback(fallback) {}
    QString name() const override { return "stream_mode"; }
    Result<SemanticRequest> onRequest(SemanticRequest request) override;

    static bool upstreamStreams(const SemanticRequest& request);

private:
    StreamMode m_fallback;
};
