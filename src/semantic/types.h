#pragma once
#include <QtGlobal>

enum class FrameType : quint8 {
    Started, Delta, ActionDelta, UsageDelta, Finished, Failed
};

enum class SegmentKind : quint8 {
    Text, Media, Reasoning, Structured
};

enum class ErrorKind : quint8 {
    Unroutable,        // 404
    DecodeFailed,      // 400
    InvalidParameter,  // 400
    ConnectFailed,     // 502  (retryable)
    TlsVerifyFailed,   // 502
    UpstreamTimeout,   // 504  (retryable)
    UpstreamHttp,      // 502  (retryable for 408/429/5xx)
    StreamTimeout,     // 504
    EncodeFailed,      // 502
    Internal           // 500
};

enum class StopCause : quint8 {
    Completed, Length, ContentFilter, ToolCall
};

enum class StreamMode : quint8 {
    FollowClient = 0, ForceOn = 1, ForceOff = 2
};
