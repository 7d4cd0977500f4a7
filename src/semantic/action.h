#pragma once
#include <QString>
#include <QJsonObject>

struct ActionSpec {
    QString name;
    QString description;
    QJsonObject parameters;

    bool operator==(const ActionSpec&) const = default;
};

// args is the argument payload exactly as the source format carried it.
struct ActionCall {
    QString callId;
    QString name;
    QString args;

    bool operator==(const ActionCall&) const = default;
};

// A tool call on the stream. Upstream adapters emit fragments keyed by slot
// (the upstream block or tool index); once assembled the relay forwards a
// single closed delta whose argsPatch holds the complete arguments.
struct ActionDelta {
    int slot = 0;
    QString callId;
    QString name;
    QString argsPatch;
    bool closed = false;
};

struct ToolChoice {
    enum class Mode : quint8 { Unset, Auto, None, Required, Named };
    Mode mode = Mode::Unset;
    QString name;

    bool operator==(const ToolChoice&) const = default;
};
