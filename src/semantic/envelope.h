#pragma once
#include <QString>
#include <QUuid>

struct SemanticEnvelope {
    QString requestId;

    static SemanticEnvelope create() {
        return SemanticEnvelope{QUuid::createUuid().toString(QUuid::WithoutBraces)};
    }
};
