#pragma once
#include <QString>
#include <QStringList>
#include <optional>

struct ConstraintSet {
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> topK;
    std::optional<int> maxTokens;
    std::optional<int> seed;
    std::optional<double> frequencyPenalty;
    std::optional<double> presencePenalty;
    std::optional<QString> reasoningEffort;
    std::optional<int> thinkingBudget;
    std::optional<bool> parallelToolCalls;
    QStringList stopSequences;

    bool operator==(const ConstraintSet&) const = default;
};

// Documented bounds of one upstream. An unset optional means the upstream
// has no such parameter at all.
struct ParameterBounds {
    struct Range {
        double min;
        double max;
    };

    std::optional<Range> temperature;
    std::optional<Range> topP;
    std::optional<Range> topK;
    std::optional<Range> maxTokens;
    std::optional<Range> frequencyPenalty;
    std::optional<Range> presencePenalty;
    bool seed = false;
    bool stopSequences = false;
};
