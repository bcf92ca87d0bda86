#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>
#include <QVector>

#include "snapdbg/status_message.hpp"
#include "snapdbg/variable_resolver.hpp"

namespace snapdbg {

class SnapshotParser {
public:
    SnapshotParser(const QJsonObject& snapshot, int maxExpansionLevel);

    // One [function, "file:line"] row per stack frame, top of stack first.
    QVector<QStringList> parseCallStack() const;
    DisplayList parseExpressions() const;
    DisplayList parseLocals(int stackFrameIndex) const;

    [[nodiscard]] const QJsonArray& stackFrames() const { return stackFrames_; }
    [[nodiscard]] const StatusMessage& statusMessage() const { return statusMessage_; }

private:
    QJsonArray variableTable_;
    QJsonArray evaluatedExpressions_;
    QJsonArray stackFrames_;
    int maxExpansionLevel_;
    StatusMessage statusMessage_;
};

}  // namespace snapdbg
