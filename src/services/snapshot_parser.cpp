#include "snapdbg/snapshot_parser.hpp"

#include "snapdbg/breakpoint_utils.hpp"

namespace snapdbg {

SnapshotParser::SnapshotParser(const QJsonObject& snapshot, int maxExpansionLevel)
    : variableTable_(snapshot.value("variableTable").toArray()),
      evaluatedExpressions_(snapshot.value("evaluatedExpressions").toArray()),
      stackFrames_(snapshot.value("stackFrames").toArray()),
      maxExpansionLevel_(maxExpansionLevel),
      statusMessage_(snapshot) {}

QVector<QStringList> SnapshotParser::parseCallStack() const {
    QVector<QStringList> callStack;
    for (const QJsonValue& frameValue : stackFrames_) {
        const QJsonObject frame = frameValue.toObject();
        const QString function = frame.value("function").toString("unknown");
        QString location = transformLocationToFileLine(frame.value("location").toObject());
        if (location.isNull()) {
            location = "unknown";
        }
        callStack.append({function, location});
    }
    return callStack;
}

DisplayList SnapshotParser::parseExpressions() const {
    return VariableResolver(variableTable_, maxExpansionLevel_)
        .resolveExpressions(evaluatedExpressions_);
}

DisplayList SnapshotParser::parseLocals(int stackFrameIndex) const {
    return VariableResolver(variableTable_, maxExpansionLevel_)
        .resolveLocals(stackFrames_, stackFrameIndex);
}

}  // namespace snapdbg
