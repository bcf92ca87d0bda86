#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace snapdbg {

// Human readable form of the "status" field a debug agent attaches to a
// breakpoint, a debuggee or a single variable.
class StatusMessage {
public:
    explicit StatusMessage(const QJsonObject& parent);

    [[nodiscard]] bool hasMessage() const { return hasMessage_; }
    [[nodiscard]] const QString& parsedMessage() const { return parsedMessage_; }
    [[nodiscard]] bool isError() const { return isError_; }
    [[nodiscard]] const QString& refersTo() const { return refersTo_; }

    static QString format(const QString& formatString, const QStringList& parameters);

private:
    bool hasMessage_ = false;
    QString parsedMessage_;
    bool isError_ = false;
    QString refersTo_;
};

}  // namespace snapdbg
