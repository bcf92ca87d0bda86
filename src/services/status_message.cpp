#include "snapdbg/status_message.hpp"

#include <QJsonArray>
#include <QJsonValue>
#include <QStringList>

namespace snapdbg {

StatusMessage::StatusMessage(const QJsonObject& parent) {
    if (!parent.contains("status")) {
        return;
    }

    const QJsonObject status = parent.value("status").toObject();
    const QJsonObject description = status.value("description").toObject();
    isError_ = status.value("isError").toBool(false);
    refersTo_ = status.value("refersTo").toString();

    if (!description.value("format").isString()) {
        return;
    }

    QStringList parameters;
    for (const QJsonValue& parameter : description.value("parameters").toArray()) {
        parameters.append(parameter.toString());
    }
    parsedMessage_ = format(description.value("format").toString(), parameters);
    hasMessage_ = true;
}

QString StatusMessage::format(const QString& formatString, const QStringList& parameters) {
    QString out;
    out.reserve(formatString.size());

    for (int i = 0; i < formatString.size(); ++i) {
        const QChar c = formatString.at(i);
        if (c != '$' || i + 1 >= formatString.size()) {
            out += c;
            continue;
        }

        const QChar next = formatString.at(i + 1);
        if (next == '$') {
            out += '$';
            ++i;
        } else if (next.isDigit() && next.digitValue() < parameters.size()) {
            // Only single digit references are recognised.
            out += parameters.at(next.digitValue());
            ++i;
        } else {
            out += '$';
        }
    }
    return out;
}

}  // namespace snapdbg
