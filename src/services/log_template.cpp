#include "snapdbg/log_template.hpp"

#include <QJsonObject>

#include "snapdbg/telemetry.hpp"

namespace snapdbg {

namespace {

LogTemplateSplit splitError(const QString& logTemplate, const QString& message) {
    Telemetry::instance().incrementCounter("log_template.split_errors");
    Telemetry::instance().recordEvent("log_template_rejected", {
        {"template", logTemplate},
        {"error", message},
    });
    LogTemplateSplit result;
    result.error = message;
    return result;
}

QString expandReferences(const QString& segment, const QStringList& expressions) {
    QString out;
    int i = 0;
    while (i < segment.size()) {
        const QChar c = segment.at(i);
        int end = i + 1;
        while (c == '$' && end < segment.size() && segment.at(end).isDigit()) {
            ++end;
        }
        if (end - i < 2) {
            out += c;
            ++i;
            continue;
        }

        bool ok = false;
        const int index = segment.mid(i + 1, end - i - 1).toInt(&ok);
        if (ok && index < expressions.size()) {
            out += '{' + expressions.at(index) + '}';
        } else {
            out += segment.mid(i, end - i);
        }
        i = end;
    }
    return out;
}

}  // namespace

LogTemplateSplit splitLogTemplate(const QString& logTemplate) {
    LogTemplateSplit result;
    QString current;
    int braceDepth = 0;
    bool needSeparator = false;

    for (const QChar c : logTemplate) {
        if (needSeparator && c.isDigit()) {
            result.format += ' ';
        }
        needSeparator = false;

        if (braceDepth == 0) {
            if (c == '{') {
                current.clear();
                braceDepth = 1;
            } else if (c == '}') {
                return splitError(logTemplate,
                    "There are too many \"}\" characters in the log format string");
            } else if (c == '$') {
                result.format += "$$";
            } else {
                result.format += c;
            }
            continue;
        }

        if (c == '{') {
            ++braceDepth;
            current += c;
        } else if (c == '}') {
            --braceDepth;
            if (braceDepth > 0) {
                current += c;
                continue;
            }
            int index = result.expressions.indexOf(current);
            if (index < 0) {
                index = result.expressions.size();
                result.expressions.append(current);
            }
            result.format += '$' + QString::number(index);
            needSeparator = true;
        } else {
            current += c;
        }
    }

    if (braceDepth > 0) {
        return splitError(logTemplate,
            "There are too many \"{\" characters in the log format string");
    }
    return result;
}

QString mergeLogTemplate(const QString& format, const QStringList& expressions) {
    QStringList segments = format.split("$$");
    for (QString& segment : segments) {
        segment = expandReferences(segment, expressions);
    }
    return segments.join('$');
}

}  // namespace snapdbg
