#include "snapdbg/data_formatter.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>

namespace snapdbg {

QString DataFormatter::buildTable(
    const QStringList& headers,
    const QVector<QStringList>& rows) const {
    QVector<int> widths;
    for (int column = 0; column < headers.size(); ++column) {
        int width = headers.at(column).size();
        for (const QStringList& row : rows) {
            width = std::max(width, static_cast<int>(row.value(column).size()));
        }
        widths.append(width);
    }

    QStringList separator;
    for (const int width : widths) {
        separator.append(QString(width, '-'));
    }

    QVector<QStringList> allRows;
    allRows.append(headers);
    allRows.append(separator);
    allRows += rows;

    QString table;
    for (const QStringList& row : allRows) {
        QStringList fields;
        for (int column = 0; column < widths.size(); ++column) {
            fields.append(row.value(column).leftJustified(widths.at(column), ' '));
        }
        table += fields.join("  ");
        table += '\n';
    }
    return table;
}

QString DataFormatter::scalarJson(const QJsonValue& value) {
    // Let QJsonDocument handle escaping and number formatting.
    const QByteArray wrapped = QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact);
    return QString::fromUtf8(wrapped.mid(1, wrapped.size() - 2));
}

QString DataFormatter::quoted(const QString& text) {
    return scalarJson(QJsonValue(text));
}

void DataFormatter::writeValue(const DisplayValue& value, bool pretty, int indent, QString& out) {
    if (!value.composite) {
        out += scalarJson(value.scalar);
        return;
    }
    writeFields(value.members, pretty, indent, out);
}

void DataFormatter::writeFields(
    const std::vector<DisplayField>& fields,
    bool pretty,
    int indent,
    QString& out) {
    if (fields.empty()) {
        out += "{}";
        return;
    }

    const QString pad(indent + 2, ' ');
    out += '{';
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out += pretty ? "," : ", ";
        }
        if (pretty) {
            out += '\n' + pad;
        }
        out += quoted(fields[i].name) + ": ";
        writeValue(fields[i].value, pretty, indent + 2, out);
    }
    if (pretty) {
        out += '\n' + QString(indent, ' ');
    }
    out += '}';
}

QString DataFormatter::toJsonString(const DisplayList& fields, bool pretty) const {
    if (fields.empty()) {
        return "[]";
    }

    QString out = "[";
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out += pretty ? "," : ", ";
        }
        if (pretty) {
            out += "\n  ";
        }
        writeFields({fields[i]}, pretty, pretty ? 2 : 0, out);
    }
    out += pretty ? "\n]" : "]";
    return out;
}

QString DataFormatter::toJsonString(const QJsonValue& value, bool pretty) const {
    const QJsonDocument::JsonFormat format = pretty ? QJsonDocument::Indented : QJsonDocument::Compact;
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(format)).trimmed();
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(format)).trimmed();
    }
    return scalarJson(value);
}

}  // namespace snapdbg
