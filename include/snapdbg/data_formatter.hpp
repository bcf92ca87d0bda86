#pragma once

#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QVector>

#include "snapdbg/variable_resolver.hpp"

namespace snapdbg {

class DataFormatter {
public:
    DataFormatter() = default;

    QString buildTable(const QStringList& headers, const QVector<QStringList>& rows) const;

    // Resolver output keeps member order, so it is written by hand rather than
    // through QJsonDocument, which sorts object keys.
    QString toJsonString(const DisplayList& fields, bool pretty) const;
    QString toJsonString(const QJsonValue& value, bool pretty) const;

private:
    static QString quoted(const QString& text);
    static QString scalarJson(const QJsonValue& value);
    static void writeValue(const DisplayValue& value, bool pretty, int indent, QString& out);
    static void writeFields(
        const std::vector<DisplayField>& fields, bool pretty, int indent, QString& out);
};

}  // namespace snapdbg
