#pragma once

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <vector>

namespace snapdbg {

struct DisplayField;

// Either a scalar (string, number, bool or null) or an ordered set of named
// members. Member order follows the order the agent reported them in.
struct DisplayValue {
    QJsonValue scalar;
    std::vector<DisplayField> members;
    bool composite = false;

    static DisplayValue fromScalar(const QJsonValue& value);
    static DisplayValue emptyComposite();

    // Inserts or, when the name is already present, replaces in place.
    void setMember(const QString& name, DisplayValue value);
    [[nodiscard]] const DisplayValue* member(const QString& name) const;
};

struct DisplayField {
    QString name;
    DisplayValue value;
};

using DisplayList = std::vector<DisplayField>;

QString maxExpansionMessage(int maxLevel);
QString cycleMessage(const QString& ancestorName);

// Expands snapshot variables through the shared variable table into display
// values. Expansion stops at maxLevel and at any reference back to a table
// entry that is already being expanded on the current path.
class VariableResolver {
public:
    static constexpr int kDefaultMaxLevel = 3;

    explicit VariableResolver(QJsonArray variableTable, int maxLevel = kDefaultMaxLevel);

    DisplayList resolveExpressions(const QJsonArray& expressions) const;
    DisplayList resolveLocals(const QJsonArray& stackFrames, int frameIndex) const;
    DisplayList resolveVariables(const QJsonArray& variables) const;

    [[nodiscard]] int maxLevel() const { return maxLevel_; }

private:
    struct Resolved {
        QString name;
        DisplayValue value;
        QString message;
        bool hasMessage = false;
    };

    struct Walk {
        QHash<int, QString> ancestors;
        qint64 truncations = 0;
        qint64 cycles = 0;
        qint64 danglingRefs = 0;
    };

    Resolved resolve(const QJsonObject& variable, int level, Walk& walk) const;
    static QString nameAndType(const QJsonObject& variable, bool hasMembers);

    QJsonArray variableTable_;
    int maxLevel_;
};

}  // namespace snapdbg
