#include "snapdbg/variable_resolver.hpp"

#include <QElapsedTimer>

#include <utility>

#include "snapdbg/status_message.hpp"
#include "snapdbg/telemetry.hpp"

namespace snapdbg {

namespace {

QString jsonText(const QJsonValue& value) {
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble(), 'g', 17);
    }
    if (value.isBool()) {
        return value.toBool() ? "true" : "false";
    }
    return {};
}

}  // namespace

DisplayValue DisplayValue::fromScalar(const QJsonValue& value) {
    DisplayValue out;
    out.scalar = value;
    return out;
}

DisplayValue DisplayValue::emptyComposite() {
    DisplayValue out;
    out.composite = true;
    return out;
}

void DisplayValue::setMember(const QString& name, DisplayValue value) {
    for (DisplayField& field : members) {
        if (field.name == name) {
            field.value = std::move(value);
            return;
        }
    }
    members.push_back({name, std::move(value)});
}

const DisplayValue* DisplayValue::member(const QString& name) const {
    for (const DisplayField& field : members) {
        if (field.name == name) {
            return &field.value;
        }
    }
    return nullptr;
}

QString maxExpansionMessage(int maxLevel) {
    return QString("DBG_MSG: Max expansion level of %1 hit. Specify a larger value for "
                   "--max-level to see more.").arg(maxLevel);
}

QString cycleMessage(const QString& ancestorName) {
    if (ancestorName.isEmpty()) {
        return "DBG_MSG: Cycle, refers to same instance as an ancestor field.";
    }
    return QString("DBG_MSG: Cycle, refers to same instance as ancestor field '%1'.")
        .arg(ancestorName);
}

VariableResolver::VariableResolver(QJsonArray variableTable, int maxLevel)
    : variableTable_(std::move(variableTable)), maxLevel_(qMax(0, maxLevel)) {}

DisplayList VariableResolver::resolveExpressions(const QJsonArray& expressions) const {
    return resolveVariables(expressions);
}

DisplayList VariableResolver::resolveLocals(const QJsonArray& stackFrames, int frameIndex) const {
    QJsonArray variables;
    if (frameIndex >= 0 && frameIndex < stackFrames.size()) {
        const QJsonObject frame = stackFrames.at(frameIndex).toObject();
        for (const QJsonValue& argument : frame.value("arguments").toArray()) {
            variables.append(argument);
        }
        for (const QJsonValue& local : frame.value("locals").toArray()) {
            variables.append(local);
        }
    }
    return resolveVariables(variables);
}

DisplayList VariableResolver::resolveVariables(const QJsonArray& variables) const {
    QElapsedTimer elapsed;
    elapsed.start();

    DisplayList out;
    qint64 truncations = 0;
    qint64 cycles = 0;
    qint64 danglingRefs = 0;

    for (const QJsonValue& variable : variables) {
        Walk walk;
        Resolved resolved = resolve(variable.toObject(), 0, walk);
        truncations += walk.truncations;
        cycles += walk.cycles;
        danglingRefs += walk.danglingRefs;

        out.push_back({resolved.name, std::move(resolved.value)});
        if (resolved.hasMessage) {
            out.push_back({resolved.name + " - DBG_MSG", DisplayValue::fromScalar(resolved.message)});
        }
    }

    Telemetry& telemetry = Telemetry::instance();
    telemetry.incrementCounter("resolver.variables", variables.size());
    telemetry.incrementCounter("resolver.truncations", truncations);
    telemetry.incrementCounter("resolver.cycles", cycles);
    telemetry.incrementCounter("resolver.dangling_refs", danglingRefs);
    telemetry.recordDurationMs("resolver.duration_ms", elapsed.elapsed());
    return out;
}

QString VariableResolver::nameAndType(const QJsonObject& variable, bool hasMembers) {
    QString name = variable.value("name").toString();
    if (variable.contains("type")) {
        name += QString(" (%1)").arg(jsonText(variable.value("type")));
    } else if (variable.contains("value") && hasMembers) {
        // Node.js agents report the type of a composite in its value field.
        name += QString(" (%1)").arg(jsonText(variable.value("value")));
    }
    return name;
}

VariableResolver::Resolved VariableResolver::resolve(
    const QJsonObject& variable,
    int level,
    Walk& walk) const {
    Resolved out;

    if (level > maxLevel_) {
        ++walk.truncations;
        out.name = variable.value("name").toString();
        out.value = DisplayValue::fromScalar(maxExpansionMessage(maxLevel_));
        return out;
    }

    const bool hasIndex = variable.contains("varTableIndex");
    const int index = variable.value("varTableIndex").toInt(-1);
    QJsonObject merged = variable;

    if (hasIndex) {
        const auto ancestor = walk.ancestors.constFind(index);
        if (ancestor != walk.ancestors.constEnd()) {
            ++walk.cycles;
            out.name = variable.value("name").toString();
            out.value = DisplayValue::fromScalar(cycleMessage(ancestor.value()));
            return out;
        }
        walk.ancestors.insert(index, variable.value("name").toString());

        const QJsonValue entry =
            index >= 0 && index < variableTable_.size() ? variableTable_.at(index) : QJsonValue();
        if (!entry.isObject()) {
            ++walk.danglingRefs;
        }
        // Fields of the table entry win over the referencing record.
        const QJsonObject tableFields = entry.toObject();
        for (auto it = tableFields.constBegin(); it != tableFields.constEnd(); ++it) {
            merged.insert(it.key(), it.value());
        }
    }

    const QJsonArray members = merged.value("members").toArray();
    out.name = nameAndType(merged, !members.isEmpty());

    const StatusMessage status(merged);
    if (status.hasMessage()) {
        out.message = status.parsedMessage();
        out.hasMessage = true;
    }

    if (!members.isEmpty()) {
        out.value = DisplayValue::emptyComposite();
        for (const QJsonValue& memberValue : members) {
            Resolved member = resolve(memberValue.toObject(), level + 1, walk);
            out.value.setMember(member.name, std::move(member.value));
            if (member.hasMessage) {
                out.value.setMember(
                    member.name + " - DBG_MSG", DisplayValue::fromScalar(member.message));
            }
        }
    } else if (merged.contains("value")) {
        out.value = DisplayValue::fromScalar(merged.value("value"));
    } else {
        out.value = DisplayValue::fromScalar(hasIndex ? QJsonValue() : QJsonValue(QString()));
    }

    if (hasIndex) {
        walk.ancestors.remove(index);
    }
    return out;
}

}  // namespace snapdbg
