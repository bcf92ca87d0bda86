#pragma once

#include <QString>
#include <QStringList>

namespace snapdbg {

// Positional form of a logpoint message: "a=$0, b=$1" plus {"a", "b"}.
struct LogTemplateSplit {
    QString format;
    QStringList expressions;
    QString error;

    [[nodiscard]] bool success() const { return error.isEmpty(); }
};

// Extracts every top level {expression} of a user template into the
// expression list and replaces it with $N. Identical expression text shares
// one index, '$' in literal text becomes "$$", and a space is inserted when a
// digit directly follows a placeholder so "$0" and the digit stay separate.
// Unbalanced braces produce an error result with empty format/expressions.
LogTemplateSplit splitLogTemplate(const QString& logTemplate);

// Rebuilds the user template from a positional format. References past the
// end of the expression list are kept verbatim.
QString mergeLogTemplate(const QString& format, const QStringList& expressions);

}  // namespace snapdbg
