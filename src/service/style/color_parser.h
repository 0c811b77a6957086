// color_parser.h - turn WordprocessingML colour tokens into RGB values
#ifndef COLOR_PARSER_H
#define COLOR_PARSER_H

#include "utils/docres_error.h"

#include <QColor>
#include <QString>
#include <QStringList>

class DiagnosticsSink;

namespace style
{
// Rules in order:
//   "auto" (exact)                 -> black
//   name from the fixed table      -> its RGB value (case-sensitive)
//   #?RGB or #?RRGGBB (hex digits) -> parsed channels, 3-digit form doubled per digit
// Anything else fails with InvalidColorFormat and returns an invalid QColor.
QColor parseColor(const QString &token, DocResError *error = nullptr, DiagnosticsSink *diagnostics = nullptr);

// Lookup in the named colour table only.
bool namedColor(const QString &name, QColor *color);
QStringList namedColorNames();

bool isHexColorToken(const QString &token);

// "RRGGBB" in upper case, the form used by w:color/@w:val.
QString colorToHex(const QColor &color);
} // namespace style

#endif // COLOR_PARSER_H
