#include "service/style/color_parser.h"

#include "utils/resource_tracer.h"

#include <QRegularExpression>

namespace
{
struct NamedColor
{
    const char *name;
    int r;
    int g;
    int b;
};

// AWT constant names in both spellings, plus the w:highlight names that do not clash with them.
const NamedColor kNamedColors[] = {
    {"black", 0, 0, 0},
    {"BLACK", 0, 0, 0},
    {"blue", 0, 0, 255},
    {"BLUE", 0, 0, 255},
    {"cyan", 0, 255, 255},
    {"CYAN", 0, 255, 255},
    {"darkGray", 64, 64, 64},
    {"DARK_GRAY", 64, 64, 64},
    {"gray", 128, 128, 128},
    {"GRAY", 128, 128, 128},
    {"green", 0, 255, 0},
    {"GREEN", 0, 255, 0},
    {"lightGray", 192, 192, 192},
    {"LIGHT_GRAY", 192, 192, 192},
    {"magenta", 255, 0, 255},
    {"MAGENTA", 255, 0, 255},
    {"orange", 255, 200, 0},
    {"ORANGE", 255, 200, 0},
    {"pink", 255, 175, 175},
    {"PINK", 255, 175, 175},
    {"red", 255, 0, 0},
    {"RED", 255, 0, 0},
    {"white", 255, 255, 255},
    {"WHITE", 255, 255, 255},
    {"yellow", 255, 255, 0},
    {"YELLOW", 255, 255, 0},
    {"darkBlue", 0, 0, 128},
    {"darkCyan", 0, 128, 128},
    {"darkGreen", 0, 128, 0},
    {"darkMagenta", 128, 0, 128},
    {"darkRed", 128, 0, 0},
    {"darkYellow", 128, 128, 0},
};

const QRegularExpression &hexColorPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\A#?(?:[0-9a-fA-F]{3}){1,2}\\z"));
    return pattern;
}
} // namespace

namespace style
{
bool namedColor(const QString &name, QColor *color)
{
    for (const NamedColor &entry : kNamedColors)
    {
        if (name == QLatin1String(entry.name))
        {
            if (color) *color = QColor(entry.r, entry.g, entry.b);
            return true;
        }
    }
    return false;
}

QStringList namedColorNames()
{
    QStringList names;
    for (const NamedColor &entry : kNamedColors) names << QString::fromLatin1(entry.name);
    return names;
}

bool isHexColorToken(const QString &token)
{
    return hexColorPattern().match(token).hasMatch();
}

QColor parseColor(const QString &token, DocResError *error, DiagnosticsSink *diagnostics)
{
    clearError(error);
    if (token == QStringLiteral("auto")) return QColor(0, 0, 0);

    QColor named;
    if (namedColor(token, &named)) return named;

    if (!isHexColorToken(token))
    {
        if (error)
        {
            error->code = DocResErrorCode::InvalidColorFormat;
            error->message = QStringLiteral("%1 could not be recognized as a valid color").arg(token);
        }
        reportTo(diagnostics, TraceChannel::Color, TraceSeverity::Warning,
                 QStringLiteral("unrecognized color `%1`").arg(token));
        return QColor();
    }

    QString digits = token.startsWith(QLatin1Char('#')) ? token.mid(1) : token;
    if (digits.size() == 3)
    {
        QString expanded;
        expanded.reserve(6);
        for (const QChar &ch : digits)
        {
            expanded.append(ch);
            expanded.append(ch);
        }
        digits = expanded;
    }

    const int r = digits.mid(0, 2).toInt(nullptr, 16);
    const int g = digits.mid(2, 2).toInt(nullptr, 16);
    const int b = digits.mid(4, 2).toInt(nullptr, 16);
    return QColor(r, g, b);
}

QString colorToHex(const QColor &color)
{
    if (!color.isValid()) return QString();
    return QStringLiteral("%1%2%3")
        .arg(color.red(), 2, 16, QLatin1Char('0'))
        .arg(color.green(), 2, 16, QLatin1Char('0'))
        .arg(color.blue(), 2, 16, QLatin1Char('0'))
        .toUpper();
}
} // namespace style
