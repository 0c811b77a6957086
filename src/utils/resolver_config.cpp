#include "resolver_config.h"

#include "utils/resource_tracer.h"

#include <QFile>
#include <QTextStream>
#include <QtGlobal>

namespace
{
const char *const kKeyFontDir = "fonts.dir";
const char *const kKeyFallbackFamily = "fonts.fallback_family";
const char *const kKeyFallbackFile = "fonts.fallback_file";
const char *const kKeyPixelSize = "fonts.pixel_size";
const char *const kKeyVerbose = "log.verbose";

bool parseBool(const QString &value, bool *ok)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == QStringLiteral("1") || lowered == QStringLiteral("true") || lowered == QStringLiteral("yes") ||
        lowered == QStringLiteral("on"))
    {
        *ok = true;
        return true;
    }
    if (lowered == QStringLiteral("0") || lowered == QStringLiteral("false") || lowered == QStringLiteral("no") ||
        lowered == QStringLiteral("off"))
    {
        *ok = true;
        return false;
    }
    *ok = false;
    return false;
}
} // namespace

namespace docres_ini
{
QString decodeValue(const QString &value)
{
    QString result;
    result.reserve(value.size());
    bool escape = false;
    for (const QChar &ch : value)
    {
        if (!escape)
        {
            if (ch == QLatin1Char('\\'))
                escape = true;
            else
                result.append(ch);
            continue;
        }
        escape = false;
        switch (ch.unicode())
        {
        case 'n': result.append(QLatin1Char('\n')); break;
        case 'r': result.append(QLatin1Char('\r')); break;
        case 't': result.append(QLatin1Char('\t')); break;
        case '\\': result.append(QLatin1Char('\\')); break;
        case '"': result.append(QLatin1Char('"')); break;
        default: result.append(ch); break;
        }
    }
    if (escape) result.append(QLatin1Char('\\'));
    return result;
}
} // namespace docres_ini

bool ResolverConfig::fromIniFile(const QString &path, ResolverConfig *config, QString *error,
                                 DiagnosticsSink *diagnostics)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        if (error) *error = QStringLiteral("open failed: %1").arg(path);
        return false;
    }

    QHash<QString, QString> values;
    QTextStream ts(&file);
    ts.setCodec("utf-8");
    int lineNumber = 0;
    while (!ts.atEnd())
    {
        const QString rawLine = ts.readLine();
        lineNumber++;
        const QString trimmed = rawLine.trimmed();
        if (trimmed.isEmpty()) continue;
        if (trimmed.startsWith(QLatin1Char('#')) || trimmed.startsWith(QLatin1Char(';'))) continue;
        const int equalPos = rawLine.indexOf(QLatin1Char('='));
        if (equalPos <= 0)
        {
            reportTo(diagnostics, TraceChannel::Config, TraceSeverity::Warning,
                     QStringLiteral("invalid line %1 in %2").arg(lineNumber).arg(path));
            continue;
        }
        QString key = rawLine.left(equalPos).trimmed();
        if (key.startsWith(QChar(0xfeff))) key.remove(0, 1);
        values.insert(key, docres_ini::decodeValue(rawLine.mid(equalPos + 1)));
    }

    if (config) config->applyValues(values, diagnostics);
    return true;
}

void ResolverConfig::applyValues(const QHash<QString, QString> &values, DiagnosticsSink *diagnostics)
{
    for (auto it = values.constBegin(); it != values.constEnd(); ++it)
    {
        const QString &key = it.key();
        const QString value = it.value();
        if (key == QLatin1String(kKeyFontDir))
        {
            fontDirectory = value.trimmed();
        }
        else if (key == QLatin1String(kKeyFallbackFamily))
        {
            const QString family = value.trimmed();
            if (!family.isEmpty()) fallbackFontFamily = family;
        }
        else if (key == QLatin1String(kKeyFallbackFile))
        {
            fallbackFontFile = value.trimmed();
        }
        else if (key == QLatin1String(kKeyPixelSize))
        {
            bool ok = false;
            const int size = value.trimmed().toInt(&ok);
            if (ok && size > 0)
            {
                fontPixelSize = size;
            }
            else
            {
                reportTo(diagnostics, TraceChannel::Config, TraceSeverity::Warning,
                         QStringLiteral("ignoring invalid %1=%2, keep %3")
                             .arg(key, value)
                             .arg(fontPixelSize));
            }
        }
        else if (key == QLatin1String(kKeyVerbose))
        {
            bool ok = false;
            const bool verbose = parseBool(value, &ok);
            if (ok)
                verboseDiagnostics = verbose;
            else
                reportTo(diagnostics, TraceChannel::Config, TraceSeverity::Warning,
                         QStringLiteral("ignoring invalid %1=%2").arg(key, value));
        }
        else
        {
            reportTo(diagnostics, TraceChannel::Config, TraceSeverity::Info,
                     QStringLiteral("unknown key ignored: %1").arg(key));
        }
    }
}

void ResolverConfig::applyEnvironment()
{
    const QString dir = qEnvironmentVariable(DOCRES_ENV_FONT_DIR);
    if (!dir.isEmpty()) fontDirectory = dir;
    const QString fallback = qEnvironmentVariable(DOCRES_ENV_FALLBACK_FONT);
    if (!fallback.isEmpty()) fallbackFontFile = fallback;
}
