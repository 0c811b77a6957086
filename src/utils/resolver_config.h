// resolver_config.h - settings shared by the font resolver and the diagnostics sink
#ifndef DOCRES_RESOLVER_CONFIG_H
#define DOCRES_RESOLVER_CONFIG_H

#include <QHash>
#include <QString>

#define DOCRES_DEFAULT_FALLBACK_FAMILY "Helvetica"
#define DOCRES_DEFAULT_FONT_PIXEL_SIZE 12
#define DOCRES_ENV_FONT_DIR "DOCRES_FONT_DIR"
#define DOCRES_ENV_FALLBACK_FONT "DOCRES_FALLBACK_FONT"

class DiagnosticsSink;

struct ResolverConfig
{
    QString fontDirectory;                                                // fonts.dir
    QString fallbackFontFamily = QStringLiteral(DOCRES_DEFAULT_FALLBACK_FAMILY); // fonts.fallback_family
    QString fallbackFontFile;                                             // fonts.fallback_file, overrides the family
    int fontPixelSize = DOCRES_DEFAULT_FONT_PIXEL_SIZE;                   // fonts.pixel_size
    bool verboseDiagnostics = false;                                      // log.verbose

    // Parse a flat key=value file. Lines starting with '#' or ';' are ignored,
    // values support \n \r \t \" \\ escapes. Keys that are missing keep their
    // defaults. Returns false and fills error when the file cannot be opened;
    // malformed lines and invalid values are reported to diagnostics and skipped.
    static bool fromIniFile(const QString &path, ResolverConfig *config, QString *error = nullptr,
                            DiagnosticsSink *diagnostics = nullptr);

    // Apply DOCRES_FONT_DIR / DOCRES_FALLBACK_FONT when they are set and non-empty.
    void applyEnvironment();

    // Apply already decoded key/value pairs; unknown keys are reported and ignored.
    void applyValues(const QHash<QString, QString> &values, DiagnosticsSink *diagnostics = nullptr);
};

namespace docres_ini
{
// Decode a single escaped value.
QString decodeValue(const QString &value);
} // namespace docres_ini

#endif // DOCRES_RESOLVER_CONFIG_H
