#include "service/fonts/font_resolver.h"

#include "utils/resource_tracer.h"

#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QFont>
#include <QGuiApplication>
#include <QStringList>
#include <QtGlobal>

namespace
{
// QRawFont goes through the platform font database, which only a QGuiApplication sets up.
bool fontDatabaseAvailable(QString *errorMessage)
{
    if (qobject_cast<QGuiApplication *>(QCoreApplication::instance())) return true;
    if (errorMessage) *errorMessage = QStringLiteral("font loading requires a QGuiApplication");
    return false;
}
} // namespace

QString fontTierName(FontTier tier)
{
    switch (tier)
    {
    case FontTier::Primary: return QStringLiteral("primary");
    case FontTier::Fallback: return QStringLiteral("fallback");
    case FontTier::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

bool loadFontFile(const QString &path, int pixelSize, QRawFont *font, QString *errorMessage)
{
    QFile file(path);
    if (!file.exists())
    {
        if (errorMessage) *errorMessage = QStringLiteral("font file not found: %1").arg(path);
        return false;
    }
    if (!file.open(QIODevice::ReadOnly))
    {
        if (errorMessage) *errorMessage = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    const QByteArray data = file.readAll();
    if (data.isEmpty())
    {
        if (errorMessage) *errorMessage = QStringLiteral("font file is empty: %1").arg(path);
        return false;
    }
    if (!fontDatabaseAvailable(errorMessage)) return false;

    QRawFont raw;
    raw.loadFromData(data, qMax(1, pixelSize), QFont::PreferDefaultHinting);
    if (!raw.isValid())
    {
        if (errorMessage) *errorMessage = QStringLiteral("not a usable font program: %1").arg(path);
        return false;
    }
    if (font) *font = raw;
    return true;
}

QString DirectoryFontSource::fontFilePath(const QString &directory, const QString &name)
{
    return directory + name + QStringLiteral(".ttf");
}

bool DirectoryFontSource::load(const QString &name, int pixelSize, QRawFont *font, QString *origin,
                               QString *errorMessage) const
{
    if (name.isEmpty())
    {
        if (errorMessage) *errorMessage = QStringLiteral("empty font name");
        return false;
    }
    const QString path = fontFilePath(directory_, name);
    if (!loadFontFile(path, pixelSize, font, errorMessage)) return false;
    if (origin) *origin = QFileInfo(path).absoluteFilePath();
    return true;
}

bool StandardFontSource::load(const QString &name, int pixelSize, QRawFont *font, QString *origin,
                              QString *errorMessage) const
{
    Q_UNUSED(name);
    if (!fontFile_.isEmpty())
    {
        if (!loadFontFile(fontFile_, pixelSize, font, errorMessage)) return false;
        if (origin) *origin = QFileInfo(fontFile_).absoluteFilePath();
        return true;
    }

    if (!fontDatabaseAvailable(errorMessage)) return false;
    QFont standard(family_);
    standard.setStyleHint(QFont::SansSerif);
    standard.setPixelSize(qMax(1, pixelSize));
    const QRawFont raw = QRawFont::fromFont(standard);
    if (!raw.isValid())
    {
        if (errorMessage) *errorMessage = QStringLiteral("standard font %1 unavailable").arg(family_);
        return false;
    }
    if (font) *font = raw;
    if (origin) *origin = raw.familyName();
    return true;
}

FontResolver::FontResolver(const ResolverConfig &config, DiagnosticsSink *diagnostics)
    : pixelSize_(config.fontPixelSize), diagnostics_(diagnostics)
{
    sources_.push_back(std::make_unique<DirectoryFontSource>(config.fontDirectory));
    sources_.push_back(std::make_unique<StandardFontSource>(config.fallbackFontFamily, config.fallbackFontFile));
}

FontResolver::FontResolver(std::vector<std::unique_ptr<FontSource>> sources, int pixelSize,
                           DiagnosticsSink *diagnostics)
    : sources_(std::move(sources)), pixelSize_(pixelSize), diagnostics_(diagnostics)
{
}

FontResolution FontResolver::resolve(const QString &name) const
{
    FontResolution result;
    result.requested = name;

    QStringList failures;
    for (const auto &source : sources_)
    {
        QString origin;
        QString message;
        QRawFont font;
        if (!source->load(name, pixelSize_, &font, &origin, &message))
        {
            failures << QStringLiteral("%1: %2").arg(fontTierName(source->tier()), message);
            continue;
        }

        result.tier = source->tier();
        result.font = font;
        result.origin = origin;
        if (result.tier == FontTier::Primary)
        {
            reportTo(diagnostics_, TraceChannel::Font, TraceSeverity::Info,
                     QStringLiteral("loaded %1 from %2").arg(name, origin));
        }
        else
        {
            reportTo(diagnostics_, TraceChannel::Font, TraceSeverity::Warning,
                     QStringLiteral("font %1 unavailable (%2), using %3").arg(name, failures.join(QStringLiteral("; ")), origin));
        }
        return result;
    }

    result.tier = FontTier::Failed;
    result.error.code = DocResErrorCode::FontLoadFailure;
    result.error.message = QStringLiteral("neither %1 nor the standard font could be loaded (%2)")
                               .arg(name, failures.join(QStringLiteral("; ")));
    reportTo(diagnostics_, TraceChannel::Font, TraceSeverity::Error, result.error.toString());
    return result;
}

FontResolution loadFont(const QString &name, const QString &searchDirectory, DiagnosticsSink *diagnostics)
{
    ResolverConfig config;
    config.fontDirectory = searchDirectory;
    return FontResolver(config, diagnostics).resolve(name);
}
