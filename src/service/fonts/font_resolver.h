#ifndef FONT_RESOLVER_H
#define FONT_RESOLVER_H

#include "utils/docres_error.h"
#include "utils/resolver_config.h"

#include <QRawFont>
#include <QString>
#include <memory>
#include <vector>

class DiagnosticsSink;

// Which step of the fallback chain produced the font.
enum class FontTier
{
    Primary,
    Fallback,
    Failed
};

QString fontTierName(FontTier tier);

struct FontResolution
{
    FontTier tier = FontTier::Failed;
    QRawFont font;     // valid only for Primary / Fallback
    QString requested; // font name asked for
    QString origin;    // file path or family that produced the font
    DocResError error; // set only for Failed

    bool isLoaded() const { return tier != FontTier::Failed; }
    bool isDegraded() const { return tier == FontTier::Fallback; }
};

// One step of the chain. load() is attempted exactly once per resolve call and only
// reports success or failure; the kind of failure never changes the next step.
class FontSource
{
  public:
    virtual ~FontSource() = default;
    virtual FontTier tier() const = 0;
    virtual bool load(const QString &name, int pixelSize, QRawFont *font, QString *origin,
                      QString *errorMessage) const = 0;
};

// <directory><name>.ttf by plain concatenation, so the directory must carry its own
// trailing separator ("/fonts/" finds /fonts/Arial.ttf). Exact and case-sensitive.
class DirectoryFontSource : public FontSource
{
  public:
    explicit DirectoryFontSource(const QString &directory) : directory_(directory) {}
    FontTier tier() const override { return FontTier::Primary; }
    bool load(const QString &name, int pixelSize, QRawFont *font, QString *origin,
              QString *errorMessage) const override;

    static QString fontFilePath(const QString &directory, const QString &name);

  private:
    QString directory_;
};

// The designated default sans-serif font: a configured file when given, otherwise the
// standard family resolved through the platform font database.
class StandardFontSource : public FontSource
{
  public:
    StandardFontSource(const QString &family, const QString &fontFile) : family_(family), fontFile_(fontFile) {}
    FontTier tier() const override { return FontTier::Fallback; }
    bool load(const QString &name, int pixelSize, QRawFont *font, QString *origin,
              QString *errorMessage) const override;

  private:
    QString family_;
    QString fontFile_;
};

// Load a TrueType/OpenType program from a file. Missing file, read error and invalid
// font data all return false with a message. Needs a QGuiApplication (offscreen is
// enough); without one it returns false instead of touching the font database.
bool loadFontFile(const QString &path, int pixelSize, QRawFont *font, QString *errorMessage);

class FontResolver
{
  public:
    // Chain: DirectoryFontSource(config.fontDirectory) -> StandardFontSource(fallback family/file).
    explicit FontResolver(const ResolverConfig &config, DiagnosticsSink *diagnostics = nullptr);
    FontResolver(std::vector<std::unique_ptr<FontSource>> sources, int pixelSize,
                 DiagnosticsSink *diagnostics = nullptr);

    FontResolution resolve(const QString &name) const;

  private:
    std::vector<std::unique_ptr<FontSource>> sources_;
    int pixelSize_;
    DiagnosticsSink *diagnostics_;
};

// Resolve name against searchDirectory with the default fallback family.
// Requires a QGuiApplication in the process; without one every tier fails and the
// result is Failed/FontLoadFailure ("font loading requires a QGuiApplication").
FontResolution loadFont(const QString &name, const QString &searchDirectory, DiagnosticsSink *diagnostics = nullptr);

#endif // FONT_RESOLVER_H
