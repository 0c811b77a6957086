// docx_archive.h - read named parts out of a DOCX (OOXML zip) container
#ifndef DOCX_ARCHIVE_H
#define DOCX_ARCHIVE_H

#include "utils/docres_error.h"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <memory>

namespace docx
{
// Fixed part locations inside a word-processing package.
extern const char *const kDocumentBodyPath;          // word/document.xml
extern const char *const kDocumentRelationshipsPath; // word/_rels/document.xml.rels
extern const char *const kMediaDirectory;            // word/media/
extern const char *const kMediaExtension;            // .png

// Normalize a logical entry path: '\' -> '/', strip leading '/', collapse "./".
// Returns an empty string for paths that are empty or climb out of the package with "..".
QString normalizeEntryPath(const QString &logicalPath);

// Resolve a relationship target against the part that owns the relationship part.
// "media/image1.png" from "word/document.xml" -> "word/media/image1.png"; "/x.xml" -> "x.xml".
QString resolvePartTarget(const QString &sourcePart, const QString &target);

// Entry name used by readMedia: lower-cased base name plus the fixed image extension.
QString mediaEntryPath(const QString &name);

// An open container. The underlying archive (and its file handle) stays open
// until close() or destruction; one instance may serve every read of a document.
class DocxArchive
{
  public:
    DocxArchive();
    ~DocxArchive();
    DocxArchive(const DocxArchive &) = delete;
    DocxArchive &operator=(const DocxArchive &) = delete;

    // Fails with ContainerUnreadable when the file is missing or is not a zip archive.
    bool open(const QString &archivePath, DocResError *error = nullptr);
    void close();
    bool isOpen() const;
    QString path() const { return m_path; }

    // Fails with EntryNotFound for missing or unsafe paths, ContainerUnreadable for
    // a closed archive or an entry that cannot be inflated.
    bool read(const QString &logicalPath, QByteArray *data, DocResError *error = nullptr) const;
    bool contains(const QString &logicalPath) const;

    // Sorted entry names starting with prefix (all entries for an empty prefix).
    QStringList entryNames(const QString &prefix = QString()) const;

  private:
    struct State;
    std::unique_ptr<State> m_state;
    QString m_path;
};

// One-shot accessors: open, read one entry, release the container.
bool readEntry(const QString &archivePath, const QString &logicalPath, QByteArray *data,
               DocResError *error = nullptr);
bool readDocumentBody(const QString &archivePath, QByteArray *data, DocResError *error = nullptr);
bool readDocumentRelationships(const QString &archivePath, QByteArray *data, DocResError *error = nullptr);

// Media lookup by name: lower-cases the name and appends ".png". Other media types are
// reachable through resolvePartTarget + readEntry.
bool readMedia(const QString &archivePath, const QString &name, QByteArray *data, DocResError *error = nullptr);
} // namespace docx

#endif // DOCX_ARCHIVE_H
