#include "service/package/docx_archive.h"

#include <QFile>
#include <QFileInfo>
#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>

#include <miniz.h>

namespace docx
{
const char *const kDocumentBodyPath = "word/document.xml";
const char *const kDocumentRelationshipsPath = "word/_rels/document.xml.rels";
const char *const kMediaDirectory = "word/media/";
const char *const kMediaExtension = ".png";
} // namespace docx

namespace
{
// Walk path segments; ".." pops, "." and empty segments vanish. Returns false when
// ".." would leave the package root.
bool collapseSegments(const QStringList &segments, QStringList *out)
{
    for (const QString &segment : segments)
    {
        if (segment.isEmpty() || segment == QStringLiteral(".")) continue;
        if (segment == QStringLiteral(".."))
        {
            if (out->isEmpty()) return false;
            out->removeLast();
            continue;
        }
        out->append(segment);
    }
    return true;
}

QString unifySeparators(QString path)
{
    path.replace(QLatin1Char('\\'), QLatin1Char('/'));
    return path;
}
} // namespace

namespace docx
{
struct DocxArchive::State
{
    State() { memset(&archive, 0, sizeof(archive)); }
    mz_zip_archive archive;
    bool open = false;
};

QString normalizeEntryPath(const QString &logicalPath)
{
    const QStringList segments = unifySeparators(logicalPath).split(QLatin1Char('/'));
    if (segments.contains(QStringLiteral(".."))) return QString();
    QStringList cleaned;
    if (!collapseSegments(segments, &cleaned)) return QString();
    return cleaned.join(QLatin1Char('/'));
}

QString resolvePartTarget(const QString &sourcePart, const QString &target)
{
    const QString unified = unifySeparators(target.trimmed());
    if (unified.isEmpty()) return QString();

    QStringList segments;
    if (!unified.startsWith(QLatin1Char('/')))
    {
        QStringList base = unifySeparators(sourcePart).split(QLatin1Char('/'));
        if (!base.isEmpty()) base.removeLast(); // drop the part's own file name
        segments = base;
    }
    segments.append(unified.split(QLatin1Char('/')));

    QStringList resolved;
    if (!collapseSegments(segments, &resolved)) return QString();
    return resolved.join(QLatin1Char('/'));
}

QString mediaEntryPath(const QString &name)
{
    return QLatin1String(kMediaDirectory) + name.toLower() + QLatin1String(kMediaExtension);
}

DocxArchive::DocxArchive()
    : m_state(std::make_unique<State>())
{
}

DocxArchive::~DocxArchive()
{
    close();
}

bool DocxArchive::open(const QString &archivePath, DocResError *error)
{
    close();
    clearError(error);

    const QFileInfo info(archivePath);
    if (!info.exists() || !info.isFile())
    {
        return failWith(error, DocResErrorCode::ContainerUnreadable,
                        QStringLiteral("container not found: %1").arg(archivePath));
    }
    if (!info.isReadable())
    {
        return failWith(error, DocResErrorCode::ContainerUnreadable,
                        QStringLiteral("container not readable: %1").arg(archivePath));
    }

    const QByteArray encoded = QFile::encodeName(info.absoluteFilePath());
    if (!mz_zip_reader_init_file(&m_state->archive, encoded.constData(), 0))
    {
        const mz_zip_error zipError = mz_zip_get_last_error(&m_state->archive);
        memset(&m_state->archive, 0, sizeof(m_state->archive));
        return failWith(error, DocResErrorCode::ContainerUnreadable,
                        QStringLiteral("not a valid zip container: %1 (%2)")
                            .arg(archivePath, QString::fromUtf8(mz_zip_get_error_string(zipError))));
    }
    m_state->open = true;
    m_path = archivePath;
    return true;
}

void DocxArchive::close()
{
    if (m_state->open)
    {
        mz_zip_reader_end(&m_state->archive);
        memset(&m_state->archive, 0, sizeof(m_state->archive));
        m_state->open = false;
    }
    m_path.clear();
}

bool DocxArchive::isOpen() const
{
    return m_state->open;
}

bool DocxArchive::read(const QString &logicalPath, QByteArray *data, DocResError *error) const
{
    clearError(error);
    if (data) data->clear();
    if (!m_state->open)
    {
        return failWith(error, DocResErrorCode::ContainerUnreadable, QStringLiteral("container is not open"));
    }

    const QString entryPath = normalizeEntryPath(logicalPath);
    if (entryPath.isEmpty())
    {
        return failWith(error, DocResErrorCode::EntryNotFound,
                        QStringLiteral("unsafe or empty entry path: %1").arg(logicalPath));
    }

    mz_zip_archive *archive = &m_state->archive;
    const QByteArray encoded = entryPath.toUtf8();
    const int index = mz_zip_reader_locate_file(archive, encoded.constData(), nullptr, 0);
    if (index < 0)
    {
        return failWith(error, DocResErrorCode::EntryNotFound,
                        QStringLiteral("entry %1 not found in %2").arg(entryPath, m_path));
    }
    if (mz_zip_reader_is_file_a_directory(archive, static_cast<mz_uint>(index)))
    {
        return failWith(error, DocResErrorCode::EntryNotFound,
                        QStringLiteral("entry %1 is a directory in %2").arg(entryPath, m_path));
    }

    mz_zip_archive_file_stat stat;
    if (!mz_zip_reader_file_stat(archive, static_cast<mz_uint>(index), &stat))
    {
        return failWith(error, DocResErrorCode::ContainerUnreadable,
                        QStringLiteral("failed to read metadata of %1 in %2").arg(entryPath, m_path));
    }
    if (stat.m_uncomp_size == 0) return true;
    // QByteArray is int-sized in Qt 5.
    if (stat.m_uncomp_size > static_cast<mz_uint64>(std::numeric_limits<int>::max()))
    {
        return failWith(error, DocResErrorCode::ContainerUnreadable,
                        QStringLiteral("entry %1 in %2 is too large (%3 bytes)")
                            .arg(entryPath, m_path)
                            .arg(static_cast<qulonglong>(stat.m_uncomp_size)));
    }

    size_t outSize = 0;
    void *ptr = mz_zip_reader_extract_to_heap(archive, static_cast<mz_uint>(index), &outSize, 0);
    if (!ptr)
    {
        return failWith(error, DocResErrorCode::ContainerUnreadable,
                        QStringLiteral("failed to inflate %1 in %2").arg(entryPath, m_path));
    }
    if (data) *data = QByteArray(static_cast<const char *>(ptr), static_cast<int>(outSize));
    mz_free(ptr);
    return true;
}

bool DocxArchive::contains(const QString &logicalPath) const
{
    if (!m_state->open) return false;
    const QString entryPath = normalizeEntryPath(logicalPath);
    if (entryPath.isEmpty()) return false;
    const QByteArray encoded = entryPath.toUtf8();
    return mz_zip_reader_locate_file(&m_state->archive, encoded.constData(), nullptr, 0) >= 0;
}

QStringList DocxArchive::entryNames(const QString &prefix) const
{
    QStringList names;
    if (!m_state->open) return names;
    const mz_uint count = mz_zip_reader_get_num_files(&m_state->archive);
    for (mz_uint i = 0; i < count; ++i)
    {
        mz_zip_archive_file_stat st;
        if (!mz_zip_reader_file_stat(&m_state->archive, i, &st)) continue;
        const QString name = QString::fromUtf8(st.m_filename);
        if (name.startsWith(prefix)) names << name;
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool readEntry(const QString &archivePath, const QString &logicalPath, QByteArray *data, DocResError *error)
{
    DocxArchive archive;
    if (!archive.open(archivePath, error))
    {
        if (data) data->clear();
        return false;
    }
    return archive.read(logicalPath, data, error);
}

bool readDocumentBody(const QString &archivePath, QByteArray *data, DocResError *error)
{
    return readEntry(archivePath, QLatin1String(kDocumentBodyPath), data, error);
}

bool readDocumentRelationships(const QString &archivePath, QByteArray *data, DocResError *error)
{
    return readEntry(archivePath, QLatin1String(kDocumentRelationshipsPath), data, error);
}

bool readMedia(const QString &archivePath, const QString &name, QByteArray *data, DocResError *error)
{
    if (name.trimmed().isEmpty())
    {
        if (data) data->clear();
        return failWith(error, DocResErrorCode::EntryNotFound, QStringLiteral("empty media name"));
    }
    return readEntry(archivePath, mediaEntryPath(name), data, error);
}
} // namespace docx
