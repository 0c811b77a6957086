#include "service/package/relationship_table.h"

#include "service/package/docx_archive.h"
#include "utils/resource_tracer.h"

#include <QXmlStreamReader>

namespace docx
{
const char *const kHyperlinkRelationshipType =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink";
const char *const kImageRelationshipType =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships/image";
} // namespace docx

namespace
{
QString describeReaderError(const QXmlStreamReader &reader)
{
    return QStringLiteral("%1 at line %2, column %3")
        .arg(reader.errorString())
        .arg(reader.lineNumber())
        .arg(reader.columnNumber());
}
} // namespace

bool RelationshipTable::parse(const QByteArray &xml, RelationshipTable *table, DocResError *error,
                              DiagnosticsSink *diagnostics)
{
    clearError(error);
    if (table) *table = RelationshipTable();

    QXmlStreamReader reader(xml);
    if (!reader.readNextStartElement())
    {
        const QString detail = reader.hasError() ? describeReaderError(reader) : QStringLiteral("no root element");
        return failWith(error, DocResErrorCode::RelationshipParseError,
                        QStringLiteral("relationship part is not valid XML: %1").arg(detail));
    }
    if (reader.name() != QLatin1String("Relationships"))
    {
        return failWith(error, DocResErrorCode::RelationshipParseError,
                        QStringLiteral("unexpected root element <%1>, expected <Relationships>")
                            .arg(reader.name().toString()));
    }

    RelationshipTable parsed;
    while (reader.readNextStartElement())
    {
        if (reader.name() != QLatin1String("Relationship"))
        {
            reportTo(diagnostics, TraceChannel::Relationship, TraceSeverity::Info,
                     QStringLiteral("skipping unknown element <%1>").arg(reader.name().toString()));
            reader.skipCurrentElement();
            continue;
        }

        const QXmlStreamAttributes attributes = reader.attributes();
        Entry entry;
        entry.id = attributes.value(QLatin1String("Id")).toString();
        entry.type = attributes.value(QLatin1String("Type")).toString();
        entry.target = attributes.value(QLatin1String("Target")).toString();
        if (attributes.value(QLatin1String("TargetMode")) == QLatin1String("External"))
        {
            entry.targetMode = TargetMode::External;
        }
        const qint64 line = reader.lineNumber();
        reader.skipCurrentElement();

        if (entry.id.isEmpty() || !attributes.hasAttribute(QLatin1String("Target")))
        {
            return failWith(error, DocResErrorCode::RelationshipParseError,
                            QStringLiteral("<Relationship> at line %1 is missing %2")
                                .arg(line)
                                .arg(entry.id.isEmpty() ? QStringLiteral("Id") : QStringLiteral("Target")));
        }

        if (parsed.m_index.contains(entry.id))
        {
            reportTo(diagnostics, TraceChannel::Relationship, TraceSeverity::Warning,
                     QStringLiteral("duplicate relationship id %1 at line %2 ignored, keeping the first target %3")
                         .arg(entry.id)
                         .arg(line)
                         .arg(parsed.m_entries.at(parsed.m_index.value(entry.id)).target));
            continue;
        }
        parsed.m_index.insert(entry.id, parsed.m_entries.size());
        parsed.m_entries.append(entry);
    }

    while (!reader.atEnd()) reader.readNext();
    if (reader.hasError())
    {
        return failWith(error, DocResErrorCode::RelationshipParseError,
                        QStringLiteral("relationship part is not valid XML: %1").arg(describeReaderError(reader)));
    }

    reportTo(diagnostics, TraceChannel::Relationship, TraceSeverity::Info,
             QStringLiteral("parsed %1 relationships").arg(parsed.size()));
    if (table) *table = parsed;
    return true;
}

bool RelationshipTable::resolve(const QString &id, QString *target, DocResError *error) const
{
    clearError(error);
    const Entry *entry = find(id);
    if (!entry)
    {
        if (target) target->clear();
        return failWith(error, DocResErrorCode::RelationshipNotFound,
                        QStringLiteral("no relationship with id %1").arg(id));
    }
    if (target) *target = entry->target;
    return true;
}

const RelationshipTable::Entry *RelationshipTable::find(const QString &id) const
{
    const auto it = m_index.constFind(id);
    if (it == m_index.constEnd()) return nullptr;
    return &m_entries.at(it.value());
}

QVector<RelationshipTable::Entry> RelationshipTable::entriesOfType(const QString &type) const
{
    QVector<Entry> matches;
    for (const Entry &entry : m_entries)
    {
        if (entry.type == type) matches.append(entry);
    }
    return matches;
}

namespace docx
{
bool loadRelationships(const QString &archivePath, RelationshipTable *table, DocResError *error,
                       DiagnosticsSink *diagnostics)
{
    if (table) *table = RelationshipTable();
    DocResError local;
    QByteArray xml;
    if (!readDocumentRelationships(archivePath, &xml, &local))
    {
        reportTo(diagnostics, TraceChannel::Relationship, TraceSeverity::Warning, local.toString());
        if (error) *error = local;
        return false;
    }
    if (!RelationshipTable::parse(xml, table, &local, diagnostics))
    {
        reportTo(diagnostics, TraceChannel::Relationship, TraceSeverity::Error,
                 QStringLiteral("%1 in %2").arg(local.toString(), archivePath));
        if (error) *error = local;
        return false;
    }
    clearError(error);
    return true;
}

bool resolveHyperlink(const QString &archivePath, const QString &id, QString *target, DocResError *error,
                      DiagnosticsSink *diagnostics)
{
    RelationshipTable table;
    if (!loadRelationships(archivePath, &table, error, diagnostics))
    {
        if (target) target->clear();
        return false;
    }
    return table.resolve(id, target, error);
}
} // namespace docx
