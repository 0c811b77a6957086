#ifndef RELATIONSHIP_TABLE_H
#define RELATIONSHIP_TABLE_H

#include "utils/docres_error.h"

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QVector>

class DiagnosticsSink;

namespace docx
{
extern const char *const kHyperlinkRelationshipType;
extern const char *const kImageRelationshipType;
} // namespace docx

// 关系表：document.xml.rels 中 Id -> Target 的只读映射。
// - 每个文档构建一次，之后只读；构建完成后可被多个线程并发查询。
// - Id 重复时以文档顺序中的第一个为准，后续重复项被忽略并报告给诊断 sink。
class RelationshipTable
{
  public:
    enum class TargetMode
    {
        Internal,
        External
    };

    struct Entry
    {
        QString id;
        QString type;
        QString target;
        TargetMode targetMode = TargetMode::Internal;

        bool isExternal() const { return targetMode == TargetMode::External; }
    };

    // Parse a relationship part. Malformed XML, a root other than <Relationships> or a
    // <Relationship> without Id/Target fails with RelationshipParseError and leaves
    // table empty.
    static bool parse(const QByteArray &xml, RelationshipTable *table, DocResError *error = nullptr,
                      DiagnosticsSink *diagnostics = nullptr);

    // Fails with RelationshipNotFound when id is absent.
    bool resolve(const QString &id, QString *target, DocResError *error = nullptr) const;

    const Entry *find(const QString &id) const;
    bool contains(const QString &id) const { return m_index.contains(id); }
    QVector<Entry> entriesOfType(const QString &type) const;
    const QVector<Entry> &entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

  private:
    QVector<Entry> m_entries;     // document order, duplicates removed
    QHash<QString, int> m_index;  // id -> position in m_entries
};

namespace docx
{
// Read word/_rels/document.xml.rels from the container and parse it. Archive errors
// (ContainerUnreadable / EntryNotFound) propagate unchanged.
bool loadRelationships(const QString &archivePath, RelationshipTable *table, DocResError *error = nullptr,
                       DiagnosticsSink *diagnostics = nullptr);

// Load the table and resolve a single hyperlink id in one call.
bool resolveHyperlink(const QString &archivePath, const QString &id, QString *target,
                      DocResError *error = nullptr, DiagnosticsSink *diagnostics = nullptr);
} // namespace docx

#endif // RELATIONSHIP_TABLE_H
