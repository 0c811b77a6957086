#ifndef RESOURCE_TRACER_H
#define RESOURCE_TRACER_H

#include <QMutex>
#include <QString>
#include <QStringList>

enum class TraceChannel
{
    Archive,
    Relationship,
    Font,
    Color,
    Config
};

enum class TraceSeverity
{
    Info,
    Warning,
    Error
};

QString traceChannelLabel(TraceChannel channel);

class ResourceTracer
{
  public:
    // Format a unified resource log line: "[docres][<channel>] message".
    static QString formatLine(TraceChannel channel, const QString &message);
    // Print the line through Qt logging at the level matching severity.
    static void log(TraceChannel channel, TraceSeverity severity, const QString &message);
};

// 诊断旁路：解析逻辑只向注入的 sink 报告，不直接调用全局日志。
class DiagnosticsSink
{
  public:
    virtual ~DiagnosticsSink() = default;
    virtual void report(TraceChannel channel, TraceSeverity severity, const QString &message) = 0;
};

// Forwards to ResourceTracer. Info lines are dropped unless verbose.
class LoggingDiagnosticsSink : public DiagnosticsSink
{
  public:
    explicit LoggingDiagnosticsSink(bool verbose = false) : verbose_(verbose) {}
    void report(TraceChannel channel, TraceSeverity severity, const QString &message) override;

  private:
    bool verbose_;
};

// Keeps formatted lines in memory; used by tests and by callers that batch warnings.
class CollectingDiagnosticsSink : public DiagnosticsSink
{
  public:
    void report(TraceChannel channel, TraceSeverity severity, const QString &message) override;

    QStringList lines() const;
    int count(TraceSeverity severity) const;
    void clear();

  private:
    mutable QMutex mutex_;
    QStringList lines_;
    QList<TraceSeverity> severities_;
};

// Null-safe helper used by the resolvers.
inline void reportTo(DiagnosticsSink *sink, TraceChannel channel, TraceSeverity severity, const QString &message)
{
    if (sink) sink->report(channel, severity, message);
}

#endif // RESOURCE_TRACER_H
