#include "resource_tracer.h"

#include <QDebug>
#include <QMutexLocker>

namespace
{
QMutex g_logMutex;

QString severityLabel(TraceSeverity severity)
{
    switch (severity)
    {
    case TraceSeverity::Info: return QStringLiteral("info");
    case TraceSeverity::Warning: return QStringLiteral("warn");
    case TraceSeverity::Error: return QStringLiteral("error");
    }
    return QStringLiteral("unknown");
}
} // namespace

QString traceChannelLabel(TraceChannel channel)
{
    switch (channel)
    {
    case TraceChannel::Archive: return QStringLiteral("archive");
    case TraceChannel::Relationship: return QStringLiteral("rels");
    case TraceChannel::Font: return QStringLiteral("font");
    case TraceChannel::Color: return QStringLiteral("color");
    case TraceChannel::Config: return QStringLiteral("config");
    }
    return QStringLiteral("unknown");
}

QString ResourceTracer::formatLine(TraceChannel channel, const QString &message)
{
    return QStringLiteral("[docres][%1] %2").arg(traceChannelLabel(channel), message);
}

void ResourceTracer::log(TraceChannel channel, TraceSeverity severity, const QString &message)
{
    const QString line = formatLine(channel, message);
    QMutexLocker locker(&g_logMutex);
    switch (severity)
    {
    case TraceSeverity::Info:
        qInfo().noquote() << line;
        break;
    case TraceSeverity::Warning:
        qWarning().noquote() << line;
        break;
    case TraceSeverity::Error:
        qCritical().noquote() << line;
        break;
    }
}

void LoggingDiagnosticsSink::report(TraceChannel channel, TraceSeverity severity, const QString &message)
{
    if (severity == TraceSeverity::Info && !verbose_) return;
    ResourceTracer::log(channel, severity, message);
}

void CollectingDiagnosticsSink::report(TraceChannel channel, TraceSeverity severity, const QString &message)
{
    QMutexLocker locker(&mutex_);
    lines_.append(QStringLiteral("%1 %2").arg(severityLabel(severity), ResourceTracer::formatLine(channel, message)));
    severities_.append(severity);
}

QStringList CollectingDiagnosticsSink::lines() const
{
    QMutexLocker locker(&mutex_);
    return lines_;
}

int CollectingDiagnosticsSink::count(TraceSeverity severity) const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(severities_.count(severity));
}

void CollectingDiagnosticsSink::clear()
{
    QMutexLocker locker(&mutex_);
    lines_.clear();
    severities_.clear();
}
