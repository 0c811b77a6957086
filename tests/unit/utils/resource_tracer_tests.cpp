#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "utils/resource_tracer.h"

TEST_CASE("channel labels stay stable")
{
    CHECK(traceChannelLabel(TraceChannel::Archive) == QStringLiteral("archive"));
    CHECK(traceChannelLabel(TraceChannel::Relationship) == QStringLiteral("rels"));
    CHECK(traceChannelLabel(TraceChannel::Font) == QStringLiteral("font"));
    CHECK(traceChannelLabel(TraceChannel::Color) == QStringLiteral("color"));
    CHECK(traceChannelLabel(TraceChannel::Config) == QStringLiteral("config"));
}

TEST_CASE("formatLine prefixes project and channel")
{
    CHECK(ResourceTracer::formatLine(TraceChannel::Font, QStringLiteral("using Helvetica")) ==
          QStringLiteral("[docres][font] using Helvetica"));
}

TEST_CASE("collecting sink records severity and formatted line")
{
    CollectingDiagnosticsSink sink;
    reportTo(&sink, TraceChannel::Archive, TraceSeverity::Info, QStringLiteral("opened"));
    reportTo(&sink, TraceChannel::Color, TraceSeverity::Warning, QStringLiteral("unrecognized color `X`"));
    reportTo(nullptr, TraceChannel::Color, TraceSeverity::Error, QStringLiteral("dropped"));

    REQUIRE(sink.lines().size() == 2);
    CHECK(sink.lines().at(0) == QStringLiteral("info [docres][archive] opened"));
    CHECK(sink.lines().at(1) == QStringLiteral("warn [docres][color] unrecognized color `X`"));
    CHECK(sink.count(TraceSeverity::Warning) == 1);
    CHECK(sink.count(TraceSeverity::Error) == 0);

    sink.clear();
    CHECK(sink.lines().isEmpty());
}

TEST_CASE("logging sink forwards without throwing")
{
    LoggingDiagnosticsSink quiet;
    quiet.report(TraceChannel::Relationship, TraceSeverity::Info, QStringLiteral("parsed 3 relationships"));
    quiet.report(TraceChannel::Relationship, TraceSeverity::Warning, QStringLiteral("duplicate id"));

    LoggingDiagnosticsSink verbose(true);
    verbose.report(TraceChannel::Config, TraceSeverity::Info, QStringLiteral("unknown key ignored: x"));
    CHECK(true);
}
