#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include "service/style/color_parser.h"
#include "utils/resource_tracer.h"

namespace
{
bool sameRgb(const QColor &color, int r, int g, int b)
{
    return color.isValid() && color.red() == r && color.green() == g && color.blue() == b;
}
} // namespace

TEST_CASE("auto renders as black and is case-sensitive")
{
    DocResError error;
    CHECK(sameRgb(style::parseColor(QStringLiteral("auto"), &error), 0, 0, 0));
    CHECK_FALSE(error.isError());

    CHECK_FALSE(style::parseColor(QStringLiteral("Auto"), &error).isValid());
    CHECK(error.code == DocResErrorCode::InvalidColorFormat);
    CHECK_FALSE(style::parseColor(QStringLiteral("AUTO"), &error).isValid());
    CHECK(error.code == DocResErrorCode::InvalidColorFormat);
}

TEST_CASE("six digit hex with and without the # prefix")
{
    DocResError error;
    CHECK(sameRgb(style::parseColor(QStringLiteral("#FF0000"), &error), 255, 0, 0));
    CHECK(sameRgb(style::parseColor(QStringLiteral("FF0000"), &error), 255, 0, 0));
    CHECK(sameRgb(style::parseColor(QStringLiteral("1f497d"), &error), 0x1f, 0x49, 0x7d));
    CHECK(sameRgb(style::parseColor(QStringLiteral("#000080"), &error), 0, 0, 128));
    CHECK_FALSE(error.isError());
}

TEST_CASE("three digit hex doubles each digit")
{
    CHECK(sameRgb(style::parseColor(QStringLiteral("#fff")), 255, 255, 255));
    CHECK(sameRgb(style::parseColor(QStringLiteral("f0a")), 0xff, 0x00, 0xaa));
    CHECK(sameRgb(style::parseColor(QStringLiteral("#123")), 0x11, 0x22, 0x33));
}

TEST_CASE("named colours come from a fixed case-sensitive table")
{
    CHECK(sameRgb(style::parseColor(QStringLiteral("red")), 255, 0, 0));
    CHECK(sameRgb(style::parseColor(QStringLiteral("RED")), 255, 0, 0));
    CHECK(sameRgb(style::parseColor(QStringLiteral("orange")), 255, 200, 0));
    CHECK(sameRgb(style::parseColor(QStringLiteral("DARK_GRAY")), 64, 64, 64));
    CHECK(sameRgb(style::parseColor(QStringLiteral("darkBlue")), 0, 0, 128));

    DocResError error;
    CHECK_FALSE(style::parseColor(QStringLiteral("Red"), &error).isValid());
    CHECK(error.code == DocResErrorCode::InvalidColorFormat);
    CHECK_FALSE(style::parseColor(QStringLiteral("aliceblue"), &error).isValid());

    // "bad" is a valid 3-digit hex token, not a name.
    CHECK(sameRgb(style::parseColor(QStringLiteral("bad")), 0xbb, 0xaa, 0xdd));

    CHECK(style::namedColorNames().contains(QStringLiteral("lightGray")));
    CHECK_FALSE(style::namedColor(QStringLiteral("none"), nullptr));
}

TEST_CASE("invalid tokens fail with InvalidColorFormat and are reported")
{
    CollectingDiagnosticsSink sink;
    const QStringList invalid = {QStringLiteral("not-a-color"), QString(), QStringLiteral("#"),
                                 QStringLiteral("#12"), QStringLiteral("#1234"), QStringLiteral("12345"),
                                 QStringLiteral("#GG0000"), QStringLiteral("##FF0000"), QStringLiteral(" FF0000"),
                                 QStringLiteral("FF00000"), QStringLiteral("FF0000\n")};
    for (const QString &token : invalid)
    {
        CAPTURE(token.toStdString());
        DocResError error;
        const QColor color = style::parseColor(token, &error, &sink);
        CHECK_FALSE(color.isValid());
        CHECK(error.code == DocResErrorCode::InvalidColorFormat);
        CHECK(error.message.contains(QStringLiteral("could not be recognized as a valid color")));
    }
    CHECK(sink.count(TraceSeverity::Warning) == invalid.size());
    CHECK(sink.lines().first().contains(QStringLiteral("unrecognized color `not-a-color`")));
}

TEST_CASE("a successful parse clears a previous error")
{
    DocResError error;
    style::parseColor(QStringLiteral("nope"), &error);
    REQUIRE(error.isError());
    style::parseColor(QStringLiteral("00FF00"), &error);
    CHECK_FALSE(error.isError());
}

TEST_CASE("colorToHex renders upper-case RRGGBB")
{
    CHECK(style::colorToHex(QColor(0x1f, 0x49, 0x7d)) == QStringLiteral("1F497D"));
    CHECK(style::colorToHex(QColor(0, 0, 0)) == QStringLiteral("000000"));
    CHECK(style::colorToHex(QColor()).isEmpty());
}
