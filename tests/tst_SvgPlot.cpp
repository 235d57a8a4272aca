#include "tst_SvgPlot.h"

#include "svgPlot.h"

#include <QDomDocument>
#include <QFile>
#include <QTemporaryDir>
#include <cmath>

using Core::SourceSegment;

namespace {

const char* const kRectangleSvg =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 720 480\">"
    "<rect x=\"0\" y=\"0\" width=\"100\" height=\"70\"/>"
    "</svg>";

const char* const kRectangleStream = "720 480 5 8\nMLLLZ\n0 0 100 0 100 70 0 70\n";

bool near(const QPointF& a, const QPointF& b, double eps = 1e-3) {
    return std::abs(a.x() - b.x()) <= eps && std::abs(a.y() - b.y()) <= eps;
}

bool writeFile(const QString& path, const QByteArray& data) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return false;
    return file.write(data) == data.size();
}

QByteArray readFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QByteArray();
    return file.readAll();
}

} // namespace

void TestSvgPlot::testParseTransform() {
    const QTransform chained = SvgParser::parseTransform("translate(10,20) scale(2)");
    QVERIFY(near(chained.map(QPointF(1, 1)), QPointF(12, 22), 1e-12));

    const QTransform pivot = SvgParser::parseTransform("rotate(90, 10, 10)");
    QVERIFY(near(pivot.map(QPointF(20, 10)), QPointF(10, 20), 1e-9));

    const QTransform matrix = SvgParser::parseTransform("matrix(1 0 0 1 5 -5)");
    QVERIFY(near(matrix.map(QPointF(0, 0)), QPointF(5, -5), 1e-12));

    const QTransform uniform = SvgParser::parseTransform("scale(3)");
    QVERIFY(near(uniform.map(QPointF(1, 2)), QPointF(3, 6), 1e-12));

    QVERIFY(SvgParser::parseTransform("").isIdentity());
}

void TestSvgPlot::testParseLength_data() {
    QTest::addColumn<QString>("text");
    QTest::addColumn<double>("expected");
    QTest::addColumn<bool>("valid");

    QTest::newRow("plain") << "12" << 12.0 << true;
    QTest::newRow("px") << "12px" << 12.0 << true;
    QTest::newRow("inch") << "1in" << 96.0 << true;
    QTest::newRow("millimeter") << "25.4mm" << 96.0 << true;
    QTest::newRow("point") << "72pt" << 96.0 << true;
    QTest::newRow("garbage") << "wide" << 0.0 << false;
}

void TestSvgPlot::testParseLength() {
    QFETCH(QString, text);
    QFETCH(double, expected);
    QFETCH(bool, valid);

    bool ok = false;
    const double value = SvgParser::parseLength(text, 96.0, &ok);
    QCOMPARE(ok, valid);
    if (valid) QVERIFY(std::abs(value - expected) < 1e-9);
}

void TestSvgPlot::testParsePathData() {
    QVector<SourceSegment> segments;
    QVERIFY(SvgParser::parsePathData("M10 20 l5 5 h10 v-5 z l5 5", &segments));
    QCOMPARE(segments.size(), 6);
    QCOMPARE(segments.at(0).type, SourceSegment::MoveTo);
    QCOMPARE(segments.at(1).points[0], QPointF(15, 25));
    QCOMPARE(segments.at(2).points[0], QPointF(25, 25));
    QCOMPARE(segments.at(3).points[0], QPointF(25, 20));
    QCOMPARE(segments.at(4).type, SourceSegment::ClosePath);
    // Relative commands after a close start from the subpath start.
    QCOMPARE(segments.at(5).points[0], QPointF(15, 25));

    // Extra pairs after a move are implicit lines.
    segments.clear();
    QVERIFY(SvgParser::parsePathData("m5 5 1 1 M0 0 10 0", &segments));
    QCOMPARE(segments.size(), 4);
    QCOMPARE(segments.at(1).type, SourceSegment::LineTo);
    QCOMPARE(segments.at(1).points[0], QPointF(6, 6));
    QCOMPARE(segments.at(3).points[0], QPointF(10, 0));

    // Smooth cubic reflects the previous control point.
    segments.clear();
    QVERIFY(SvgParser::parsePathData("M0 0 C10 0 20 10 30 10 S50 20 60 20", &segments));
    QCOMPARE(segments.at(2).type, SourceSegment::CubicTo);
    QCOMPARE(segments.at(2).points[0], QPointF(40, 10));
    QCOMPARE(segments.at(2).points[2], QPointF(60, 20));

    // Smooth quadratic reflects the previous quadratic control point.
    segments.clear();
    QVERIFY(SvgParser::parsePathData("M0 0 Q10 10 20 0 T40 0", &segments));
    QCOMPARE(segments.at(2).type, SourceSegment::QuadTo);
    QCOMPARE(segments.at(2).points[0], QPointF(30, -10));

    // Arc flags written without separators.
    segments.clear();
    QVERIFY(SvgParser::parsePathData("M0 0a10 10 0 1110 10", &segments));
    QCOMPARE(segments.size(), 2);
    QCOMPARE(segments.at(1).type, SourceSegment::ArcTo);
    QVERIFY(segments.at(1).arc.largeArc);
    QVERIFY(segments.at(1).arc.sweep);
    QCOMPARE(segments.at(1).points[0], QPointF(10, 10));

    // Compact numbers.
    segments.clear();
    QVERIFY(SvgParser::parsePathData("M.5.5L-1-2 1e1,2E-1", &segments));
    QCOMPARE(segments.at(0).points[0], QPointF(0.5, 0.5));
    QCOMPARE(segments.at(1).points[0], QPointF(-1, -2));
    QCOMPARE(segments.at(2).points[0], QPointF(10, 0.2));
}

void TestSvgPlot::testParsePathDataErrors_data() {
    QTest::addColumn<QString>("data");
    QTest::addColumn<int>("segmentsKept");

    QTest::newRow("no_leading_move") << "L10 10" << 0;
    QTest::newRow("number_first") << "10 10" << 0;
    QTest::newRow("missing_coordinate") << "M0 0 L10" << 1;
    QTest::newRow("unknown_command") << "M0 0 L1 1 X5" << 2;
    QTest::newRow("number_after_close") << "M0 0 L1 1 Z 4" << 3;
    QTest::newRow("bad_arc_flag") << "M0 0 A5 5 0 2 1 10 10" << 1;
}

void TestSvgPlot::testParsePathDataErrors() {
    QFETCH(QString, data);
    QFETCH(int, segmentsKept);

    QVector<SourceSegment> segments;
    QString error;
    QVERIFY(!SvgParser::parsePathData(data, &segments, &error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(segments.size(), segmentsKept);
}

void TestSvgPlot::testLoadDocument() {
    const QByteArray svg =
        "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"10 20 720 480\">"
        "<defs><rect id=\"template\" width=\"10\" height=\"10\"/></defs>"
        "<rect id=\"r1\" x=\"10\" y=\"20\" width=\"100\" height=\"70\" fill=\"none\" stroke=\"black\"/>"
        "<g transform=\"translate(5,0)\" style=\"fill-rule:evenodd\">"
        "  <circle id=\"c1\" cx=\"50\" cy=\"50\" r=\"10\" transform=\"scale(2)\"/>"
        "  <rect id=\"gone\" width=\"5\" height=\"5\" style=\"display:none\"/>"
        "  <rect id=\"invisible\" width=\"5\" height=\"5\" visibility=\"hidden\"/>"
        "  <rect id=\"faded\" width=\"5\" height=\"5\" opacity=\"0\"/>"
        "</g>"
        "<line x1=\"0\" y1=\"0\" x2=\"10\" y2=\"10\" stroke=\"red\"/>"
        "<text>ignored</text>"
        "</svg>";

    SvgParser parser;
    Core::Document document;
    QString error;
    QVERIFY2(parser.load(svg, &document, &error), qPrintable(error));
    QCOMPARE(document.width, 720.0);
    QCOMPARE(document.height, 480.0);
    QCOMPARE(document.shapes.size(), 3);

    const Geometry::CurveFlattener flattener;

    const Core::Shape& rect = document.shapes.at(0);
    QCOMPARE(rect.id, QString("r1"));
    QCOMPARE(rect.zIndex, 0);
    QVERIFY(!rect.hasFill);
    QVERIFY(rect.strokeSelected);
    QCOMPARE(flattener.flatten(rect.outline).startPoint(), QPointF(0, 0));

    // Circle: scale(2) then the group translate then the viewBox origin.
    const Core::Shape& circle = document.shapes.at(1);
    QCOMPARE(circle.id, QString("c1"));
    QCOMPARE(circle.zIndex, 1);
    QVERIFY(circle.hasFill);
    QCOMPARE(circle.fillRule, Qt::OddEvenFill);
    QVERIFY(near(flattener.flatten(circle.outline).startPoint(), QPointF(115, 80), 1e-9));

    const Core::Shape& line = document.shapes.at(2);
    QCOMPARE(line.id, QString("line_0"));
    QCOMPARE(line.zIndex, 2);
    QCOMPARE(flattener.flatten(line.outline).tags(), QString("ML"));
}

void TestSvgPlot::testLoadStrokeSelection() {
    const QByteArray svg =
        "<svg viewBox=\"0 0 100 100\">"
        "<rect id=\"filled\" width=\"10\" height=\"10\"/>"
        "<rect id=\"stroked\" width=\"10\" height=\"10\" style=\"stroke: #ff0000\"/>"
        "<g stroke=\"blue\"><rect id=\"inherited\" width=\"10\" height=\"10\"/></g>"
        "</svg>";

    SvgParser parser;
    SvgParser::Config config;
    config.strokeSelection = SvgParser::StrokedShapes;
    parser.setConfig(config);

    Core::Document document;
    QVERIFY(parser.load(svg, &document));
    QCOMPARE(document.shapes.size(), 3);
    QVERIFY(!document.shapes.at(0).strokeSelected);
    QVERIFY(document.shapes.at(1).strokeSelected);
    QVERIFY(document.shapes.at(2).strokeSelected);

    SvgParser all;
    QVERIFY(all.load(svg, &document));
    for (const Core::Shape& shape : document.shapes) QVERIFY(shape.strokeSelected);
}

void TestSvgPlot::testLoadDimensions() {
    SvgParser parser;
    Core::Document document;

    QVERIFY(parser.load("<svg width=\"2in\" height=\"96\"><rect width=\"1\" height=\"1\"/></svg>", &document));
    QCOMPARE(document.width, 192.0);
    QCOMPARE(document.height, 96.0);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("no usable viewBox"));
    QVERIFY(parser.load("<svg><rect width=\"1\" height=\"1\"/></svg>", &document));
    QCOMPARE(document.width, 100.0);
    QCOMPARE(document.height, 100.0);

    // Shapes with broken path data keep the segments read before the error.
    QVERIFY(parser.load("<svg viewBox=\"0 0 50 50\"><path d=\"M0 0 L10 10 L20\"/></svg>", &document));
    QCOMPARE(document.shapes.size(), 1);
    QCOMPARE(Geometry::CurveFlattener().flatten(document.shapes.first().outline).tags(), QString("ML"));
}

void TestSvgPlot::testLoadRejectsBadXml() {
    SvgParser parser;
    Core::Document document;
    QString error;
    QVERIFY(!parser.load("<svg><rect></svg>", &document, &error));
    QVERIFY(!error.isEmpty());

    error.clear();
    QVERIFY(!parser.load("<html><body/></html>", &document, &error));
    QVERIFY(error.contains("html"));
}

void TestSvgPlot::testViewportTransform() {
    QDomDocument doc;
    QVERIFY(doc.setContent(QByteArray("<svg x=\"10\" y=\"20\" width=\"100\" height=\"50\" viewBox=\"0 0 10 10\""
                                      " preserveAspectRatio=\"xMinYMax slice\"/>")));
    const QTransform slice = SvgParser::viewportTransform(doc.documentElement(), 96.0);
    QVERIFY(near(slice.map(QPointF(0, 0)), QPointF(10, -30), 1e-9));
    QVERIFY(near(slice.map(QPointF(10, 10)), QPointF(110, 70), 1e-9));

    QVERIFY(doc.setContent(QByteArray("<svg x=\"3\" viewBox=\"5 5 10 10\" width=\"50%\"/>")));
    const QTransform unscaled = SvgParser::viewportTransform(doc.documentElement(), 96.0);
    QVERIFY(near(unscaled.map(QPointF(5, 5)), QPointF(3, 0), 1e-9));
    QVERIFY(near(unscaled.map(QPointF(15, 15)), QPointF(13, 10), 1e-9));

    QRectF viewBox;
    QVERIFY(SvgParser::parseViewBox("0,0 720 480", &viewBox));
    QCOMPARE(viewBox, QRectF(0, 0, 720, 480));
    QVERIFY(!SvgParser::parseViewBox("0 0 0 480", &viewBox));
    QVERIFY(!SvgParser::parseViewBox("0 0 720", &viewBox));
}

void TestSvgPlot::testLoadNestedSvg() {
    const QByteArray svg =
        "<svg viewBox=\"0 0 200 200\">"
        "<svg x=\"10\" y=\"20\" width=\"100\" height=\"50\" viewBox=\"0 0 10 10\">"
        "<rect id=\"fitted\" width=\"10\" height=\"10\"/></svg>"
        "<svg x=\"10\" y=\"20\" width=\"100\" height=\"50\" viewBox=\"0 0 10 10\" preserveAspectRatio=\"none\">"
        "<rect id=\"stretched\" width=\"10\" height=\"10\"/></svg>"
        "<svg x=\"5\" y=\"5\"><rect id=\"shifted\" x=\"1\" y=\"1\" width=\"2\" height=\"2\"/></svg>"
        "</svg>";

    SvgParser parser;
    Core::Document document;
    QVERIFY(parser.load(svg, &document));
    QCOMPARE(document.width, 200.0);
    QCOMPARE(document.shapes.size(), 3);

    const Geometry::CurveFlattener flattener;
    // 10 x 10 fitted into 100 x 50: uniform scale 5, centered horizontally.
    const Core::Path fitted = flattener.flatten(document.shapes.at(0).outline);
    QCOMPARE(fitted.tags(), QString("MLLLZ"));
    QVERIFY(near(fitted.commands.at(0).points[0], QPointF(35, 20)));
    QVERIFY(near(fitted.commands.at(2).points[0], QPointF(85, 70)));

    const Core::Path stretched = flattener.flatten(document.shapes.at(1).outline);
    QVERIFY(near(stretched.commands.at(0).points[0], QPointF(10, 20)));
    QVERIFY(near(stretched.commands.at(2).points[0], QPointF(110, 70)));

    const Core::Path shifted = flattener.flatten(document.shapes.at(2).outline);
    QVERIFY(near(shifted.commands.at(0).points[0], QPointF(6, 6)));
    QVERIFY(near(shifted.commands.at(2).points[0], QPointF(8, 8)));
}

void TestSvgPlot::testSvgWriterOutput() {
    Codec::CanonicalStream stream;
    QVERIFY(Codec::CanonicalCodec::decode(kRectangleStream, &stream));
    stream.commands.moveTo(QPointF(1.5, 2));
    stream.commands.cubicTo(QPointF(3, 4), QPointF(5, 6), QPointF(7, 8));

    Codec::SvgWriter::StrokeOptions options;
    options.color = "red&blue";
    options.width = 0.5;
    const QString svg = Codec::SvgWriter::toSvg(stream, options);

    QVERIFY(svg.startsWith("<?xml"));
    QVERIFY(svg.contains("viewBox=\"0 0 720 480\""));
    QVERIFY(svg.contains("<path d=\"M0 0 L100 0 L100 70 L0 70 Z\" fill=\"none\" stroke=\"red&amp;blue\" stroke-width=\"0.5\"/>"));
    QVERIFY(svg.contains("<path d=\"M1.5 2 C3 4 5 6 7 8\""));
    QCOMPARE(svg.count("<path "), 2);

    // The rendered document parses back to the same outlines.
    SvgParser parser;
    Core::Document document;
    QVERIFY(parser.load(svg.toUtf8(), &document));
    QCOMPARE(document.shapes.size(), 2);
}

void TestSvgPlot::testGenerateRectangleExample() {
    const SvgPlot plot;
    Codec::CanonicalStream stream;
    QString error;
    QVERIFY2(plot.generate(kRectangleSvg, &stream, &error), qPrintable(error));
    QCOMPARE(Codec::CanonicalCodec::encode(stream), QByteArray(kRectangleStream));
}

void TestSvgPlot::testGenerateWithAutocut() {
    const QByteArray svg =
        "<svg viewBox=\"0 0 720 480\">"
        "<rect id=\"a\" x=\"0\" y=\"0\" width=\"100\" height=\"100\" fill=\"none\"/>"
        "<rect id=\"b\" x=\"50.5\" y=\"-10.5\" width=\"100\" height=\"50\"/>"
        "</svg>";

    SvgPlot::Configuration config;
    SvgPlot plain(config);
    Codec::CanonicalStream stream;
    QVERIFY(plain.generate(svg, &stream));
    QCOMPARE(stream.tags(), QString("MLLLZMLLLZ"));

    config.autocut = true;
    SvgPlot cutting(config);
    QVERIFY(cutting.generate(svg, &stream));

    // The top-right corner of "a" is hidden by "b"; the visible run wraps through the start corner.
    QCOMPARE(stream.tags(), QString("MLLLLMLLLZ"));
    const QVector<Core::PathCommand>& cmds = stream.commands.commands;
    QVERIFY(near(cmds.at(0).points[0], QPointF(100, 39.5)));
    QCOMPARE(cmds.at(1).points[0], QPointF(100, 100));
    QCOMPARE(cmds.at(2).points[0], QPointF(0, 100));
    QCOMPARE(cmds.at(3).points[0], QPointF(0, 0));
    QVERIFY(near(cmds.at(4).points[0], QPointF(50.5, 0)));
    QCOMPARE(cmds.at(5).points[0], QPointF(50.5, -10.5));

    // Single-threaded processing produces the same stream.
    config.threads = 1;
    Codec::CanonicalStream sequential;
    QVERIFY(SvgPlot(config).generate(svg, &sequential));
    QCOMPARE(Codec::CanonicalCodec::encode(sequential), Codec::CanonicalCodec::encode(stream));
}

void TestSvgPlot::testGenerateAutocutSmallViewbox() {
    const QByteArray svg =
        "<svg viewBox=\"0 0 1 1\">"
        "<path id=\"line\" d=\"M0 0.5 L1 0.5\" fill=\"none\"/>"
        "<rect id=\"band\" x=\"0.4\" y=\"0\" width=\"0.2\" height=\"1\"/>"
        "</svg>";

    SvgPlot::Configuration config;
    config.autocut = true;
    Codec::CanonicalStream stream;
    QVERIFY(SvgPlot(config).generate(svg, &stream));
    QCOMPARE(stream.tags(), QString("MLMLMLLLZ"));
    const QVector<Core::PathCommand>& cmds = stream.commands.commands;
    QVERIFY(near(cmds.at(1).points[0], QPointF(0.4, 0.5), 1e-4));
    QVERIFY(near(cmds.at(2).points[0], QPointF(0.6, 0.5), 1e-4));

    // Absolute spacing only: the line is one edge with both ends visible.
    config.sampleSpacingFraction = 0.0;
    QVERIFY(SvgPlot(config).generate(svg, &stream));
    QCOMPARE(stream.tags(), QString("MLMLLLZ"));
}

void TestSvgPlot::testGenerateWithPolish() {
    const QByteArray svg =
        "<svg viewBox=\"0 0 720 480\">"
        "<rect x=\"0\" y=\"0\" width=\"100\" height=\"70\"/>"
        "<path d=\"M200 200 L200.5 200\"/>"
        "</svg>";

    SvgPlot::Configuration config;
    Codec::CanonicalStream stream;
    QVERIFY(SvgPlot(config).generate(svg, &stream));
    QCOMPARE(stream.tags(), QString("MLLLZML"));

    // Default threshold is 0.2% of the 865 unit diagonal.
    config.polish = true;
    QVERIFY(SvgPlot(config).generate(svg, &stream));
    QCOMPARE(stream.tags(), QString("MLLLZ"));

    config.minLength = 0.0;
    QVERIFY(SvgPlot(config).generate(svg, &stream));
    QCOMPARE(stream.tags(), QString("MLLLZML"));

    config.minLength = 1000.0;
    QVERIFY(SvgPlot(config).generate(svg, &stream));
    QVERIFY(stream.commands.isEmpty());
    QCOMPARE(Codec::CanonicalCodec::encode(stream), QByteArray("720 480 0 0\n\n\n"));
}

void TestSvgPlot::testLoadConfiguration() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString iniPath = dir.filePath("svgplot.ini");
    QVERIFY(writeFile(iniPath,
                      "[Configuration]\n"
                      "autocut=true\n"
                      "fillRule=evenodd\n"
                      "cutPolicy=sample\n"
                      "strokeSelection=stroked\n"
                      "curveTolerance=0.05\n"
                      "threads=2\n"
                      "sampleSpacingFraction=0.05\n"
                      "minLength=abc\n"));

    SvgPlot::Configuration config;
    QString error;
    QVERIFY2(SvgPlot::loadConfiguration(iniPath, &config, &error), qPrintable(error));
    QVERIFY(config.autocut);
    QCOMPARE(config.fillRule, Geometry::OccluderSet::EvenOddRule);
    QCOMPARE(config.cutPolicy, Geometry::OcclusionEngine::NearestSample);
    QCOMPARE(config.strokeSelection, SvgParser::StrokedShapes);
    QCOMPARE(config.curveTolerance, 0.05);
    QCOMPARE(config.threads, 2);
    QCOMPARE(config.sampleSpacingFraction, 0.05);
    // Malformed and missing keys keep their defaults.
    QCOMPARE(config.minLength, -1.0);
    QCOMPARE(config.maxSampleSpacing, 1.0);
    QVERIFY(!config.polish);

    SvgPlot plot;
    plot.setConfiguration(config);
    QCOMPARE(plot.occlusionConfig().cutPolicy, Geometry::OcclusionEngine::NearestSample);
    QCOMPARE(plot.occluderConfig().fillRule, Geometry::OccluderSet::EvenOddRule);
    QCOMPARE(plot.flattenerConfig().tolerance, 0.05);
    QCOMPARE(plot.occlusionConfig().sampleSpacingFraction, 0.05);

    QVERIFY(!SvgPlot::loadConfiguration(dir.filePath("missing.ini"), &config, &error));
    QVERIFY(error.contains("missing.ini"));

    Geometry::OccluderSet::FillRulePolicy policy;
    QVERIFY(!SvgPlot::parseFillRule("winding", &policy));
    QVERIFY(SvgPlot::parseFillRule(" NonZero ", &policy));
    QCOMPARE(policy, Geometry::OccluderSet::NonZeroRule);
}

void TestSvgPlot::testRenderReportsFormatError() {
    QString svg;
    QString error;
    QVERIFY(!SvgPlot::render("720 480 5\nMLLLZ\n0 0 100 0 100 70 0 70\n", Codec::SvgWriter::StrokeOptions(), &svg, &error));
    QVERIFY2(error.startsWith("header:"), qPrintable(error));
    QVERIFY(svg.isEmpty());

    QVERIFY(!SvgPlot::render("720 480 5 8\nMLLLZ\n0 0 100 0 100 70 0 nan\n", Codec::SvgWriter::StrokeOptions(), &svg, &error));
    QVERIFY2(error.startsWith("coordinates:"), qPrintable(error));

    QVERIFY(SvgPlot::render(kRectangleStream, Codec::SvgWriter::StrokeOptions(), &svg, &error));
    QVERIFY(svg.contains("stroke=\"#000000\" stroke-width=\"1\""));
}

void TestSvgPlot::testFileRoundTrip() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString input = dir.filePath("in.svg");
    const QString canonical = dir.filePath("out.txt");
    const QString rendered = dir.filePath("out.svg");
    QVERIFY(writeFile(input, kRectangleSvg));

    const SvgPlot plot;
    QString error;
    QVERIFY2(plot.generateFile(input, canonical, &error), qPrintable(error));
    QCOMPARE(readFile(canonical), QByteArray(kRectangleStream));

    QVERIFY2(SvgPlot::renderFile(canonical, rendered, Codec::SvgWriter::StrokeOptions(), &error), qPrintable(error));
    QVERIFY(readFile(rendered).contains("d=\"M0 0 L100 0 L100 70 L0 70 Z\""));

    QVERIFY(!plot.generateFile(dir.filePath("absent.svg"), canonical, &error));
    QVERIFY(error.contains("absent.svg"));
    // A failed run leaves the previous output in place.
    QCOMPARE(readFile(canonical), QByteArray(kRectangleStream));
}

QTEST_GUILESS_MAIN(TestSvgPlot)
