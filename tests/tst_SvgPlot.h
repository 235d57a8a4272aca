#ifndef TST_SVGPLOT_H
#define TST_SVGPLOT_H

#include <QObject>
#include <QtTest/QtTest>

class TestSvgPlot : public QObject {
    Q_OBJECT

private slots:
    // Parser
    void testParseTransform();
    void testParseLength_data();
    void testParseLength();
    void testParsePathData();
    void testParsePathDataErrors_data();
    void testParsePathDataErrors();
    void testLoadDocument();
    void testLoadStrokeSelection();
    void testLoadDimensions();
    void testLoadRejectsBadXml();
    void testViewportTransform();
    void testLoadNestedSvg();

    // Writer
    void testSvgWriterOutput();

    // Pipeline
    void testGenerateRectangleExample();
    void testGenerateWithAutocut();
    void testGenerateAutocutSmallViewbox();
    void testGenerateWithPolish();
    void testLoadConfiguration();
    void testRenderReportsFormatError();
    void testFileRoundTrip();
};

#endif // TST_SVGPLOT_H
