#ifndef SVGPLOT_H
#define SVGPLOT_H

#include <QByteArray>
#include <QList>
#include <QString>

#include "pathTypes.h"
#include "canonicalCodec.h"
#include "svgWriter.h"
#include "curveFlattener.h"
#include "occluderSet.h"
#include "occlusionEngine.h"
#include "pathPolisher.h"
#include "svgParser.h"

// Pipeline facade: SVG -> canonical stream (generate) and canonical stream -> SVG (render).
class SvgPlot {
public:
    struct Configuration {
        double curveTolerance = 0.01;       // arc -> cubic deviation
        double sampleTolerance = 0.01;      // chord deviation of occlusion samples
        double maxSampleSpacing = 1.0;
        double sampleSpacingFraction = 0.01;    // of the viewbox diagonal, caps maxSampleSpacing
        int maxCurveSamples = 1024;
        bool autocut = false;
        Geometry::OccluderSet::FillRulePolicy fillRule = Geometry::OccluderSet::NonZeroRule;
        Geometry::OcclusionEngine::CutPolicy cutPolicy = Geometry::OcclusionEngine::ParametricSubdivision;
        int cutRefinementSteps = 24;
        double clipperScale = 1000000.0;
        bool polish = false;
        double minLength = -1.0;            // < 0: minLengthFraction of the viewbox diagonal
        double minLengthFraction = 0.002;
        SvgParser::StrokeSelection strokeSelection = SvgParser::AllShapes;
        int threads = 0;                    // 0: QThread::idealThreadCount()
    };

    SvgPlot();
    explicit SvgPlot(const Configuration& config);

    void setConfiguration(const Configuration& config);
    Configuration getConfiguration() const;

    // Reads the [Configuration] group of an INI file over config. Keys missing
    // from the file keep their current value.
    static bool loadConfiguration(const QString& iniPath, Configuration* config, QString* errorMessage = nullptr);

    static bool parseFillRule(const QString& name, Geometry::OccluderSet::FillRulePolicy* policy);
    static bool parseCutPolicy(const QString& name, Geometry::OcclusionEngine::CutPolicy* policy);
    static bool parseStrokeSelection(const QString& name, SvgParser::StrokeSelection* selection);

    Geometry::CurveFlattener::Config flattenerConfig() const;
    Geometry::OccluderSet::Config occluderConfig() const;
    Geometry::OcclusionEngine::Config occlusionConfig() const;
    Geometry::PathPolisher::Config polisherConfig() const;
    SvgParser::Config parserConfig() const;

    // Visible subpaths of the document in paint order, after the optional autocut and polish passes.
    QList<Core::Path> process(const Core::Document& document) const;
    Codec::CanonicalStream toCanonical(const Core::Document& document) const;

    bool generate(const QByteArray& svgData, Codec::CanonicalStream* stream, QString* errorMessage = nullptr) const;
    bool generateFile(const QString& inputPath, const QString& outputPath, QString* errorMessage = nullptr) const;

    static bool render(const QByteArray& canonicalData, const Codec::SvgWriter::StrokeOptions& options,
                       QString* svg, QString* errorMessage = nullptr);
    static bool renderFile(const QString& inputPath, const QString& outputPath,
                           const Codec::SvgWriter::StrokeOptions& options, QString* errorMessage = nullptr);

private:
    Configuration currentConfig_;
};

#endif // SVGPLOT_H
