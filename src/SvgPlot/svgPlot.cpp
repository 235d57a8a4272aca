#include "svgPlot.h"

#include <QDebug>          // For logging
#include <qnumeric.h>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QSettings>

namespace {

bool writeAtomically(const QString& path, const QByteArray& data, QString* errorMessage) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) *errorMessage = QStringLiteral("cannot open %1 for writing: %2").arg(path, file.errorString());
        return false;
    }
    if (file.write(data) != data.size() || !file.commit()) {
        if (errorMessage) *errorMessage = QStringLiteral("cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

bool readFile(const QString& path, QByteArray* data, QString* errorMessage) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) *errorMessage = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    *data = file.readAll();
    return true;
}

} // namespace

SvgPlot::SvgPlot() {
    qDebug() << "SvgPlot instance created.";
}

SvgPlot::SvgPlot(const Configuration& config) : currentConfig_(config) {
}

void SvgPlot::setConfiguration(const Configuration& config) {
    currentConfig_ = config;
    qDebug() << "SvgPlot configuration updated.";
}

SvgPlot::Configuration SvgPlot::getConfiguration() const {
    return currentConfig_;
}

bool SvgPlot::parseFillRule(const QString& name, Geometry::OccluderSet::FillRulePolicy* policy) {
    const QString n = name.trimmed().toLower();
    if (n == "nonzero") *policy = Geometry::OccluderSet::NonZeroRule;
    else if (n == "evenodd") *policy = Geometry::OccluderSet::EvenOddRule;
    else if (n == "shape") *policy = Geometry::OccluderSet::ShapeRule;
    else return false;
    return true;
}

bool SvgPlot::parseCutPolicy(const QString& name, Geometry::OcclusionEngine::CutPolicy* policy) {
    const QString n = name.trimmed().toLower();
    if (n == "parametric") *policy = Geometry::OcclusionEngine::ParametricSubdivision;
    else if (n == "sample") *policy = Geometry::OcclusionEngine::NearestSample;
    else return false;
    return true;
}

bool SvgPlot::parseStrokeSelection(const QString& name, SvgParser::StrokeSelection* selection) {
    const QString n = name.trimmed().toLower();
    if (n == "all") *selection = SvgParser::AllShapes;
    else if (n == "stroked") *selection = SvgParser::StrokedShapes;
    else return false;
    return true;
}

bool SvgPlot::loadConfiguration(const QString& iniPath, Configuration* config, QString* errorMessage) {
    if (!QFileInfo::exists(iniPath)) {
        if (errorMessage) *errorMessage = QStringLiteral("configuration file %1 does not exist").arg(iniPath);
        return false;
    }
    QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (errorMessage) *errorMessage = QStringLiteral("configuration file %1 is not a valid INI file").arg(iniPath);
        return false;
    }

    settings.beginGroup("Configuration");

    auto readDouble = [&settings](const char* key, double* target) {
        if (!settings.contains(key)) return;
        bool ok = false;
        const double v = settings.value(key).toDouble(&ok);
        if (ok && qIsFinite(v)) *target = v;
        else qWarning() << "SvgPlot: ignoring malformed value for" << key << settings.value(key);
    };
    auto readInt = [&settings](const char* key, int* target) {
        if (!settings.contains(key)) return;
        bool ok = false;
        const int v = settings.value(key).toInt(&ok);
        if (ok) *target = v;
        else qWarning() << "SvgPlot: ignoring malformed value for" << key << settings.value(key);
    };
    auto readBool = [&settings](const char* key, bool* target) {
        if (!settings.contains(key)) return;
        const QString v = settings.value(key).toString().trimmed().toLower();
        if (v == "true" || v == "1" || v == "yes" || v == "on") *target = true;
        else if (v == "false" || v == "0" || v == "no" || v == "off") *target = false;
        else qWarning() << "SvgPlot: ignoring malformed value for" << key << v;
    };

    readDouble("curveTolerance", &config->curveTolerance);
    readDouble("sampleTolerance", &config->sampleTolerance);
    readDouble("maxSampleSpacing", &config->maxSampleSpacing);
    readDouble("sampleSpacingFraction", &config->sampleSpacingFraction);
    readInt("maxCurveSamples", &config->maxCurveSamples);
    readBool("autocut", &config->autocut);
    readInt("cutRefinementSteps", &config->cutRefinementSteps);
    readDouble("clipperScale", &config->clipperScale);
    readBool("polish", &config->polish);
    readDouble("minLength", &config->minLength);
    readDouble("minLengthFraction", &config->minLengthFraction);
    readInt("threads", &config->threads);

    if (settings.contains("fillRule") && !parseFillRule(settings.value("fillRule").toString(), &config->fillRule))
        qWarning() << "SvgPlot: unknown fillRule" << settings.value("fillRule").toString();
    if (settings.contains("cutPolicy") && !parseCutPolicy(settings.value("cutPolicy").toString(), &config->cutPolicy))
        qWarning() << "SvgPlot: unknown cutPolicy" << settings.value("cutPolicy").toString();
    if (settings.contains("strokeSelection") && !parseStrokeSelection(settings.value("strokeSelection").toString(), &config->strokeSelection))
        qWarning() << "SvgPlot: unknown strokeSelection" << settings.value("strokeSelection").toString();

    settings.endGroup();
    qDebug() << "SvgPlot: configuration loaded from" << iniPath;
    return true;
}

Geometry::CurveFlattener::Config SvgPlot::flattenerConfig() const {
    Geometry::CurveFlattener::Config config;
    config.tolerance = currentConfig_.curveTolerance;
    return config;
}

Geometry::OccluderSet::Config SvgPlot::occluderConfig() const {
    Geometry::OccluderSet::Config config;
    config.fillRule = currentConfig_.fillRule;
    config.clipperScale = currentConfig_.clipperScale;
    config.sampleTolerance = currentConfig_.sampleTolerance;
    config.maxCurveSamples = currentConfig_.maxCurveSamples;
    return config;
}

Geometry::OcclusionEngine::Config SvgPlot::occlusionConfig() const {
    Geometry::OcclusionEngine::Config config;
    config.sampleTolerance = currentConfig_.sampleTolerance;
    config.maxSampleSpacing = currentConfig_.maxSampleSpacing;
    config.sampleSpacingFraction = currentConfig_.sampleSpacingFraction;
    config.maxCurveSamples = currentConfig_.maxCurveSamples;
    config.cutPolicy = currentConfig_.cutPolicy;
    config.refinementSteps = currentConfig_.cutRefinementSteps;
    config.threads = currentConfig_.threads;
    return config;
}

Geometry::PathPolisher::Config SvgPlot::polisherConfig() const {
    Geometry::PathPolisher::Config config;
    config.minLength = currentConfig_.minLength;
    config.minLengthFraction = currentConfig_.minLengthFraction;
    return config;
}

SvgParser::Config SvgPlot::parserConfig() const {
    SvgParser::Config config;
    config.strokeSelection = currentConfig_.strokeSelection;
    return config;
}

QList<Core::Path> SvgPlot::process(const Core::Document& document) const {
    QElapsedTimer timer;
    timer.start();

    const Geometry::CurveFlattener flattener(flattenerConfig());
    const QList<Core::FlattenedShape> flattened = flattener.flattenDocument(document);

    QList<Core::Path> subpaths;
    if (currentConfig_.autocut) {
        Geometry::OccluderSet occluders(occluderConfig());
        occluders.build(flattened);

        Geometry::OcclusionEngine::Config engineConfig = occlusionConfig();
        engineConfig.maxSampleSpacing =
            Geometry::OcclusionEngine::effectiveSampleSpacing(engineConfig, document.width, document.height);
        const Geometry::OcclusionEngine engine(engineConfig);
        const QList<Geometry::OcclusionEngine::ShapeResult> results = engine.run(flattened, occluders);
        for (const Geometry::OcclusionEngine::ShapeResult& result : results) {
            subpaths += result.subpaths;
        }
    } else {
        for (const Core::FlattenedShape& shape : flattened) {
            if (shape.strokeSelected) subpaths += shape.outline.subpaths();
        }
    }

    if (currentConfig_.polish) {
        const Geometry::PathPolisher polisher(polisherConfig());
        subpaths = polisher.polish(subpaths, document.width, document.height);
    }

    qDebug() << "SvgPlot: processed" << document.shapes.size() << "shapes into" << subpaths.size()
             << "subpaths in" << timer.elapsed() << "ms";
    return subpaths;
}

Codec::CanonicalStream SvgPlot::toCanonical(const Core::Document& document) const {
    Codec::CanonicalStream stream;
    stream.viewWidth = Codec::CanonicalCodec::viewboxDimension(document.width);
    stream.viewHeight = Codec::CanonicalCodec::viewboxDimension(document.height);
    for (const Core::Path& subpath : process(document)) {
        stream.commands.append(subpath);
    }
    return stream;
}

bool SvgPlot::generate(const QByteArray& svgData, Codec::CanonicalStream* stream, QString* errorMessage) const {
    SvgParser parser;
    parser.setConfig(parserConfig());
    Core::Document document;
    if (!parser.load(svgData, &document, errorMessage)) return false;
    *stream = toCanonical(document);
    return true;
}

bool SvgPlot::generateFile(const QString& inputPath, const QString& outputPath, QString* errorMessage) const {
    QByteArray svgData;
    if (!readFile(inputPath, &svgData, errorMessage)) return false;

    Codec::CanonicalStream stream;
    if (!generate(svgData, &stream, errorMessage)) return false;

    qInfo() << "Writing" << stream.commandCount() << "commands," << stream.coordinateCount() << "coordinates to" << outputPath;
    return writeAtomically(outputPath, Codec::CanonicalCodec::encode(stream), errorMessage);
}

bool SvgPlot::render(const QByteArray& canonicalData, const Codec::SvgWriter::StrokeOptions& options,
                     QString* svg, QString* errorMessage) {
    Codec::CanonicalStream stream;
    Codec::FormatError error;
    if (!Codec::CanonicalCodec::decode(canonicalData, &stream, &error)) {
        if (errorMessage) *errorMessage = error.errorString();
        return false;
    }
    *svg = Codec::SvgWriter::toSvg(stream, options);
    return true;
}

bool SvgPlot::renderFile(const QString& inputPath, const QString& outputPath,
                         const Codec::SvgWriter::StrokeOptions& options, QString* errorMessage) {
    QByteArray data;
    if (!readFile(inputPath, &data, errorMessage)) return false;

    QString svg;
    if (!render(data, options, &svg, errorMessage)) return false;
    return writeAtomically(outputPath, svg.toUtf8(), errorMessage);
}
