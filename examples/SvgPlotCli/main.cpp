#include "svgPlot.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <qnumeric.h>
#include <QLoggingCategory>

namespace {

int fail(const QString& message) {
    qCritical().noquote() << message;
    return 1;
}

int runGenerate(const QCommandLineParser& parser, const QStringList& args) {
    if (args.size() != 3) return fail(QStringLiteral("usage: svgplot generate INPUT.svg OUTPUT.svgcom [options]"));

    SvgPlot::Configuration config;
    QString error;
    if (parser.isSet("config")
        && !SvgPlot::loadConfiguration(parser.value("config"), &config, &error)) {
        return fail(error);
    }

    bool ok = true;
    auto doubleOption = [&](const char* name, double* target) {
        const QString option = QString::fromLatin1(name);
        if (!parser.isSet(option)) return;
        bool valid = false;
        const double v = parser.value(option).toDouble(&valid);
        if (valid && qIsFinite(v)) *target = v;
        else { qCritical().noquote() << "invalid value for --" + option << parser.value(option); ok = false; }
    };

    if (parser.isSet("autocut")) config.autocut = true;
    if (parser.isSet("polish")) config.polish = true;
    doubleOption("min-length", &config.minLength);
    if (parser.isSet("min-length")) config.polish = true;
    doubleOption("tolerance", &config.curveTolerance);
    doubleOption("sample-tolerance", &config.sampleTolerance);
    if (parser.isSet("fill-rule")
        && !SvgPlot::parseFillRule(parser.value("fill-rule"), &config.fillRule)) {
        return fail(QStringLiteral("unknown fill rule: %1").arg(parser.value("fill-rule")));
    }
    if (parser.isSet("cut")
        && !SvgPlot::parseCutPolicy(parser.value("cut"), &config.cutPolicy)) {
        return fail(QStringLiteral("unknown cut policy: %1").arg(parser.value("cut")));
    }
    if (parser.isSet("stroke-selection")
        && !SvgPlot::parseStrokeSelection(parser.value("stroke-selection"), &config.strokeSelection)) {
        return fail(QStringLiteral("unknown stroke selection: %1").arg(parser.value("stroke-selection")));
    }
    if (parser.isSet("threads")) {
        bool valid = false;
        config.threads = parser.value("threads").toInt(&valid);
        if (!valid || config.threads < 0) return fail(QStringLiteral("invalid thread count"));
    }
    if (!ok) return 1;

    SvgPlot plot(config);
    if (!plot.generateFile(args.at(1), args.at(2), &error)) return fail(error);
    return 0;
}

int runRender(const QCommandLineParser& parser, const QStringList& args) {
    if (args.size() != 3) return fail(QStringLiteral("usage: svgplot render INPUT.svgcom OUTPUT.svg [options]"));

    Codec::SvgWriter::StrokeOptions stroke;
    if (parser.isSet("stroke")) stroke.color = parser.value("stroke");
    if (parser.isSet("stroke-width")) {
        bool ok = false;
        stroke.width = parser.value("stroke-width").toDouble(&ok);
        if (!ok || !(stroke.width >= 0.0)) return fail(QStringLiteral("invalid stroke width"));
    }

    QString error;
    if (!SvgPlot::renderFile(args.at(1), args.at(2), stroke, &error)) return fail(error);
    return 0;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("svgplot");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Converts SVG outlines to the canonical M/L/C/Z command stream and back.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "generate or render");
    parser.addPositionalArgument("input", "Input file");
    parser.addPositionalArgument("output", "Output file");

    auto add = [&parser](const QString& name, const QString& description, const QString& valueName = QString()) {
        parser.addOption(QCommandLineOption(name, description, valueName));
    };
    add("autocut", "Remove stroke stretches hidden by fills painted above them.");
    add("polish", "Drop subpaths shorter than the minimum length.");
    add("min-length", "Minimum subpath length in viewbox units (implies --polish).", "length");
    add("tolerance", "Maximum deviation of arc approximations.", "value");
    add("sample-tolerance", "Maximum chord deviation of occlusion samples.", "value");
    add("fill-rule", "Occluder fill rule: nonzero, evenodd or shape.", "rule");
    add("cut", "Cut policy: parametric or sample.", "policy");
    add("stroke-selection", "Outlined shapes: all or stroked.", "selection");
    add("threads", "Worker threads for the autocut pass.", "count");
    add("config", "INI file with a [Configuration] group.", "file");
    add("stroke", "Stroke color of rendered paths.", "color");
    add("stroke-width", "Stroke width of rendered paths.", "width");
    add("verbose", "Print debug messages.");

    parser.process(app);

    if (!parser.isSet("verbose")) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const QString command = args.first();
    if (command == "generate") return runGenerate(parser, args);
    if (command == "render") return runRender(parser, args);
    return fail(QStringLiteral("unknown command '%1', expected generate or render").arg(command));
}
