#ifndef SVGPARSER_H
#define SVGPARSER_H

#include <QByteArray>
#include <QDomElement>
#include <QHash>
#include <QRectF>
#include <QString>
#include <QTransform>
#include <QVector>

#include "pathTypes.h"

// Reads an SVG document into a flat, paint-ordered Core::Document. Groups and
// transforms are resolved, hidden elements are left out.
class SvgParser {
public:
    enum StrokeSelection {
        AllShapes,      // every visible shape is outlined
        StrokedShapes   // only shapes with a stroke
    };

    struct Config {
        StrokeSelection strokeSelection;
        double dpi;     // for physical units in width/height
        Config() : strokeSelection(AllShapes), dpi(96.0) {}
    };

    SvgParser();

    void setConfig(const Config& config);
    const Config& config() const { return currentConfig; }

    // Fails on malformed XML or a non-svg root. Bad shapes are skipped with a warning.
    bool load(const QByteArray& svgData, Core::Document* document, QString* errorMessage = nullptr);

    // SVG transform list to QTransform. Unknown functions are ignored with a warning.
    static QTransform parseTransform(const QString& transformString);

    // Parses path data into absolute segments. On error the segments read so far
    // are kept in segments and false is returned.
    static bool parsePathData(const QString& d, QVector<Core::SourceSegment>* segments, QString* errorMessage = nullptr);

    // Length with optional unit (px, pt, pc, mm, cm, in) in user units.
    static double parseLength(const QString& lengthStr, double dpi, bool* ok);

    // "min-x min-y width height"; false unless all four are numbers and the size is positive.
    static bool parseViewBox(const QString& viewBoxStr, QRectF* viewBox);

    // Maps the content of a nested <svg> into its parent: x/y offset, then the
    // viewBox fitted to width/height according to preserveAspectRatio.
    static QTransform viewportTransform(const QDomElement& element, double dpi);

private:
    struct Style {
        bool hasFill = true;
        bool hasStroke = false;
        Qt::FillRule fillRule = Qt::WindingFill;
        double fillOpacity = 1.0;
        double opacity = 1.0;       // accumulated group opacity
        bool visible = true;
    };

    void walk(const QDomElement& element, const QTransform& parentTransform, const Style& parentStyle, Core::Document* document);
    void addShape(const QDomElement& element, const QTransform& transform, const Style& style, Core::Document* document);

    bool outlineRect(const QDomElement& element, const QTransform& transform, Core::SourceOutline* outline) const;
    bool outlineCircle(const QDomElement& element, const QTransform& transform, Core::SourceOutline* outline) const;
    bool outlineEllipse(const QDomElement& element, const QTransform& transform, Core::SourceOutline* outline) const;
    bool outlineLine(const QDomElement& element, const QTransform& transform, Core::SourceOutline* outline) const;
    bool outlinePoints(const QDomElement& element, const QTransform& transform, bool closed, Core::SourceOutline* outline) const;
    bool outlinePath(const QDomElement& element, const QTransform& transform, Core::SourceOutline* outline) const;

    // Presentation attributes overridden by declarations of the style attribute.
    static QHash<QString, QString> presentation(const QDomElement& element);
    static Style resolveStyle(const QHash<QString, QString>& properties, const Style& parent);

    Config currentConfig;
    int unnamedCount = 0;
};

#endif // SVGPARSER_H
