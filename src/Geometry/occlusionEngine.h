#ifndef OCCLUSIONENGINE_H
#define OCCLUSIONENGINE_H

#include "geometryUtils.h"
#include "occluderSet.h"
#include "pathTypes.h"

#include <QList>
#include <QString>
#include <QVector>

namespace Geometry {

// Autocut: removes the stretches of each stroked outline hidden by fills painted
// above it, splitting the outline into visible subpaths.
class OcclusionEngine {
public:
    enum CutPolicy {
        ParametricSubdivision,  // exact cut on the original curve, refined by bisection
        NearestSample           // cut on a sample, partial cubics become polylines
    };

    struct Config {
        double sampleTolerance = 0.01;
        double maxSampleSpacing = 1.0;
        double sampleSpacingFraction = 0.01;    // of the viewbox diagonal, caps maxSampleSpacing
        int maxCurveSamples = 1024;
        CutPolicy cutPolicy = ParametricSubdivision;
        int refinementSteps = 24;
        int threads = 0;            // 1 runs sequentially, otherwise the global QThreadPool capped to threads during run()
    };

    struct ShapeResult {
        QString id;
        int zIndex = 0;
        QList<Core::Path> subpaths;
    };

    OcclusionEngine();
    explicit OcclusionEngine(const Config& config);

    void setConfig(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    // Sample spacing for a viewbox: maxSampleSpacing, lowered to sampleSpacingFraction
    // of the diagonal on small viewboxes. A fraction <= 0 keeps maxSampleSpacing.
    static double effectiveSampleSpacing(const Config& config, double viewWidth, double viewHeight);

    // Visible subpaths of one shape. With nothing above it the shape's subpaths are returned unmodified.
    QList<Core::Path> cutShape(const Core::FlattenedShape& shape, const OccluderSet& occluders) const;

    // Visible runs of one subpath against the given occluders.
    QList<Core::Path> cutSubpath(const Core::Path& subpath, const OccluderSet& occluders,
                                 const QVector<int>& candidates) const;

    // Processes every stroke-selected shape, results in document order.
    QList<ShapeResult> run(const QList<Core::FlattenedShape>& shapes, const OccluderSet& occluders) const;

private:
    struct Element {
        enum Kind {
            LineElement,
            CubicElement
        };
        Kind kind = LineElement;
        GeometryUtils::CubicSegment cubic;  // LineElement uses p0 and p3
        bool closing = false;               // implicit segment of a Close command
        int samples = 1;

        QPointF point(double t) const;
    };

    struct Edge {
        int element;
        double t0;
        double t1;
    };

    struct Piece {
        int element;
        double a;
        double b;
    };

    QVector<Element> buildElements(const Core::Path& subpath) const;
    double refineCut(const Element& element, double coveredT, double visibleT,
                     const OccluderSet& occluders, const QVector<int>& candidates) const;
    Core::Path emitRun(const QVector<Element>& elements, const QVector<Piece>& pieces) const;

    Config config_;
};

} // namespace Geometry

#endif // OCCLUSIONENGINE_H
