#ifndef CURVEFLATTENER_H
#define CURVEFLATTENER_H

#include "pathTypes.h"

#include <QList>
#include <QTransform>

namespace Geometry {

// Reduces source outlines to the canonical vocabulary {Move, Line, Cubic, Close}
// in viewbox coordinates.
class CurveFlattener {
public:
    struct Config {
        double tolerance = 0.01;    // max radial deviation of arc approximations
        int maxArcSegments = 1024;
    };

    CurveFlattener();
    explicit CurveFlattener(const Config& config);

    void setConfig(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    Core::Path flatten(const Core::SourceOutline& outline) const;
    Core::FlattenedShape flatten(const Core::Shape& shape) const;
    QList<Core::FlattenedShape> flattenDocument(const Core::Document& document) const;

    // Upper bound of the radial error of one cubic approximating a circular
    // arc of the given radius and sweep (radians).
    static double arcMaxDeviation(double radius, double segmentSweep);

    // Equal-angle segment count for an arc: never less than one segment per
    // quarter turn, increased until arcMaxDeviation fits the tolerance.
    static int arcSegmentCount(double sweep, double radius, double tolerance, int maxSegments = 1024);

    // Largest singular value of the linear part of transform.
    static double maxScale(const QTransform& transform);

private:
    struct EllipseFrame {
        QPointF center;
        double rx;
        double ry;
        double cosPhi;
        double sinPhi;

        QPointF point(double angle) const;
        QPointF tangent(double angle) const;
    };

    void appendPathSegments(Core::Path& out, const Core::SourceOutline& outline) const;
    void appendRect(Core::Path& out, const Core::SourceOutline& outline) const;
    void appendEllipse(Core::Path& out, const Core::SourceOutline& outline) const;
    void appendPoints(Core::Path& out, const Core::SourceOutline& outline, bool closed) const;

    // Appends the cubics of an SVG endpoint arc from -> to. Returns false when
    // the radii are unusable; the caller degrades the arc to a line.
    bool appendArc(Core::Path& out, const QPointF& from, const Core::ArcParameters& arc,
                   const QPointF& to, const QTransform& transform) const;

    void appendArcCubics(Core::Path& out, const EllipseFrame& frame, double startAngle, double sweep,
                         const QPointF& exactEnd, const QTransform& transform) const;

    Config config_;
};

} // namespace Geometry

#endif // CURVEFLATTENER_H
