#ifndef GEOMETRYUTILS_H
#define GEOMETRYUTILS_H

#include <QPointF>
#include <QPolygonF>
#include <QRectF>

namespace GeometryUtils {

struct CubicSegment {
    QPointF p0;
    QPointF c1;
    QPointF c2;
    QPointF p3;
};

double signedArea(const QPolygonF& polygon);
double area(const QPolygonF& polygon);

QRectF boundingBox(const QPolygonF& polygon);

double distance(const QPointF& a, const QPointF& b);

// Winding number of the closed polygon around point. The closing edge is implicit.
int windingNumber(const QPointF& point, const QPolygonF& polygon);

bool isPointInPolygon(const QPointF& point, const QPolygonF& polygon, Qt::FillRule fillRule = Qt::OddEvenFill );

// Degree elevation of the quadratic (p0, c, p1).
CubicSegment quadToCubic(const QPointF& p0, const QPointF& c, const QPointF& p1);

QPointF cubicPoint(const CubicSegment& cubic, double t);

// de Casteljau split at t.
void splitCubic(const CubicSegment& cubic, double t, CubicSegment* left, CubicSegment* right);

// The piece of cubic between parameters t0 < t1, as an exact cubic.
CubicSegment subCubic(const CubicSegment& cubic, double t0, double t1);

// Arc length, recursive subdivision until chord and control polygon agree within tolerance.
double cubicLength(const CubicSegment& cubic, double tolerance = 1e-6);

// Number of uniform parameter steps that keeps the chord deviation below tolerance
// and the distance between samples below maxSpacing, clamped to [1, maxSamples].
int cubicSampleCount(const CubicSegment& cubic, double tolerance, double maxSpacing, int maxSamples);

// Number of equal pieces a straight segment of the given length is split into.
int lineSampleCount(double length, double maxSpacing, int maxSamples);

} // namespace GeometryUtils

#endif // GEOMETRYUTILS_H
