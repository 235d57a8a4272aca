#include "curveFlattener.h"
#include "geometryUtils.h"

#include <QDebug>
#include <qnumeric.h>
#include <QtMath>
#include <cmath>
#include <limits>

namespace Geometry {

namespace {

bool isFinitePoint(const QPointF& p) {
    return qIsFinite(p.x()) && qIsFinite(p.y());
}

bool segmentIsFinite(const Core::SourceSegment& seg) {
    int count = 0;
    switch (seg.type) {
    case Core::SourceSegment::MoveTo:
    case Core::SourceSegment::LineTo:
    case Core::SourceSegment::ArcTo:
        count = 1;
        break;
    case Core::SourceSegment::QuadTo:
        count = 2;
        break;
    case Core::SourceSegment::CubicTo:
        count = 3;
        break;
    case Core::SourceSegment::ClosePath:
        count = 0;
        break;
    }
    for (int i = 0; i < count; ++i) {
        if (!isFinitePoint(seg.points[i])) return false;
    }
    return true;
}

// Signed angle from u to v.
double vectorAngle(double ux, double uy, double vx, double vy) {
    return std::atan2(ux * vy - uy * vx, ux * vx + uy * vy);
}

} // namespace

QPointF CurveFlattener::EllipseFrame::point(double angle) const {
    const double ex = rx * std::cos(angle);
    const double ey = ry * std::sin(angle);
    return QPointF(center.x() + ex * cosPhi - ey * sinPhi,
                   center.y() + ex * sinPhi + ey * cosPhi);
}

QPointF CurveFlattener::EllipseFrame::tangent(double angle) const {
    const double ex = -rx * std::sin(angle);
    const double ey = ry * std::cos(angle);
    return QPointF(ex * cosPhi - ey * sinPhi, ex * sinPhi + ey * cosPhi);
}

CurveFlattener::CurveFlattener() = default;

CurveFlattener::CurveFlattener(const Config& config) : config_(config) {
}

double CurveFlattener::arcMaxDeviation(double radius, double segmentSweep) {
    const double q = std::abs(segmentSweep) / 4.0;
    const double s = std::sin(q);
    const double c = std::cos(q);
    if (c <= 0.0) return std::numeric_limits<double>::infinity();
    return radius * (2.0 / 27.0) * std::pow(s, 6) / (c * c);
}

int CurveFlattener::arcSegmentCount(double sweep, double radius, double tolerance, int maxSegments) {
    const double absSweep = std::abs(sweep);
    const int cap = qMax(1, maxSegments);
    int n = qMax(1, static_cast<int>(std::ceil(absSweep / M_PI_2 - 1e-9)));
    if (tolerance > 0.0) {
        while (n < cap && arcMaxDeviation(radius, absSweep / n) > tolerance) ++n;
    }
    return qMin(n, cap);
}

double CurveFlattener::maxScale(const QTransform& transform) {
    const double a = transform.m11();
    const double b = transform.m12();
    const double c = transform.m21();
    const double d = transform.m22();
    const double s = a * a + b * b + c * c + d * d;
    const double det = a * d - b * c;
    const double disc = qMax(0.0, s * s - 4.0 * det * det);
    return std::sqrt((s + std::sqrt(disc)) / 2.0);
}

Core::Path CurveFlattener::flatten(const Core::SourceOutline& outline) const {
    Core::Path out;
    switch (outline.kind) {
    case Core::SourceOutline::PathOutline:
        appendPathSegments(out, outline);
        break;
    case Core::SourceOutline::RectOutline:
        appendRect(out, outline);
        break;
    case Core::SourceOutline::EllipseOutline:
        appendEllipse(out, outline);
        break;
    case Core::SourceOutline::LineOutline:
    case Core::SourceOutline::PolylineOutline:
        appendPoints(out, outline, false);
        break;
    case Core::SourceOutline::PolygonOutline:
        appendPoints(out, outline, true);
        break;
    }
    return out;
}

Core::FlattenedShape CurveFlattener::flatten(const Core::Shape& shape) const {
    Core::FlattenedShape result;
    result.id = shape.id;
    result.zIndex = shape.zIndex;
    result.strokeSelected = shape.strokeSelected;
    result.hasFill = shape.hasFill;
    result.fillRule = shape.fillRule;
    result.outline = flatten(shape.outline);
    return result;
}

QList<Core::FlattenedShape> CurveFlattener::flattenDocument(const Core::Document& document) const {
    QList<Core::FlattenedShape> result;
    result.reserve(document.shapes.size());
    for (const Core::Shape& shape : document.shapes) {
        result.append(flatten(shape));
    }
    return result;
}

void CurveFlattener::appendPathSegments(Core::Path& out, const Core::SourceOutline& outline) const {
    const QTransform& m = outline.transform;
    QPointF current(0.0, 0.0);
    QPointF subpathStart(0.0, 0.0);
    bool haveMove = false;

    for (const Core::SourceSegment& seg : outline.segments) {
        if (!segmentIsFinite(seg)) {
            qWarning() << "CurveFlattener: dropping segment with non-finite coordinates";
            continue;
        }
        if (seg.type != Core::SourceSegment::MoveTo && seg.type != Core::SourceSegment::ClosePath && !haveMove) {
            qWarning() << "CurveFlattener: drawing command before any move, starting at" << current;
            out.moveTo(m.map(current));
            subpathStart = current;
            haveMove = true;
        }

        switch (seg.type) {
        case Core::SourceSegment::MoveTo:
            out.moveTo(m.map(seg.points[0]));
            current = subpathStart = seg.points[0];
            haveMove = true;
            break;
        case Core::SourceSegment::LineTo:
            out.lineTo(m.map(seg.points[0]));
            current = seg.points[0];
            break;
        case Core::SourceSegment::QuadTo: {
            const GeometryUtils::CubicSegment cubic = GeometryUtils::quadToCubic(current, seg.points[0], seg.points[1]);
            out.cubicTo(m.map(cubic.c1), m.map(cubic.c2), m.map(cubic.p3));
            current = seg.points[1];
            break;
        }
        case Core::SourceSegment::CubicTo:
            out.cubicTo(m.map(seg.points[0]), m.map(seg.points[1]), m.map(seg.points[2]));
            current = seg.points[2];
            break;
        case Core::SourceSegment::ArcTo:
            if (current == seg.points[0]) {
                // Coincident endpoints: the arc is omitted entirely.
                break;
            }
            if (!appendArc(out, current, seg.arc, seg.points[0], m)) {
                qWarning() << "CurveFlattener: invalid arc radii" << seg.arc.rx << seg.arc.ry
                           << "- replaced by a straight line";
                out.lineTo(m.map(seg.points[0]));
            }
            current = seg.points[0];
            break;
        case Core::SourceSegment::ClosePath:
            if (!haveMove) {
                qWarning() << "CurveFlattener: close without an open subpath ignored";
                break;
            }
            out.close();
            current = subpathStart;
            break;
        }
    }
}

bool CurveFlattener::appendArc(Core::Path& out, const QPointF& from, const Core::ArcParameters& arc,
                               const QPointF& to, const QTransform& transform) const {
    double rx = std::abs(arc.rx);
    double ry = std::abs(arc.ry);
    if (!qIsFinite(rx) || !qIsFinite(ry) || !qIsFinite(arc.xAxisRotation))
        return false;
    if (arc.rx <= 0.0 || arc.ry <= 0.0)
        return false;

    const double phi = qDegreesToRadians(std::fmod(arc.xAxisRotation, 360.0));
    const double cosPhi = std::cos(phi);
    const double sinPhi = std::sin(phi);

    // Endpoint to center parameterization.
    const double dx2 = (from.x() - to.x()) / 2.0;
    const double dy2 = (from.y() - to.y()) / 2.0;
    const double x1p = cosPhi * dx2 + sinPhi * dy2;
    const double y1p = -sinPhi * dx2 + cosPhi * dy2;

    const double lambda = (x1p * x1p) / (rx * rx) + (y1p * y1p) / (ry * ry);
    if (lambda > 1.0) {
        const double scale = std::sqrt(lambda);
        rx *= scale;
        ry *= scale;
    }

    const double rx2 = rx * rx;
    const double ry2 = ry * ry;
    const double num = rx2 * ry2 - rx2 * y1p * y1p - ry2 * x1p * x1p;
    const double den = rx2 * y1p * y1p + ry2 * x1p * x1p;
    double coef = 0.0;
    if (den > 0.0 && num > 0.0) coef = std::sqrt(num / den);
    if (arc.largeArc == arc.sweep) coef = -coef;

    const double cxp = coef * (rx * y1p / ry);
    const double cyp = coef * (-ry * x1p / rx);

    EllipseFrame frame;
    frame.center = QPointF(cosPhi * cxp - sinPhi * cyp + (from.x() + to.x()) / 2.0,
                           sinPhi * cxp + cosPhi * cyp + (from.y() + to.y()) / 2.0);
    frame.rx = rx;
    frame.ry = ry;
    frame.cosPhi = cosPhi;
    frame.sinPhi = sinPhi;

    const double ux = (x1p - cxp) / rx;
    const double uy = (y1p - cyp) / ry;
    const double vx = (-x1p - cxp) / rx;
    const double vy = (-y1p - cyp) / ry;

    const double theta1 = vectorAngle(1.0, 0.0, ux, uy);
    double dtheta = vectorAngle(ux, uy, vx, vy);
    if (!arc.sweep && dtheta > 0.0) dtheta -= 2.0 * M_PI;
    else if (arc.sweep && dtheta < 0.0) dtheta += 2.0 * M_PI;

    appendArcCubics(out, frame, theta1, dtheta, to, transform);
    return true;
}

void CurveFlattener::appendArcCubics(Core::Path& out, const EllipseFrame& frame, double startAngle, double sweep,
                                     const QPointF& exactEnd, const QTransform& transform) const {
    const double radius = qMax(frame.rx, frame.ry) * maxScale(transform);
    const int n = arcSegmentCount(sweep, radius, config_.tolerance, config_.maxArcSegments);
    const double inc = sweep / n;
    const double k = 4.0 / 3.0 * std::tan(inc / 4.0);

    double a0 = startAngle;
    QPointF p0 = frame.point(a0);
    for (int i = 0; i < n; ++i) {
        const double a1 = startAngle + inc * (i + 1);
        const QPointF p1 = (i == n - 1) ? exactEnd : frame.point(a1);
        const QPointF c1 = p0 + frame.tangent(a0) * k;
        const QPointF c2 = frame.point(a1) - frame.tangent(a1) * k;
        out.cubicTo(transform.map(c1), transform.map(c2), transform.map(p1));
        a0 = a1;
        p0 = p1;
    }
}

void CurveFlattener::appendRect(Core::Path& out, const Core::SourceOutline& outline) const {
    const QRectF& r = outline.rect;
    const QTransform& m = outline.transform;
    if (!(r.width() > 0.0) || !(r.height() > 0.0)) {
        qWarning() << "CurveFlattener: rectangle with non-positive size" << r.size() << "produces no outline";
        return;
    }

    const double rx = qMin(qMax(0.0, outline.cornerRx), r.width() / 2.0);
    const double ry = qMin(qMax(0.0, outline.cornerRy), r.height() / 2.0);
    const double x = r.x();
    const double y = r.y();
    const double w = r.width();
    const double h = r.height();

    if (!(rx > 0.0) || !(ry > 0.0)) {
        out.moveTo(m.map(QPointF(x, y)));
        out.lineTo(m.map(QPointF(x + w, y)));
        out.lineTo(m.map(QPointF(x + w, y + h)));
        out.lineTo(m.map(QPointF(x, y + h)));
        out.close();
        return;
    }

    Core::ArcParameters corner;
    corner.rx = rx;
    corner.ry = ry;
    corner.sweep = true;

    auto edgeTo = [&](const QPointF& from, const QPointF& to) {
        if (from != to) out.lineTo(m.map(to));
    };

    const QPointF start(x + rx, y);
    out.moveTo(m.map(start));
    edgeTo(start, QPointF(x + w - rx, y));
    appendArc(out, QPointF(x + w - rx, y), corner, QPointF(x + w, y + ry), m);
    edgeTo(QPointF(x + w, y + ry), QPointF(x + w, y + h - ry));
    appendArc(out, QPointF(x + w, y + h - ry), corner, QPointF(x + w - rx, y + h), m);
    edgeTo(QPointF(x + w - rx, y + h), QPointF(x + rx, y + h));
    appendArc(out, QPointF(x + rx, y + h), corner, QPointF(x, y + h - ry), m);
    edgeTo(QPointF(x, y + h - ry), QPointF(x, y + ry));
    appendArc(out, QPointF(x, y + ry), corner, start, m);
    out.close();
}

void CurveFlattener::appendEllipse(Core::Path& out, const Core::SourceOutline& outline) const {
    if (!(outline.radiusX > 0.0) || !(outline.radiusY > 0.0) || !isFinitePoint(outline.center)) {
        qWarning() << "CurveFlattener: ellipse with non-positive radius" << outline.radiusX << outline.radiusY
                   << "produces no outline";
        return;
    }

    EllipseFrame frame;
    frame.center = outline.center;
    frame.rx = outline.radiusX;
    frame.ry = outline.radiusY;
    frame.cosPhi = 1.0;
    frame.sinPhi = 0.0;

    const QPointF start = frame.point(0.0);
    out.moveTo(outline.transform.map(start));
    appendArcCubics(out, frame, 0.0, 2.0 * M_PI, start, outline.transform);
    out.close();
}

void CurveFlattener::appendPoints(Core::Path& out, const Core::SourceOutline& outline, bool closed) const {
    QPolygonF points;
    points.reserve(outline.points.size());
    for (const QPointF& p : outline.points) {
        if (isFinitePoint(p)) points.append(p);
    }
    if (points.size() != outline.points.size()) {
        qWarning() << "CurveFlattener: dropped" << outline.points.size() - points.size() << "non-finite points";
    }
    if (points.isEmpty()) {
        qWarning() << "CurveFlattener: point list is empty, no outline produced";
        return;
    }

    const QTransform& m = outline.transform;
    out.moveTo(m.map(points.first()));
    for (int i = 1; i < points.size(); ++i) {
        out.lineTo(m.map(points.at(i)));
    }
    if (closed) out.close();
}

} // namespace Geometry
