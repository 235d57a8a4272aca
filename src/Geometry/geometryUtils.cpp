#include "geometryUtils.h"
#include <cmath>      // For std::abs, std::sqrt, std::ceil
#include <limits>     // For std::numeric_limits

namespace GeometryUtils {

    // Shoelace formula. Positive for counter-clockwise in a y-up frame.
    double signedArea(const QPolygonF& polygon) {
        if (polygon.size() < 3) {
            return 0.0;
        }
        double area = 0.0;
        for (int i = 0; i < polygon.size(); ++i) {
            const QPointF& p1 = polygon[i];
            const QPointF& p2 = polygon[(i + 1) % polygon.size()];
            area += (p1.x() * p2.y() - p2.x() * p1.y());
        }
        return area / 2.0;
    }

    double area(const QPolygonF& polygon) {
        return std::abs(signedArea(polygon));
    }

    QRectF boundingBox(const QPolygonF& polygon) {
        return polygon.boundingRect();
    }

    double distance(const QPointF& a, const QPointF& b) {
        const double dx = b.x() - a.x();
        const double dy = b.y() - a.y();
        return std::sqrt(dx * dx + dy * dy);
    }

    // Sunday's crossing-direction algorithm: upward edges with the point on their
    // left count +1, downward edges with the point on their right count -1.
    int windingNumber(const QPointF& point, const QPolygonF& polygon) {
        const int n = polygon.size();
        if (n < 3) return 0;

        int winding = 0;
        QPointF p1 = polygon.last();
        for (int i = 0; i < n; ++i) {
            const QPointF& p2 = polygon[i];
            const double side = (p2.x() - p1.x()) * (point.y() - p1.y())
                              - (point.x() - p1.x()) * (p2.y() - p1.y());
            if (p1.y() <= point.y()) {
                if (p2.y() > point.y() && side > 0.0) ++winding;
            } else {
                if (p2.y() <= point.y() && side < 0.0) --winding;
            }
            p1 = p2;
        }
        return winding;
    }

    bool isPointInPolygon(const QPointF& point, const QPolygonF& polygon, Qt::FillRule fillRule /* = Qt::OddEvenFill */ ) {
        if (polygon.size() < 3) return false;

        if (fillRule == Qt::OddEvenFill) {
            // Ray casting
            bool inside = false;
            QPointF p1 = polygon.last();
            for (int i = 0; i < polygon.size(); ++i) {
                const QPointF& p2 = polygon[i];
                if (((p1.y() <= point.y()) && (p2.y() > point.y())) || ((p2.y() <= point.y()) && (p1.y() > point.y()))) {
                    double vt = (point.y() - p1.y()) / (p2.y() - p1.y());
                    double intersectX = p1.x() + vt * (p2.x() - p1.x());
                    if (intersectX > point.x()) {
                        inside = !inside;
                    }
                }
                p1 = p2;
            }
            return inside;
        }
        return windingNumber(point, polygon) != 0;
    }

    CubicSegment quadToCubic(const QPointF& p0, const QPointF& c, const QPointF& p1) {
        CubicSegment cubic;
        cubic.p0 = p0;
        cubic.c1 = p0 + (c - p0) * (2.0 / 3.0);
        cubic.c2 = p1 + (c - p1) * (2.0 / 3.0);
        cubic.p3 = p1;
        return cubic;
    }

    QPointF cubicPoint(const CubicSegment& cubic, double t) {
        if (t <= 0.0) return cubic.p0;
        if (t >= 1.0) return cubic.p3;
        const double mt = 1.0 - t;
        const double a = mt * mt * mt;
        const double b = 3.0 * mt * mt * t;
        const double c = 3.0 * mt * t * t;
        const double d = t * t * t;
        return QPointF(a * cubic.p0.x() + b * cubic.c1.x() + c * cubic.c2.x() + d * cubic.p3.x(),
                       a * cubic.p0.y() + b * cubic.c1.y() + c * cubic.c2.y() + d * cubic.p3.y());
    }

    static QPointF lerp(const QPointF& a, const QPointF& b, double t) {
        return a + (b - a) * t;
    }

    void splitCubic(const CubicSegment& cubic, double t, CubicSegment* left, CubicSegment* right) {
        const QPointF p01 = lerp(cubic.p0, cubic.c1, t);
        const QPointF p12 = lerp(cubic.c1, cubic.c2, t);
        const QPointF p23 = lerp(cubic.c2, cubic.p3, t);
        const QPointF p012 = lerp(p01, p12, t);
        const QPointF p123 = lerp(p12, p23, t);
        const QPointF mid = lerp(p012, p123, t);

        if (left) {
            left->p0 = cubic.p0;
            left->c1 = p01;
            left->c2 = p012;
            left->p3 = mid;
        }
        if (right) {
            right->p0 = mid;
            right->c1 = p123;
            right->c2 = p23;
            right->p3 = cubic.p3;
        }
    }

    CubicSegment subCubic(const CubicSegment& cubic, double t0, double t1) {
        t0 = qBound(0.0, t0, 1.0);
        t1 = qBound(0.0, t1, 1.0);
        if (t0 <= 0.0 && t1 >= 1.0) return cubic;

        CubicSegment tail = cubic;
        if (t0 > 0.0) splitCubic(cubic, t0, nullptr, &tail);
        if (t1 >= 1.0) return tail;

        // Reparametrize t1 onto the remaining [t0, 1] piece.
        const double local = (t0 >= 1.0) ? 1.0 : (t1 - t0) / (1.0 - t0);
        CubicSegment head;
        splitCubic(tail, local, &head, nullptr);
        // Keep the endpoints exactly on the curve evaluation so adjacent cuts agree.
        head.p0 = cubicPoint(cubic, t0);
        head.p3 = cubicPoint(cubic, t1);
        return head;
    }

    static double cubicLengthRecursive(const CubicSegment& cubic, double tolerance, int depth) {
        const double chord = distance(cubic.p0, cubic.p3);
        const double polygon = distance(cubic.p0, cubic.c1) + distance(cubic.c1, cubic.c2) + distance(cubic.c2, cubic.p3);
        if (depth >= 16 || polygon - chord <= tolerance) {
            return (chord + polygon) / 2.0;
        }
        CubicSegment left, right;
        splitCubic(cubic, 0.5, &left, &right);
        return cubicLengthRecursive(left, tolerance / 2.0, depth + 1)
             + cubicLengthRecursive(right, tolerance / 2.0, depth + 1);
    }

    double cubicLength(const CubicSegment& cubic, double tolerance) {
        return cubicLengthRecursive(cubic, tolerance > 0.0 ? tolerance : 1e-6, 0);
    }

    int cubicSampleCount(const CubicSegment& cubic, double tolerance, double maxSpacing, int maxSamples) {
        const int cap = qMax(1, maxSamples);

        const QPointF d1 = cubic.p0 - 2.0 * cubic.c1 + cubic.c2;
        const QPointF d2 = cubic.c1 - 2.0 * cubic.c2 + cubic.p3;
        const double m = qMax(std::sqrt(QPointF::dotProduct(d1, d1)), std::sqrt(QPointF::dotProduct(d2, d2)));

        double n = 1.0;
        if (tolerance > 0.0) {
            n = std::ceil(std::sqrt(0.75 * m / tolerance));
        } else if (m > 0.0) {
            n = cap;
        }
        if (maxSpacing > 0.0) {
            const double polygon = distance(cubic.p0, cubic.c1) + distance(cubic.c1, cubic.c2) + distance(cubic.c2, cubic.p3);
            n = qMax(n, std::ceil(polygon / maxSpacing));
        }
        if (!(n >= 1.0)) n = 1.0;
        if (n > cap) n = cap;
        return static_cast<int>(n);
    }

    int lineSampleCount(double length, double maxSpacing, int maxSamples) {
        const int cap = qMax(1, maxSamples);
        if (!(maxSpacing > 0.0) || !(length > maxSpacing)) return 1;
        const double n = std::ceil(length / maxSpacing);
        return n > cap ? cap : static_cast<int>(n);
    }

} // namespace GeometryUtils
