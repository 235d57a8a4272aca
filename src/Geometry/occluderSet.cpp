#include "occluderSet.h"
#include "geometryUtils.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

#include <clipper2/clipper.h>

namespace Geometry {

namespace {

Clipper2Lib::Path64 polygonToPath64(const QPolygonF& polygon, double scale) {
    Clipper2Lib::Path64 path;
    path.reserve(polygon.size());
    for (const QPointF& pt : polygon) {
        path.push_back(Clipper2Lib::Point64(
            static_cast<int64_t>(std::llround(pt.x() * scale)),
            static_cast<int64_t>(std::llround(pt.y() * scale))));
    }
    return path;
}

QPolygonF path64ToPolygon(const Clipper2Lib::Path64& path, double scale) {
    QPolygonF polygon;
    polygon.reserve(static_cast<int>(path.size()));
    for (const Clipper2Lib::Point64& pt : path) {
        polygon.append(QPointF(static_cast<double>(pt.x) / scale, static_cast<double>(pt.y) / scale));
    }
    return polygon;
}

Clipper2Lib::FillRule clipperFillRule(OccluderSet::FillRulePolicy policy, Qt::FillRule shapeRule) {
    switch (policy) {
    case OccluderSet::NonZeroRule:
        return Clipper2Lib::FillRule::NonZero;
    case OccluderSet::EvenOddRule:
        return Clipper2Lib::FillRule::EvenOdd;
    case OccluderSet::ShapeRule:
        break;
    }
    return shapeRule == Qt::OddEvenFill ? Clipper2Lib::FillRule::EvenOdd : Clipper2Lib::FillRule::NonZero;
}

} // namespace

OccluderSet::OccluderSet() = default;

OccluderSet::OccluderSet(const Config& config) : config_(config) {
}

void OccluderSet::clear() {
    occluders_.clear();
    skipped_ = 0;
}

QVector<QPolygonF> OccluderSet::polygonize(const Core::Path& path, double tolerance, int maxCurveSamples) {
    QVector<QPolygonF> result;
    for (const Core::Path& subpath : path.subpaths()) {
        QPolygonF polygon;
        QPointF start;
        QPointF current;
        for (const Core::PathCommand& cmd : subpath.commands) {
            switch (cmd.type) {
            case Core::PathCommand::Move:
                start = cmd.points[0];
                current = start;
                polygon.append(current);
                break;
            case Core::PathCommand::Line:
                current = cmd.points[0];
                polygon.append(current);
                break;
            case Core::PathCommand::Cubic: {
                const GeometryUtils::CubicSegment cubic{ current, cmd.points[0], cmd.points[1], cmd.points[2] };
                const int n = GeometryUtils::cubicSampleCount(cubic, tolerance, 0.0, maxCurveSamples);
                for (int i = 1; i < n; ++i) {
                    polygon.append(GeometryUtils::cubicPoint(cubic, static_cast<double>(i) / n));
                }
                current = cubic.p3;
                polygon.append(current);
                break;
            }
            case Core::PathCommand::Close:
                // Drawing after a close continues from the subpath start as a new contour.
                if (polygon.size() >= 3) result.append(polygon);
                polygon.clear();
                current = start;
                polygon.append(current);
                break;
            }
        }
        if (polygon.size() >= 3) result.append(polygon);
    }
    return result;
}

bool OccluderSet::boundsOverlap(const QRectF& a, const QRectF& b) {
    // Inclusive on the edges so zero-width bounds of straight strokes still match.
    return a.left() <= b.right() && b.left() <= a.right()
        && a.top() <= b.bottom() && b.top() <= a.bottom();
}

bool OccluderSet::normalize(const Core::FlattenedShape& shape, Occluder* occluder) const {
    const QVector<QPolygonF> contours = polygonize(shape.outline, config_.sampleTolerance, config_.maxCurveSamples);
    if (contours.isEmpty()) return false;

    const double scale = config_.clipperScale > 0.0 ? config_.clipperScale : 1000000.0;
    Clipper2Lib::Paths64 subjects;
    subjects.reserve(contours.size());
    for (const QPolygonF& contour : contours) {
        subjects.push_back(polygonToPath64(contour, scale));
    }

    const Clipper2Lib::Paths64 solution = Clipper2Lib::Union(subjects, clipperFillRule(config_.fillRule, shape.fillRule));
    if (solution.empty()) return false;

    double total = 0.0;
    occluder->contours.clear();
    QRectF bounds;
    for (const Clipper2Lib::Path64& path : solution) {
        if (path.size() < 3) continue;
        const QPolygonF polygon = path64ToPolygon(path, scale);
        total += GeometryUtils::signedArea(polygon);
        bounds = bounds.isNull() ? polygon.boundingRect() : bounds.united(polygon.boundingRect());
        occluder->contours.append(polygon);
    }
    occluder->area = std::abs(total);
    occluder->bounds = bounds;
    return !occluder->contours.isEmpty() && occluder->area > 0.0;
}

int OccluderSet::build(const QList<Core::FlattenedShape>& shapes) {
    clear();
    for (const Core::FlattenedShape& shape : shapes) {
        if (!shape.hasFill) continue;

        Occluder occluder;
        occluder.id = shape.id;
        occluder.zIndex = shape.zIndex;
        if (!normalize(shape, &occluder)) {
            qDebug() << "OccluderSet: fill of" << shape.id << "has no area, it hides nothing";
            ++skipped_;
            continue;
        }
        occluders_.append(occluder);
    }

    std::stable_sort(occluders_.begin(), occluders_.end(), [](const Occluder& a, const Occluder& b) {
        return a.zIndex < b.zIndex;
    });
    qDebug() << "OccluderSet: built" << occluders_.size() << "occluders," << skipped_ << "skipped";
    return occluders_.size();
}

QVector<int> OccluderSet::occludersAbove(int zIndex, const QRectF& bounds) const {
    QVector<int> result;
    for (int i = 0; i < occluders_.size(); ++i) {
        const Occluder& occluder = occluders_.at(i);
        if (occluder.zIndex <= zIndex) continue;
        if (!boundsOverlap(occluder.bounds, bounds)) continue;
        result.append(i);
    }
    return result;
}

bool OccluderSet::covers(int index, const QPointF& point) const {
    const Occluder& occluder = occluders_.at(index);
    if (point.x() < occluder.bounds.left() || point.x() > occluder.bounds.right()
        || point.y() < occluder.bounds.top() || point.y() > occluder.bounds.bottom()) {
        return false;
    }
    int winding = 0;
    for (const QPolygonF& contour : occluder.contours) {
        winding += GeometryUtils::windingNumber(point, contour);
    }
    return winding != 0;
}

bool OccluderSet::covers(const QVector<int>& candidates, const QPointF& point) const {
    for (int index : candidates) {
        if (covers(index, point)) return true;
    }
    return false;
}

} // namespace Geometry
