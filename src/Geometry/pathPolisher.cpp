#include "pathPolisher.h"
#include "geometryUtils.h"

#include <QDebug>
#include <cmath>

namespace Geometry {

PathPolisher::PathPolisher() = default;

PathPolisher::PathPolisher(const Config& config) : config_(config) {
}

double PathPolisher::effectiveMinLength(double viewWidth, double viewHeight) const {
    if (config_.minLength >= 0.0) return config_.minLength;
    const double diagonal = std::sqrt(viewWidth * viewWidth + viewHeight * viewHeight);
    return qMax(0.0, config_.minLengthFraction) * diagonal;
}

double PathPolisher::arcLength(const Core::Path& subpath) {
    double length = 0.0;
    QPointF current;
    QPointF start;
    for (const Core::PathCommand& cmd : subpath.commands) {
        switch (cmd.type) {
        case Core::PathCommand::Move:
            current = start = cmd.points[0];
            break;
        case Core::PathCommand::Line:
            length += GeometryUtils::distance(current, cmd.points[0]);
            current = cmd.points[0];
            break;
        case Core::PathCommand::Cubic:
            length += GeometryUtils::cubicLength(GeometryUtils::CubicSegment{ current, cmd.points[0], cmd.points[1], cmd.points[2] });
            current = cmd.points[2];
            break;
        case Core::PathCommand::Close:
            length += GeometryUtils::distance(current, start);
            current = start;
            break;
        }
    }
    return length;
}

QList<Core::Path> PathPolisher::polish(const QList<Core::Path>& subpaths, double minLength) {
    if (minLength <= 0.0) return subpaths;

    QList<Core::Path> result;
    for (const Core::Path& subpath : subpaths) {
        if (arcLength(subpath) < minLength) continue;
        result.append(subpath);
    }
    if (result.size() != subpaths.size()) {
        qDebug() << "PathPolisher: dropped" << subpaths.size() - result.size() << "of" << subpaths.size()
                 << "subpaths shorter than" << minLength;
    }
    return result;
}

QList<Core::Path> PathPolisher::polish(const QList<Core::Path>& subpaths, double viewWidth, double viewHeight) const {
    return polish(subpaths, effectiveMinLength(viewWidth, viewHeight));
}

} // namespace Geometry
