#include "pathTypes.h"

#include <limits>

namespace Core {

PathCommand PathCommand::moveTo(const QPointF& p) {
    PathCommand cmd;
    cmd.type = Move;
    cmd.points[0] = p;
    return cmd;
}

PathCommand PathCommand::lineTo(const QPointF& p) {
    PathCommand cmd;
    cmd.type = Line;
    cmd.points[0] = p;
    return cmd;
}

PathCommand PathCommand::cubicTo(const QPointF& c1, const QPointF& c2, const QPointF& end) {
    PathCommand cmd;
    cmd.type = Cubic;
    cmd.points[0] = c1;
    cmd.points[1] = c2;
    cmd.points[2] = end;
    return cmd;
}

PathCommand PathCommand::close() {
    PathCommand cmd;
    cmd.type = Close;
    return cmd;
}

int PathCommand::pointCount(Type type) {
    switch (type) {
    case Move:
    case Line:
        return 1;
    case Cubic:
        return 3;
    case Close:
        return 0;
    }
    return 0;
}

int PathCommand::pointCount() const {
    return pointCount(type);
}

QChar PathCommand::tag() const {
    switch (type) {
    case Move: return QLatin1Char('M');
    case Line: return QLatin1Char('L');
    case Cubic: return QLatin1Char('C');
    case Close: return QLatin1Char('Z');
    }
    return QChar();
}

bool PathCommand::typeFromTag(QChar tag, Type* type) {
    Type t;
    switch (tag.unicode()) {
    case 'M': t = Move; break;
    case 'L': t = Line; break;
    case 'C': t = Cubic; break;
    case 'Z': t = Close; break;
    default:
        return false;
    }
    if (type) *type = t;
    return true;
}

// Exact comparison: round trips through the codec must be bit-for-bit.
bool PathCommand::operator==(const PathCommand& other) const {
    if (type != other.type) return false;
    const int n = pointCount();
    for (int i = 0; i < n; ++i) {
        if (points[i].x() != other.points[i].x() || points[i].y() != other.points[i].y())
            return false;
    }
    return true;
}

QList<Path> Path::subpaths() const {
    QList<Path> result;
    Path current;
    for (const PathCommand& cmd : commands) {
        if (cmd.type == PathCommand::Move) {
            if (!current.isEmpty()) result.append(current);
            current = Path();
        } else if (current.isEmpty()) {
            continue;
        }
        current.commands.append(cmd);
    }
    if (!current.isEmpty()) result.append(current);
    return result;
}

int Path::pointCount() const {
    int count = 0;
    for (const PathCommand& cmd : commands) count += cmd.pointCount();
    return count;
}

bool Path::isClosed() const {
    return !commands.isEmpty() && commands.last().type == PathCommand::Close;
}

QPointF Path::startPoint() const {
    for (const PathCommand& cmd : commands) {
        if (cmd.type == PathCommand::Move) return cmd.points[0];
    }
    return QPointF();
}

QRectF Path::controlBounds() const {
    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();
    bool any = false;
    for (const PathCommand& cmd : commands) {
        for (int i = 0; i < cmd.pointCount(); ++i) {
            const QPointF& p = cmd.points[i];
            minX = qMin(minX, p.x());
            minY = qMin(minY, p.y());
            maxX = qMax(maxX, p.x());
            maxY = qMax(maxY, p.y());
            any = true;
        }
    }
    if (!any) return QRectF();
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

QString Path::tags() const {
    QString result;
    result.reserve(commands.size());
    for (const PathCommand& cmd : commands) result.append(cmd.tag());
    return result;
}

SourceSegment SourceSegment::moveTo(const QPointF& p) {
    SourceSegment seg;
    seg.type = MoveTo;
    seg.points[0] = p;
    return seg;
}

SourceSegment SourceSegment::lineTo(const QPointF& p) {
    SourceSegment seg;
    seg.type = LineTo;
    seg.points[0] = p;
    return seg;
}

SourceSegment SourceSegment::quadTo(const QPointF& c, const QPointF& end) {
    SourceSegment seg;
    seg.type = QuadTo;
    seg.points[0] = c;
    seg.points[1] = end;
    return seg;
}

SourceSegment SourceSegment::cubicTo(const QPointF& c1, const QPointF& c2, const QPointF& end) {
    SourceSegment seg;
    seg.type = CubicTo;
    seg.points[0] = c1;
    seg.points[1] = c2;
    seg.points[2] = end;
    return seg;
}

SourceSegment SourceSegment::arcTo(const ArcParameters& arc, const QPointF& end) {
    SourceSegment seg;
    seg.type = ArcTo;
    seg.points[0] = end;
    seg.arc = arc;
    return seg;
}

SourceSegment SourceSegment::closePath() {
    SourceSegment seg;
    seg.type = ClosePath;
    return seg;
}

SourceOutline SourceOutline::fromSegments(const QVector<SourceSegment>& segments, const QTransform& transform) {
    SourceOutline outline;
    outline.kind = PathOutline;
    outline.segments = segments;
    outline.transform = transform;
    return outline;
}

SourceOutline SourceOutline::fromRect(const QRectF& rect, double rx, double ry, const QTransform& transform) {
    SourceOutline outline;
    outline.kind = RectOutline;
    outline.rect = rect;
    outline.cornerRx = rx;
    outline.cornerRy = ry;
    outline.transform = transform;
    return outline;
}

SourceOutline SourceOutline::fromEllipse(const QPointF& center, double rx, double ry, const QTransform& transform) {
    SourceOutline outline;
    outline.kind = EllipseOutline;
    outline.center = center;
    outline.radiusX = rx;
    outline.radiusY = ry;
    outline.transform = transform;
    return outline;
}

SourceOutline SourceOutline::fromLine(const QPointF& p1, const QPointF& p2, const QTransform& transform) {
    SourceOutline outline;
    outline.kind = LineOutline;
    outline.points << p1 << p2;
    outline.transform = transform;
    return outline;
}

SourceOutline SourceOutline::fromPolyline(const QPolygonF& points, const QTransform& transform) {
    SourceOutline outline;
    outline.kind = PolylineOutline;
    outline.points = points;
    outline.transform = transform;
    return outline;
}

SourceOutline SourceOutline::fromPolygon(const QPolygonF& points, const QTransform& transform) {
    SourceOutline outline;
    outline.kind = PolygonOutline;
    outline.points = points;
    outline.transform = transform;
    return outline;
}

SourceOutline SourceOutline::fromPath(const Path& path, const QTransform& transform) {
    QVector<SourceSegment> segments;
    segments.reserve(path.size());
    for (const PathCommand& cmd : path.commands) {
        switch (cmd.type) {
        case PathCommand::Move:
            segments.append(SourceSegment::moveTo(cmd.points[0]));
            break;
        case PathCommand::Line:
            segments.append(SourceSegment::lineTo(cmd.points[0]));
            break;
        case PathCommand::Cubic:
            segments.append(SourceSegment::cubicTo(cmd.points[0], cmd.points[1], cmd.points[2]));
            break;
        case PathCommand::Close:
            segments.append(SourceSegment::closePath());
            break;
        }
    }
    return fromSegments(segments, transform);
}

} // namespace Core
