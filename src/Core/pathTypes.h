#ifndef PATHTYPES_H
#define PATHTYPES_H

#include <QChar>
#include <QList>
#include <QMetaType>
#include <QPointF>
#include <QPolygonF>
#include <QRectF>
#include <QString>
#include <QTransform>
#include <QVector>

namespace Core {

// One command of the canonical vocabulary. Cubic stores both control points
// followed by the endpoint; Move and Line only use points[0].
struct PathCommand {
    enum Type {
        Move,
        Line,
        Cubic,
        Close
    };

    Type type = Move;
    QPointF points[3];

    static PathCommand moveTo(const QPointF& p);
    static PathCommand lineTo(const QPointF& p);
    static PathCommand cubicTo(const QPointF& c1, const QPointF& c2, const QPointF& end);
    static PathCommand close();

    int pointCount() const;
    QChar tag() const;
    QPointF endPoint() const { return points[pointCount() > 0 ? pointCount() - 1 : 0]; }

    static int pointCount(Type type);
    static bool typeFromTag(QChar tag, Type* type);

    bool operator==(const PathCommand& other) const;
    bool operator!=(const PathCommand& other) const { return !(*this == other); }
};

class Path {
public:
    QVector<PathCommand> commands;

    Path() = default;
    explicit Path(const QVector<PathCommand>& cmds) : commands(cmds) {}

    bool isEmpty() const { return commands.isEmpty(); }
    int size() const { return commands.size(); }

    void moveTo(const QPointF& p) { commands.append(PathCommand::moveTo(p)); }
    void lineTo(const QPointF& p) { commands.append(PathCommand::lineTo(p)); }
    void cubicTo(const QPointF& c1, const QPointF& c2, const QPointF& end) { commands.append(PathCommand::cubicTo(c1, c2, end)); }
    void close() { commands.append(PathCommand::close()); }
    void append(const Path& other) { commands += other.commands; }

    // Splits the path at every Move. Commands that precede the first Move are dropped.
    QList<Path> subpaths() const;

    int pointCount() const;
    int coordinateCount() const { return 2 * pointCount(); }

    // True when the last command is Close.
    bool isClosed() const;

    // Start point of the first Move, (0,0) for an empty path.
    QPointF startPoint() const;

    // Control-polygon bounds, a superset of the exact curve bounds.
    QRectF controlBounds() const;

    QString tags() const;

    bool operator==(const Path& other) const { return commands == other.commands; }
    bool operator!=(const Path& other) const { return commands != other.commands; }
};

// SVG endpoint arc parameters. Rotation is in degrees.
struct ArcParameters {
    double rx = 0.0;
    double ry = 0.0;
    double xAxisRotation = 0.0;
    bool largeArc = false;
    bool sweep = false;
};

// Segment of a source path in absolute coordinates (before the outline transform).
struct SourceSegment {
    enum Type {
        MoveTo,
        LineTo,
        QuadTo,     // points[0] = control, points[1] = end
        CubicTo,    // points[0..1] = controls, points[2] = end
        ArcTo,      // points[0] = end
        ClosePath
    };

    Type type = MoveTo;
    QPointF points[3];
    ArcParameters arc;

    static SourceSegment moveTo(const QPointF& p);
    static SourceSegment lineTo(const QPointF& p);
    static SourceSegment quadTo(const QPointF& c, const QPointF& end);
    static SourceSegment cubicTo(const QPointF& c1, const QPointF& c2, const QPointF& end);
    static SourceSegment arcTo(const ArcParameters& arc, const QPointF& end);
    static SourceSegment closePath();
};

struct SourceOutline {
    enum Kind {
        PathOutline,
        RectOutline,
        EllipseOutline,
        LineOutline,
        PolylineOutline,
        PolygonOutline
    };

    Kind kind = PathOutline;
    QVector<SourceSegment> segments;    // PathOutline
    QRectF rect;                        // RectOutline
    double cornerRx = 0.0;
    double cornerRy = 0.0;
    QPointF center;                     // EllipseOutline
    double radiusX = 0.0;
    double radiusY = 0.0;
    QPolygonF points;                   // LineOutline (2 points), PolylineOutline, PolygonOutline
    QTransform transform;               // into viewbox space

    static SourceOutline fromSegments(const QVector<SourceSegment>& segments, const QTransform& transform = QTransform());
    static SourceOutline fromRect(const QRectF& rect, double rx = 0.0, double ry = 0.0, const QTransform& transform = QTransform());
    static SourceOutline fromEllipse(const QPointF& center, double rx, double ry, const QTransform& transform = QTransform());
    static SourceOutline fromLine(const QPointF& p1, const QPointF& p2, const QTransform& transform = QTransform());
    static SourceOutline fromPolyline(const QPolygonF& points, const QTransform& transform = QTransform());
    static SourceOutline fromPolygon(const QPolygonF& points, const QTransform& transform = QTransform());
    // Wraps an already canonical path (MoveTo/LineTo/CubicTo/ClosePath segments).
    static SourceOutline fromPath(const Path& path, const QTransform& transform = QTransform());
};

struct Shape {
    QString id;
    SourceOutline outline;
    int zIndex = 0;                 // paint order, higher paints on top
    bool strokeSelected = true;     // participates in stroke output
    bool hasFill = false;
    Qt::FillRule fillRule = Qt::WindingFill;
};

struct FlattenedShape {
    QString id;
    int zIndex = 0;
    bool strokeSelected = true;
    bool hasFill = false;
    Qt::FillRule fillRule = Qt::WindingFill;
    Path outline;
};

struct Document {
    double width = 0.0;
    double height = 0.0;
    QList<Shape> shapes;
};

} // namespace Core

Q_DECLARE_METATYPE(Core::Path)

#endif // PATHTYPES_H
