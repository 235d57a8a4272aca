#ifndef OCCLUDERSET_H
#define OCCLUDERSET_H

#include "pathTypes.h"

#include <QList>
#include <QPolygonF>
#include <QRectF>
#include <QString>
#include <QVector>

namespace Geometry {

// Read-only snapshot of every filled shape of a document, normalized once with
// Clipper2 and queried with a nonzero winding test.
class OccluderSet {
public:
    enum FillRulePolicy {
        NonZeroRule,    // every fill uses the nonzero rule
        EvenOddRule,    // every fill uses the even-odd rule
        ShapeRule       // each shape's declared fill-rule
    };

    struct Config {
        FillRulePolicy fillRule = NonZeroRule;
        double clipperScale = 1000000.0;
        double sampleTolerance = 0.01;  // chord deviation when polygonizing cubics
        int maxCurveSamples = 1024;
    };

    struct Occluder {
        QString id;
        int zIndex = 0;
        QRectF bounds;
        QVector<QPolygonF> contours;    // normalized, holes reversed
        double area = 0.0;
    };

    OccluderSet();
    explicit OccluderSet(const Config& config);

    const Config& config() const { return config_; }

    // Rebuilds the snapshot from the filled shapes of the list. Returns the number of occluders kept.
    int build(const QList<Core::FlattenedShape>& shapes);
    void clear();

    int size() const { return occluders_.size(); }
    bool isEmpty() const { return occluders_.isEmpty(); }
    const Occluder& at(int index) const { return occluders_.at(index); }
    const QVector<Occluder>& occluders() const { return occluders_; }

    // Fills that had no usable area and contribute no coverage.
    int skippedCount() const { return skipped_; }

    // Indices of occluders painted strictly above zIndex whose bounds touch bounds.
    QVector<int> occludersAbove(int zIndex, const QRectF& bounds) const;

    bool covers(int index, const QPointF& point) const;
    // True when at least one of the candidate occluders covers point.
    bool covers(const QVector<int>& candidates, const QPointF& point) const;

    // One closed polygon per contour; cubics are sampled within tolerance. Drawing
    // after a close starts a new contour at the subpath start.
    static QVector<QPolygonF> polygonize(const Core::Path& path, double tolerance, int maxCurveSamples);

    static bool boundsOverlap(const QRectF& a, const QRectF& b);

private:
    bool normalize(const Core::FlattenedShape& shape, Occluder* occluder) const;

    Config config_;
    QVector<Occluder> occluders_;
    int skipped_ = 0;
};

} // namespace Geometry

#endif // OCCLUDERSET_H
