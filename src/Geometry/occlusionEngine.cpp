#include "occlusionEngine.h"

#include <QtConcurrent/QtConcurrent>
#include <QDebug>
#include <QElapsedTimer>
#include <QFuture>
#include <QThreadPool>
#include <cmath>
#include <functional>

namespace Geometry {

QPointF OcclusionEngine::Element::point(double t) const {
    if (kind == CubicElement) return GeometryUtils::cubicPoint(cubic, t);
    if (t <= 0.0) return cubic.p0;
    if (t >= 1.0) return cubic.p3;
    return cubic.p0 + (cubic.p3 - cubic.p0) * t;
}

OcclusionEngine::OcclusionEngine() = default;

OcclusionEngine::OcclusionEngine(const Config& config) : config_(config) {
}

double OcclusionEngine::effectiveSampleSpacing(const Config& config, double viewWidth, double viewHeight) {
    const double diagonal = std::sqrt(viewWidth * viewWidth + viewHeight * viewHeight);
    const double scaled = config.sampleSpacingFraction * diagonal;
    if (!(scaled > 0.0)) return config.maxSampleSpacing;
    if (!(config.maxSampleSpacing > 0.0)) return scaled;
    return qMin(config.maxSampleSpacing, scaled);
}

QVector<OcclusionEngine::Element> OcclusionEngine::buildElements(const Core::Path& subpath) const {
    QVector<Element> elements;
    QPointF current;
    QPointF start;

    auto addLine = [&](const QPointF& from, const QPointF& to, bool closing) {
        Element el;
        el.kind = Element::LineElement;
        el.cubic.p0 = from;
        el.cubic.p3 = to;
        el.closing = closing;
        el.samples = GeometryUtils::lineSampleCount(GeometryUtils::distance(from, to),
                                                    config_.maxSampleSpacing, config_.maxCurveSamples);
        elements.append(el);
    };

    for (const Core::PathCommand& cmd : subpath.commands) {
        switch (cmd.type) {
        case Core::PathCommand::Move:
            current = start = cmd.points[0];
            break;
        case Core::PathCommand::Line:
            addLine(current, cmd.points[0], false);
            current = cmd.points[0];
            break;
        case Core::PathCommand::Cubic: {
            Element el;
            el.kind = Element::CubicElement;
            el.cubic = GeometryUtils::CubicSegment{ current, cmd.points[0], cmd.points[1], cmd.points[2] };
            el.samples = GeometryUtils::cubicSampleCount(el.cubic, config_.sampleTolerance,
                                                         config_.maxSampleSpacing, config_.maxCurveSamples);
            elements.append(el);
            current = cmd.points[2];
            break;
        }
        case Core::PathCommand::Close:
            addLine(current, start, true);
            current = start;
            break;
        }
    }
    return elements;
}

// Bisection between a covered and a visible parameter of one element. Returns
// the visible side of the final bracket.
double OcclusionEngine::refineCut(const Element& element, double coveredT, double visibleT,
                                  const OccluderSet& occluders, const QVector<int>& candidates) const {
    double c = coveredT;
    double v = visibleT;
    for (int i = 0; i < config_.refinementSteps; ++i) {
        const double mid = (c + v) / 2.0;
        if (occluders.covers(candidates, element.point(mid))) c = mid;
        else v = mid;
    }
    return v;
}

Core::Path OcclusionEngine::emitRun(const QVector<Element>& elements, const QVector<Piece>& pieces) const {
    Core::Path out;
    if (pieces.isEmpty()) return out;

    const Piece& first = pieces.first();
    out.moveTo(elements.at(first.element).point(first.a));

    for (const Piece& piece : pieces) {
        const Element& el = elements.at(piece.element);
        const bool whole = piece.a <= 0.0 && piece.b >= 1.0;

        if (el.kind == Element::LineElement) {
            out.lineTo(el.point(piece.b));
        } else if (whole) {
            out.cubicTo(el.cubic.c1, el.cubic.c2, el.cubic.p3);
        } else if (config_.cutPolicy == ParametricSubdivision) {
            const GeometryUtils::CubicSegment part = GeometryUtils::subCubic(el.cubic, piece.a, piece.b);
            out.cubicTo(part.c1, part.c2, part.p3);
        } else {
            const int n = el.samples;
            const int j0 = qRound(piece.a * n);
            const int j1 = qRound(piece.b * n);
            for (int j = j0 + 1; j <= j1; ++j) {
                out.lineTo(el.point(j == n ? 1.0 : static_cast<double>(j) / n));
            }
        }
    }
    return out;
}

QList<Core::Path> OcclusionEngine::cutSubpath(const Core::Path& subpath, const OccluderSet& occluders,
                                              const QVector<int>& candidates) const {
    QList<Core::Path> result;
    const QPointF start = subpath.startPoint();
    const QVector<Element> elements = buildElements(subpath);

    if (elements.isEmpty()) {
        if (!occluders.covers(candidates, start)) result.append(subpath);
        return result;
    }

    // Samples along the outline; sample k and k+1 bound edge k.
    QVector<QPointF> points;
    QVector<Edge> edges;
    points.append(start);
    for (int e = 0; e < elements.size(); ++e) {
        const int n = elements.at(e).samples;
        for (int j = 1; j <= n; ++j) {
            const double t0 = static_cast<double>(j - 1) / n;
            const double t1 = (j == n) ? 1.0 : static_cast<double>(j) / n;
            edges.append(Edge{ e, t0, t1 });
            points.append(elements.at(e).point(t1));
        }
    }

    QVector<bool> covered(points.size());
    for (int i = 0; i < points.size(); ++i) {
        covered[i] = occluders.covers(candidates, points.at(i));
    }

    const int edgeCount = edges.size();
    QVector<bool> visible(edgeCount);
    int visibleCount = 0;
    for (int k = 0; k < edgeCount; ++k) {
        visible[k] = !(covered.at(k) && covered.at(k + 1));
        if (visible.at(k)) ++visibleCount;
    }

    if (visibleCount == edgeCount) {
        result.append(subpath);
        return result;
    }
    if (visibleCount == 0) return result;

    // Maximal runs of visible edges. last may exceed edgeCount after a wrap-around merge.
    struct Run { int first; int last; };
    QVector<Run> runs;
    for (int k = 0; k < edgeCount; ++k) {
        if (!visible.at(k)) continue;
        int j = k;
        while (j + 1 < edgeCount && visible.at(j + 1)) ++j;
        runs.append(Run{ k, j });
        k = j;
    }

    const bool closed = subpath.isClosed();
    if (closed && runs.size() > 1 && runs.first().first == 0 && runs.last().last == edgeCount - 1) {
        const Run merged{ runs.last().first, runs.first().last + edgeCount };
        runs.removeFirst();
        runs.last() = merged;
    }

    for (const Run& run : runs) {
        QVector<Piece> pieces;
        for (int k = run.first; k <= run.last; ++k) {
            const Edge& edge = edges.at(k % edgeCount);
            if (!pieces.isEmpty() && pieces.last().element == edge.element && pieces.last().b == edge.t0) {
                pieces.last().b = edge.t1;
            } else {
                pieces.append(Piece{ edge.element, edge.t0, edge.t1 });
            }
        }

        if (config_.cutPolicy == ParametricSubdivision) {
            const bool cutStart = (closed || run.first > 0) && !visible.at((run.first - 1 + edgeCount) % edgeCount);
            const bool cutEnd = (closed || run.last < edgeCount - 1) && !visible.at((run.last + 1) % edgeCount);
            if (cutStart) {
                const Edge& edge = edges.at(run.first % edgeCount);
                pieces.first().a = refineCut(elements.at(edge.element), edge.t0, edge.t1, occluders, candidates);
            }
            if (cutEnd) {
                const Edge& edge = edges.at(run.last % edgeCount);
                pieces.last().b = refineCut(elements.at(edge.element), edge.t1, edge.t0, occluders, candidates);
            }
            if (pieces.size() == 1 && !(pieces.first().a < pieces.first().b)) continue;
        }

        result.append(emitRun(elements, pieces));
    }
    return result;
}

QList<Core::Path> OcclusionEngine::cutShape(const Core::FlattenedShape& shape, const OccluderSet& occluders) const {
    const QList<Core::Path> subpaths = shape.outline.subpaths();
    if (occluders.isEmpty() || subpaths.isEmpty()) return subpaths;

    const QVector<int> candidates = occluders.occludersAbove(shape.zIndex, shape.outline.controlBounds());
    if (candidates.isEmpty()) return subpaths;

    QList<Core::Path> result;
    for (const Core::Path& subpath : subpaths) {
        result += cutSubpath(subpath, occluders, candidates);
    }
    return result;
}

QList<OcclusionEngine::ShapeResult> OcclusionEngine::run(const QList<Core::FlattenedShape>& shapes,
                                                         const OccluderSet& occluders) const {
    QElapsedTimer timer;
    timer.start();

    QVector<int> strokeIndices;
    for (int i = 0; i < shapes.size(); ++i) {
        if (shapes.at(i).strokeSelected) strokeIndices.append(i);
    }

    std::function<ShapeResult(const int&)> mapFunction =
        [this, &shapes, &occluders](const int& index) -> ShapeResult {
        const Core::FlattenedShape& shape = shapes.at(index);
        ShapeResult res;
        res.id = shape.id;
        res.zIndex = shape.zIndex;
        res.subpaths = this->cutShape(shape, occluders);
        return res;
    };

    QList<ShapeResult> results;
    if (config_.threads == 1 || strokeIndices.size() < 2) {
        for (int index : strokeIndices) results.append(mapFunction(index));
    } else {
        // A thread cap only holds for this run; the global pool gets its previous cap back.
        QThreadPool* pool = QThreadPool::globalInstance();
        const int previousMaxThreads = pool->maxThreadCount();
        if (config_.threads > 1) pool->setMaxThreadCount(config_.threads);

        // The occluder snapshot is only read while the workers run.
        QFuture<ShapeResult> future = QtConcurrent::mapped(strokeIndices.constBegin(), strokeIndices.constEnd(), mapFunction);
        future.waitForFinished();
        results = future.results();

        if (config_.threads > 1) pool->setMaxThreadCount(previousMaxThreads);
    }

    qDebug() << "OcclusionEngine: cut" << strokeIndices.size() << "shapes against" << occluders.size()
             << "occluders in" << timer.elapsed() << "ms";
    return results;
}

} // namespace Geometry
