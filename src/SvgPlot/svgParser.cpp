#include "svgParser.h"
#include <QDomDocument>
#include <QDomNodeList>
#include <QLocale>
#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QSet>
#include <QStringList>
#include <QtMath>
#include <QDebug>
#include <qnumeric.h>

// Helper for parsing doubles, robust to locale
static double toDouble(const QString& str, bool* ok = nullptr) {
    QLocale cLocale(QLocale::C);
    return cLocale.toDouble(str.trimmed(), ok);
}

namespace {

// Elements whose children are never rendered directly.
const QSet<QString>& nonRenderedElements() {
    static const QSet<QString> names = {
        QStringLiteral("defs"), QStringLiteral("symbol"), QStringLiteral("clippath"), QStringLiteral("mask"),
        QStringLiteral("marker"), QStringLiteral("pattern"), QStringLiteral("lineargradient"),
        QStringLiteral("radialgradient"), QStringLiteral("filter"), QStringLiteral("style"),
        QStringLiteral("script"), QStringLiteral("title"), QStringLiteral("desc"), QStringLiteral("metadata")
    };
    return names;
}

// Cursor over SVG path data, number grammar as in SVG 1.1 BNF.
class PathDataReader {
public:
    explicit PathDataReader(const QString& data) : s(data), pos(0) {}

    void skipSpaces() {
        while (pos < s.size() && s.at(pos).isSpace()) ++pos;
    }

    void skipSpacesOrComma() {
        skipSpaces();
        if (pos < s.size() && s.at(pos) == QLatin1Char(',')) {
            ++pos;
            skipSpaces();
        }
    }

    bool atEnd() {
        skipSpaces();
        return pos >= s.size();
    }

    int position() const { return pos; }

    bool peekCommand(QChar* command) {
        skipSpaces();
        if (pos >= s.size()) return false;
        const QChar c = s.at(pos);
        // 'e'/'E' only occur inside numbers.
        if (c.isLetter() && c.toLower() != QLatin1Char('e')) {
            *command = c;
            return true;
        }
        return false;
    }

    void advance() { ++pos; }

    bool readNumber(double* value) {
        skipSpaces();
        const int begin = pos;
        if (pos < s.size() && (s.at(pos) == QLatin1Char('+') || s.at(pos) == QLatin1Char('-'))) ++pos;
        int digits = 0;
        while (pos < s.size() && s.at(pos).isDigit()) { ++pos; ++digits; }
        if (pos < s.size() && s.at(pos) == QLatin1Char('.')) {
            ++pos;
            while (pos < s.size() && s.at(pos).isDigit()) { ++pos; ++digits; }
        }
        if (digits == 0) {
            pos = begin;
            return false;
        }
        if (pos < s.size() && (s.at(pos) == QLatin1Char('e') || s.at(pos) == QLatin1Char('E'))) {
            int expPos = pos + 1;
            if (expPos < s.size() && (s.at(expPos) == QLatin1Char('+') || s.at(expPos) == QLatin1Char('-'))) ++expPos;
            if (expPos < s.size() && s.at(expPos).isDigit()) {
                pos = expPos;
                while (pos < s.size() && s.at(pos).isDigit()) ++pos;
            }
        }
        bool ok = false;
        *value = toDouble(s.mid(begin, pos - begin), &ok);
        if (!ok || !qIsFinite(*value)) {
            pos = begin;
            return false;
        }
        skipSpacesOrComma();
        return true;
    }

    // Arc flags may be written without separators ("a1 1 0 00 1 1").
    bool readFlag(bool* flag) {
        skipSpaces();
        if (pos >= s.size()) return false;
        const QChar c = s.at(pos);
        if (c != QLatin1Char('0') && c != QLatin1Char('1')) return false;
        *flag = (c == QLatin1Char('1'));
        ++pos;
        skipSpacesOrComma();
        return true;
    }

    bool readPoint(QPointF* p) {
        double x, y;
        if (!readNumber(&x) || !readNumber(&y)) return false;
        *p = QPointF(x, y);
        return true;
    }

private:
    const QString& s;
    int pos;
};

QPointF reflect(const QPointF& control, const QPointF& around) {
    return around * 2.0 - control;
}

} // namespace


SvgParser::SvgParser() {
    // Default config is set by Config()
}

void SvgParser::setConfig(const Config& config) {
    currentConfig = config;
}

double SvgParser::parseLength(const QString& lengthStr, double dpi, bool* ok) {
    QString str = lengthStr.trimmed();
    double factor = 1.0;
    static const struct { const char* unit; double perInch; } units[] = {
        { "px", 0.0 }, { "pt", 72.0 }, { "pc", 6.0 }, { "mm", 25.4 }, { "cm", 2.54 }, { "in", 1.0 }
    };
    for (const auto& u : units) {
        if (str.endsWith(QLatin1String(u.unit), Qt::CaseInsensitive)) {
            str.chop(2);
            factor = u.perInch > 0.0 ? dpi / u.perInch : 1.0;
            break;
        }
    }
    bool valid = false;
    const double value = toDouble(str, &valid);
    if (ok) *ok = valid && qIsFinite(value);
    return valid ? value * factor : 0.0;
}

bool SvgParser::parseViewBox(const QString& viewBoxStr, QRectF* viewBox) {
    const QStringList values = viewBoxStr.split(QRegularExpression("[\\s,]+"), Qt::SkipEmptyParts);
    if (values.size() != 4) return false;
    double vb[4] = { 0, 0, 0, 0 };
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        vb[i] = toDouble(values[i], &ok);
        if (!ok || !qIsFinite(vb[i])) return false;
    }
    if (!(vb[2] > 0) || !(vb[3] > 0)) return false;
    *viewBox = QRectF(vb[0], vb[1], vb[2], vb[3]);
    return true;
}

QTransform SvgParser::viewportTransform(const QDomElement& element, double dpi) {
    bool ok = false;
    double x = parseLength(element.attribute("x"), dpi, &ok);
    if (!ok) x = 0.0;
    double y = parseLength(element.attribute("y"), dpi, &ok);
    if (!ok) y = 0.0;

    QRectF viewBox;
    if (!element.hasAttribute("viewBox")) return QTransform::fromTranslate(x, y);
    if (!parseViewBox(element.attribute("viewBox"), &viewBox)) {
        qWarning() << "Invalid viewBox attribute:" << element.attribute("viewBox");
        return QTransform::fromTranslate(x, y);
    }

    // Missing or percentage sizes keep the viewBox scale.
    bool okW = false, okH = false;
    double width = parseLength(element.attribute("width"), dpi, &okW);
    double height = parseLength(element.attribute("height"), dpi, &okH);
    if (!okW || width <= 0.0) width = viewBox.width();
    if (!okH || height <= 0.0) height = viewBox.height();

    double sx = width / viewBox.width();
    double sy = height / viewBox.height();

    const QStringList aspect = element.attribute("preserveAspectRatio").simplified().split(' ', Qt::SkipEmptyParts);
    QString align = aspect.value(0);
    if (align == QLatin1String("defer")) align = aspect.value(1);
    static const QRegularExpression alignPattern("^x(Min|Mid|Max)Y(Min|Mid|Max)$");
    if (align != QLatin1String("none") && !alignPattern.match(align).hasMatch()) align = QStringLiteral("xMidYMid");

    if (align != QLatin1String("none")) {
        const bool slice = aspect.contains(QStringLiteral("slice"));
        const double s = slice ? qMax(sx, sy) : qMin(sx, sy);
        sx = s;
        sy = s;
    }

    double tx = x - viewBox.x() * sx;
    double ty = y - viewBox.y() * sy;
    const double spareX = width - viewBox.width() * sx;
    const double spareY = height - viewBox.height() * sy;
    if (align.startsWith(QLatin1String("xMid"))) tx += spareX / 2.0;
    else if (align.startsWith(QLatin1String("xMax"))) tx += spareX;
    if (align.endsWith(QLatin1String("YMid"))) ty += spareY / 2.0;
    else if (align.endsWith(QLatin1String("YMax"))) ty += spareY;

    return QTransform(sx, 0.0, 0.0, sy, tx, ty);
}

QTransform SvgParser::parseTransform(const QString& transformString) {
    QTransform transform;
    QRegularExpression re("([A-Za-z]+)\\s*\\(([^)]*)\\)");
    QRegularExpressionMatchIterator it = re.globalMatch(transformString);

    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();
        QString type = match.captured(1).toLower();
        QStringList params = match.captured(2).split(QRegularExpression("[\\s,]+"), Qt::SkipEmptyParts);

        QVector<double> v;
        bool allOk = true;
        for (const QString& p : params) {
            bool ok = false;
            v.append(toDouble(p, &ok));
            allOk = allOk && ok;
        }
        if (!allOk) {
            qWarning() << "SvgParser: malformed transform parameters:" << type << params;
            continue;
        }

        if (type == "matrix" && v.size() == 6) {
            transform = QTransform(v[0], v[1], v[2], v[3], v[4], v[5]) * transform;
        } else if (type == "translate" && (v.size() == 1 || v.size() == 2)) {
            transform.translate(v[0], v.size() > 1 ? v[1] : 0.0);
        } else if (type == "scale" && (v.size() == 1 || v.size() == 2)) {
            transform.scale(v[0], v.size() > 1 ? v[1] : v[0]);
        } else if (type == "rotate" && (v.size() == 1 || v.size() == 3)) {
            if (v.size() == 3) { // Rotate around (cx, cy)
                transform.translate(v[1], v[2]);
                transform.rotate(v[0]);
                transform.translate(-v[1], -v[2]);
            } else {
                transform.rotate(v[0]);
            }
        } else if (type == "skewx" && v.size() == 1) {
            transform.shear(qTan(qDegreesToRadians(v[0])), 0);
        } else if (type == "skewy" && v.size() == 1) {
            transform.shear(0, qTan(qDegreesToRadians(v[0])));
        } else {
            qWarning() << "SvgParser: unsupported or malformed transform function:" << type << params;
        }
    }
    return transform;
}

bool SvgParser::parsePathData(const QString& d, QVector<Core::SourceSegment>* segments, QString* errorMessage) {
    PathDataReader reader(d);
    QPointF current(0.0, 0.0);
    QPointF subpathStart(0.0, 0.0);
    QPointF lastCubicControl;
    QPointF lastQuadControl;
    QChar command;
    QChar previous;

    auto fail = [&](const QString& message) {
        if (errorMessage) *errorMessage = QStringLiteral("%1 at offset %2").arg(message).arg(reader.position());
        return false;
    };

    while (!reader.atEnd()) {
        QChar next;
        if (reader.peekCommand(&next)) {
            reader.advance();
            command = next;
        } else if (command.isNull()) {
            return fail(QStringLiteral("path data does not start with a command"));
        } else if (command == QLatin1Char('Z') || command == QLatin1Char('z')) {
            return fail(QStringLiteral("unexpected number after close"));
        }
        // else: implicit repetition of the previous command

        if (segments->isEmpty() && command.toUpper() != QLatin1Char('M')) {
            return fail(QStringLiteral("path data must start with a move"));
        }

        const bool relative = command.isLower();
        const QPointF base = relative ? current : QPointF(0.0, 0.0);

        switch (command.toUpper().unicode()) {
        case 'M': {
            QPointF p;
            if (!reader.readPoint(&p)) return fail(QStringLiteral("expected coordinates for move"));
            current = subpathStart = base + p;
            segments->append(Core::SourceSegment::moveTo(current));
            // Further coordinate pairs are implicit lines.
            command = relative ? QLatin1Char('l') : QLatin1Char('L');
            previous = QLatin1Char('M');
            continue;
        }
        case 'Z':
            segments->append(Core::SourceSegment::closePath());
            current = subpathStart;
            break;
        case 'L': {
            QPointF p;
            if (!reader.readPoint(&p)) return fail(QStringLiteral("expected coordinates for line"));
            current = base + p;
            segments->append(Core::SourceSegment::lineTo(current));
            break;
        }
        case 'H': {
            double x;
            if (!reader.readNumber(&x)) return fail(QStringLiteral("expected coordinate for horizontal line"));
            current = QPointF(relative ? current.x() + x : x, current.y());
            segments->append(Core::SourceSegment::lineTo(current));
            break;
        }
        case 'V': {
            double y;
            if (!reader.readNumber(&y)) return fail(QStringLiteral("expected coordinate for vertical line"));
            current = QPointF(current.x(), relative ? current.y() + y : y);
            segments->append(Core::SourceSegment::lineTo(current));
            break;
        }
        case 'C': {
            QPointF c1, c2, p;
            if (!reader.readPoint(&c1) || !reader.readPoint(&c2) || !reader.readPoint(&p))
                return fail(QStringLiteral("expected coordinates for cubic curve"));
            lastCubicControl = base + c2;
            current = base + p;
            segments->append(Core::SourceSegment::cubicTo(base + c1, lastCubicControl, current));
            break;
        }
        case 'S': {
            QPointF c2, p;
            if (!reader.readPoint(&c2) || !reader.readPoint(&p))
                return fail(QStringLiteral("expected coordinates for smooth cubic curve"));
            const QChar prev = previous.toUpper();
            const QPointF c1 = (prev == QLatin1Char('C') || prev == QLatin1Char('S'))
                                   ? reflect(lastCubicControl, current) : current;
            lastCubicControl = base + c2;
            current = base + p;
            segments->append(Core::SourceSegment::cubicTo(c1, lastCubicControl, current));
            break;
        }
        case 'Q': {
            QPointF c, p;
            if (!reader.readPoint(&c) || !reader.readPoint(&p))
                return fail(QStringLiteral("expected coordinates for quadratic curve"));
            lastQuadControl = base + c;
            current = base + p;
            segments->append(Core::SourceSegment::quadTo(lastQuadControl, current));
            break;
        }
        case 'T': {
            QPointF p;
            if (!reader.readPoint(&p)) return fail(QStringLiteral("expected coordinates for smooth quadratic curve"));
            const QChar prev = previous.toUpper();
            lastQuadControl = (prev == QLatin1Char('Q') || prev == QLatin1Char('T'))
                                  ? reflect(lastQuadControl, current) : current;
            current = base + p;
            segments->append(Core::SourceSegment::quadTo(lastQuadControl, current));
            break;
        }
        case 'A': {
            Core::ArcParameters arc;
            QPointF p;
            if (!reader.readNumber(&arc.rx) || !reader.readNumber(&arc.ry) || !reader.readNumber(&arc.xAxisRotation)
                || !reader.readFlag(&arc.largeArc) || !reader.readFlag(&arc.sweep) || !reader.readPoint(&p)) {
                return fail(QStringLiteral("expected parameters for arc"));
            }
            current = base + p;
            segments->append(Core::SourceSegment::arcTo(arc, current));
            break;
        }
        default:
            return fail(QStringLiteral("unknown path command '%1'").arg(command));
        }
        previous = command;
    }
    return true;
}

QHash<QString, QString> SvgParser::presentation(const QDomElement& element) {
    static const QStringList names = {
        "fill", "stroke", "fill-rule", "fill-opacity", "opacity", "visibility", "display"
    };
    QHash<QString, QString> properties;
    for (const QString& name : names) {
        if (element.hasAttribute(name)) properties.insert(name, element.attribute(name).trimmed());
    }
    const QStringList declarations = element.attribute("style").split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString& declaration : declarations) {
        const int colon = declaration.indexOf(QLatin1Char(':'));
        if (colon <= 0) continue;
        const QString name = declaration.left(colon).trimmed().toLower();
        QString value = declaration.mid(colon + 1).trimmed();
        value.remove(QRegularExpression("\\s*!important$"));
        if (names.contains(name)) properties.insert(name, value);
    }
    return properties;
}

SvgParser::Style SvgParser::resolveStyle(const QHash<QString, QString>& properties, const Style& parent) {
    Style style = parent;
    // opacity is not inherited, it only accumulates down the tree.
    style.opacity = parent.opacity;

    auto value = [&](const char* name) -> QString {
        const QString v = properties.value(QLatin1String(name));
        return v == QLatin1String("inherit") ? QString() : v;
    };

    const QString fill = value("fill");
    if (!fill.isEmpty()) style.hasFill = fill.compare(QLatin1String("none"), Qt::CaseInsensitive) != 0
                                         && fill.compare(QLatin1String("transparent"), Qt::CaseInsensitive) != 0;
    const QString stroke = value("stroke");
    if (!stroke.isEmpty()) style.hasStroke = stroke.compare(QLatin1String("none"), Qt::CaseInsensitive) != 0
                                             && stroke.compare(QLatin1String("transparent"), Qt::CaseInsensitive) != 0;
    const QString fillRule = value("fill-rule");
    if (fillRule == QLatin1String("evenodd")) style.fillRule = Qt::OddEvenFill;
    else if (fillRule == QLatin1String("nonzero")) style.fillRule = Qt::WindingFill;

    bool ok = false;
    const QString fillOpacity = value("fill-opacity");
    if (!fillOpacity.isEmpty()) {
        const double v = toDouble(fillOpacity, &ok);
        if (ok) style.fillOpacity = qBound(0.0, v, 1.0);
    }
    const QString opacity = value("opacity");
    if (!opacity.isEmpty()) {
        const double v = toDouble(opacity, &ok);
        if (ok) style.opacity = parent.opacity * qBound(0.0, v, 1.0);
    }
    const QString visibility = value("visibility");
    if (visibility == QLatin1String("hidden") || visibility == QLatin1String("collapse")) style.visible = false;
    else if (visibility == QLatin1String("visible")) style.visible = true;
    return style;
}

bool SvgParser::load(const QByteArray& svgData, Core::Document* document, QString* errorMessage) {
    QDomDocument doc;
    QString errorMsg;
    int errorLine = 0, errorColumn = 0;
    if (!doc.setContent(svgData, &errorMsg, &errorLine, &errorColumn)) {
        qWarning() << "Failed to parse SVG content:" << errorMsg << "at line" << errorLine << "column" << errorColumn;
        if (errorMessage) *errorMessage = QStringLiteral("%1 at line %2, column %3").arg(errorMsg).arg(errorLine).arg(errorColumn);
        return false;
    }

    QDomElement root = doc.documentElement();
    if (root.tagName().toLower() != "svg") {
        qWarning() << "Root element is not <svg>";
        if (errorMessage) *errorMessage = QStringLiteral("root element is <%1>, not <svg>").arg(root.tagName());
        return false;
    }

    Core::Document result;
    QTransform initialTransform;
    bool hasViewBox = false;

    const QString viewBoxStr = root.attribute("viewBox");
    if (!viewBoxStr.isEmpty()) {
        QRectF viewBox;
        if (parseViewBox(viewBoxStr, &viewBox)) {
            result.width = viewBox.width();
            result.height = viewBox.height();
            // Only the origin of the viewBox is applied, coordinates stay in viewBox units.
            initialTransform = QTransform::fromTranslate(-viewBox.x(), -viewBox.y());
            hasViewBox = true;
        } else {
            qWarning() << "Invalid viewBox attribute:" << viewBoxStr;
        }
    }
    if (!hasViewBox) {
        bool okW = false, okH = false;
        const double w = parseLength(root.attribute("width"), currentConfig.dpi, &okW);
        const double h = parseLength(root.attribute("height"), currentConfig.dpi, &okH);
        if (okW && okH && w > 0 && h > 0) {
            result.width = w;
            result.height = h;
        } else {
            qWarning() << "SvgParser: no usable viewBox or width/height, assuming 100 x 100";
            result.width = 100.0;
            result.height = 100.0;
        }
    }

    unnamedCount = 0;
    const Style rootStyle;
    walk(root, initialTransform, rootStyle, &result);

    qDebug() << "SvgParser: loaded" << result.shapes.size() << "shapes, viewbox" << result.width << "x" << result.height;
    *document = result;
    return true;
}

void SvgParser::walk(const QDomElement& element, const QTransform& parentTransform, const Style& parentStyle, Core::Document* document) {
    if (element.isNull()) return;

    const QString tagName = element.tagName().toLower();
    if (nonRenderedElements().contains(tagName)) return;

    const QHash<QString, QString> properties = presentation(element);
    if (properties.value("display") == QLatin1String("none")) return;

    QTransform currentTransform = parentTransform;
    if (element.hasAttribute("transform")) {
        currentTransform = parseTransform(element.attribute("transform")) * parentTransform; // Order: local then parent
    }
    if (tagName == "svg" && !element.parentNode().isDocument()) {
        currentTransform = viewportTransform(element, currentConfig.dpi) * currentTransform;
    }
    const Style style = resolveStyle(properties, parentStyle);

    if (tagName == "svg" || tagName == "g" || tagName == "a" || tagName == "switch") {
        QDomNodeList children = element.childNodes();
        for (int i = 0; i < children.count(); ++i) {
            if (children.at(i).isElement()) {
                walk(children.at(i).toElement(), currentTransform, style, document);
            }
        }
    } else if (tagName == "rect" || tagName == "circle" || tagName == "ellipse" || tagName == "polygon"
               || tagName == "polyline" || tagName == "path" || tagName == "line") {
        addShape(element, currentTransform, style, document);
    } else {
        qWarning() << "SvgParser: unsupported element <" + tagName + "> skipped";
    }
}

void SvgParser::addShape(const QDomElement& element, const QTransform& transform, const Style& style, Core::Document* document) {
    if (!style.visible || style.opacity <= 0.0) return;

    const QString tagName = element.tagName().toLower();
    Core::SourceOutline outline;
    bool ok = false;
    if (tagName == "rect") {
        ok = outlineRect(element, transform, &outline);
    } else if (tagName == "circle") {
        ok = outlineCircle(element, transform, &outline);
    } else if (tagName == "ellipse") {
        ok = outlineEllipse(element, transform, &outline);
    } else if (tagName == "line") {
        ok = outlineLine(element, transform, &outline);
    } else if (tagName == "polyline") {
        ok = outlinePoints(element, transform, false, &outline);
    } else if (tagName == "polygon") {
        ok = outlinePoints(element, transform, true, &outline);
    } else if (tagName == "path") {
        ok = outlinePath(element, transform, &outline);
    }
    if (!ok) return;

    Core::Shape shape;
    shape.id = element.attribute("id");
    if (shape.id.isEmpty()) {
        shape.id = QString("%1_%2").arg(tagName).arg(unnamedCount++);
    }
    shape.outline = outline;
    shape.zIndex = document->shapes.size();
    shape.hasFill = style.hasFill && style.fillOpacity > 0.0;
    shape.fillRule = style.fillRule;
    shape.strokeSelected = currentConfig.strokeSelection == AllShapes || style.hasStroke;
    document->shapes.append(shape);
}

bool SvgParser::outlineRect(const QDomElement& rectElement, const QTransform& transform, Core::SourceOutline* outline) const {
    bool okX, okY, okW, okH;
    double x = toDouble(rectElement.attribute("x", "0"), &okX);
    double y = toDouble(rectElement.attribute("y", "0"), &okY);
    double w = toDouble(rectElement.attribute("width", "0"), &okW);
    double h = toDouble(rectElement.attribute("height", "0"), &okH);

    if (!okX || !okY || !okW || !okH || w <= 0 || h <= 0) {
        qWarning() << "Invalid rect attributes for element ID:" << rectElement.attribute("id");
        return false;
    }

    bool okRx = true, okRy = true;
    const bool hasRx = rectElement.hasAttribute("rx");
    const bool hasRy = rectElement.hasAttribute("ry");
    double rx = hasRx ? toDouble(rectElement.attribute("rx"), &okRx) : 0.0;
    double ry = hasRy ? toDouble(rectElement.attribute("ry"), &okRy) : 0.0;
    if (!okRx || !okRy || rx < 0 || ry < 0) {
        qWarning() << "Invalid rect corner radii for element ID:" << rectElement.attribute("id") << "- using square corners";
        rx = ry = 0.0;
    } else if (hasRx && !hasRy) {
        ry = rx;
    } else if (hasRy && !hasRx) {
        rx = ry;
    }

    *outline = Core::SourceOutline::fromRect(QRectF(x, y, w, h), rx, ry, transform);
    return true;
}

bool SvgParser::outlineCircle(const QDomElement& circleElement, const QTransform& transform, Core::SourceOutline* outline) const {
    bool okCX, okCY, okR;
    double cx = toDouble(circleElement.attribute("cx", "0"), &okCX);
    double cy = toDouble(circleElement.attribute("cy", "0"), &okCY);
    double r  = toDouble(circleElement.attribute("r", "0"), &okR);

    if (!okCX || !okCY || !okR || r <= 0) {
        qWarning() << "Invalid circle attributes for element ID:" << circleElement.attribute("id");
        return false;
    }
    *outline = Core::SourceOutline::fromEllipse(QPointF(cx, cy), r, r, transform);
    return true;
}

bool SvgParser::outlineEllipse(const QDomElement& ellipseElement, const QTransform& transform, Core::SourceOutline* outline) const {
    bool okCX, okCY, okRX, okRY;
    double cx = toDouble(ellipseElement.attribute("cx", "0"), &okCX);
    double cy = toDouble(ellipseElement.attribute("cy", "0"), &okCY);
    double rx = toDouble(ellipseElement.attribute("rx", "0"), &okRX);
    double ry = toDouble(ellipseElement.attribute("ry", "0"), &okRY);

    if (!okCX || !okCY || !okRX || !okRY || rx <= 0 || ry <= 0) {
        qWarning() << "Invalid ellipse attributes for element ID:" << ellipseElement.attribute("id");
        return false;
    }
    *outline = Core::SourceOutline::fromEllipse(QPointF(cx, cy), rx, ry, transform);
    return true;
}

bool SvgParser::outlineLine(const QDomElement& lineElement, const QTransform& transform, Core::SourceOutline* outline) const {
    bool okX1, okY1, okX2, okY2;
    double x1 = toDouble(lineElement.attribute("x1", "0"), &okX1);
    double y1 = toDouble(lineElement.attribute("y1", "0"), &okY1);
    double x2 = toDouble(lineElement.attribute("x2", "0"), &okX2);
    double y2 = toDouble(lineElement.attribute("y2", "0"), &okY2);

    if(!okX1 || !okY1 || !okX2 || !okY2){
        qWarning() << "Invalid line attributes for element ID:" << lineElement.attribute("id");
        return false;
    }
    *outline = Core::SourceOutline::fromLine(QPointF(x1, y1), QPointF(x2, y2), transform);
    return true;
}

bool SvgParser::outlinePoints(const QDomElement& element, const QTransform& transform, bool closed, Core::SourceOutline* outline) const {
    QStringList values = element.attribute("points").split(QRegularExpression("[\\s,]+"), Qt::SkipEmptyParts);
    if (values.size() % 2 != 0) {
        qWarning() << "Odd number of coordinates in points of element ID:" << element.attribute("id") << "- last value ignored";
        values.removeLast();
    }

    QPolygonF points;
    for (int i = 0; i + 1 < values.size(); i += 2) {
        bool okX, okY;
        double x = toDouble(values[i], &okX);
        double y = toDouble(values[i+1], &okY);
        if (!okX || !okY) {
            // Rendering stops at the first bad pair.
            qWarning() << "Invalid point in points string:" << values[i] << "," << values[i+1];
            break;
        }
        points.append(QPointF(x, y));
    }
    if (points.size() < 2) {
        qWarning() << "Not enough points for element ID:" << element.attribute("id");
        return false;
    }
    *outline = closed ? Core::SourceOutline::fromPolygon(points, transform)
                      : Core::SourceOutline::fromPolyline(points, transform);
    return true;
}

bool SvgParser::outlinePath(const QDomElement& pathElement, const QTransform& transform, Core::SourceOutline* outline) const {
    const QString d = pathElement.attribute("d");
    QVector<Core::SourceSegment> segments;
    QString error;
    if (!parsePathData(d, &segments, &error)) {
        qWarning() << "Path data error for element ID:" << pathElement.attribute("id") << ":" << error
                   << "- keeping" << segments.size() << "segments";
    }
    if (segments.isEmpty()) return false;
    *outline = Core::SourceOutline::fromSegments(segments, transform);
    return true;
}
