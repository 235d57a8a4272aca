#include "svgWriter.h"

#include <QStringList>

namespace Codec {

namespace {

QString pointText(const QPointF& p) {
    return CanonicalCodec::formatCoordinate(p.x()) + QLatin1Char(' ') + CanonicalCodec::formatCoordinate(p.y());
}

} // namespace

QString SvgWriter::pathData(const Core::Path& path) {
    QStringList parts;
    for (const Core::PathCommand& cmd : path.commands) {
        switch (cmd.type) {
        case Core::PathCommand::Move:
            parts << QStringLiteral("M") + pointText(cmd.points[0]);
            break;
        case Core::PathCommand::Line:
            parts << QStringLiteral("L") + pointText(cmd.points[0]);
            break;
        case Core::PathCommand::Cubic:
            parts << QStringLiteral("C") + pointText(cmd.points[0]) + QLatin1Char(' ')
                         + pointText(cmd.points[1]) + QLatin1Char(' ') + pointText(cmd.points[2]);
            break;
        case Core::PathCommand::Close:
            parts << QStringLiteral("Z");
            break;
        }
    }
    return parts.join(QLatin1Char(' '));
}

QString SvgWriter::toSvg(const CanonicalStream& stream, const StrokeOptions& options) {
    QString svg;
    svg += QStringLiteral("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n");
    svg += QStringLiteral("<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" "
                          "width=\"%1\" height=\"%2\" viewBox=\"0 0 %1 %2\">\n")
               .arg(stream.viewWidth)
               .arg(stream.viewHeight);

    const QString color = options.color.toHtmlEscaped();
    const QString width = CanonicalCodec::formatCoordinate(options.width);
    for (const Core::Path& subpath : stream.commands.subpaths()) {
        svg += QStringLiteral("  <path d=\"%1\" fill=\"none\" stroke=\"%2\" stroke-width=\"%3\"/>\n")
                   .arg(pathData(subpath), color, width);
    }
    svg += QStringLiteral("</svg>\n");
    return svg;
}

} // namespace Codec
