#ifndef SVGWRITER_H
#define SVGWRITER_H

#include "canonicalCodec.h"

#include <QString>

namespace Codec {

// Renders a canonical stream back to an SVG document, one <path> per subpath.
class SvgWriter {
public:
    struct StrokeOptions {
        QString color = QStringLiteral("#000000");
        double width = 1.0;
    };

    static QString pathData(const Core::Path& path);
    static QString toSvg(const CanonicalStream& stream, const StrokeOptions& options = StrokeOptions());
};

} // namespace Codec

#endif // SVGWRITER_H
