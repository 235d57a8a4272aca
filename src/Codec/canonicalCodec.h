#ifndef CANONICALCODEC_H
#define CANONICALCODEC_H

#include "pathTypes.h"

#include <QByteArray>
#include <QString>
#include <QVector>

namespace Codec {

// Failure report of CanonicalCodec::decode. field names the violated part of
// the stream (header, viewbox_width, command_count, coordinates, ...).
struct FormatError {
    enum ErrorCode {
        NoError = 0,
        HeaderFieldCount,
        InvalidHeaderField,
        CommandCountMismatch,
        InvalidCommandTag,
        InvalidCommandSequence,
        OddCoordinateCount,
        CoordinateCountMismatch,
        InvalidCoordinate
    };

    ErrorCode error = NoError;
    QString field;
    QString message;

    bool isError() const { return error != NoError; }
    QString errorString() const;
};

// The persisted form: viewbox dimensions plus the flat command sequence.
struct CanonicalStream {
    quint32 viewWidth = 0;
    quint32 viewHeight = 0;
    Core::Path commands;

    int commandCount() const { return commands.size(); }
    int coordinateCount() const { return commands.coordinateCount(); }
    QString tags() const { return commands.tags(); }
    QVector<double> coordinates() const;
};

class CanonicalCodec {
public:
    // "W H ncmd ncoord\nTAGS\nx y x y ...\n"
    static QByteArray encode(const CanonicalStream& stream);

    // Returns false and fills error (when given) on any malformed input.
    // Lines after the coordinate line are ignored.
    static bool decode(const QByteArray& data, CanonicalStream* stream, FormatError* error = nullptr);

    // Number of coordinates the tag sequence consumes, -1 if a tag is unknown.
    static int coordinatesRequired(const QString& tags);

    // Shortest representation that parses back to the same double.
    static QString formatCoordinate(double value);

    // Rounds a viewbox dimension up to the unsigned integer written in the header.
    static quint32 viewboxDimension(double value);
};

} // namespace Codec

#endif // CANONICALCODEC_H
