#include "canonicalCodec.h"

#include <QDebug>
#include <qnumeric.h>
#include <QList>
#include <QLocale>
#include <QStringList>
#include <QtMath>
#include <cmath>
#include <limits>

namespace Codec {

namespace {

const char* const kHeaderFields[4] = { "viewbox_width", "viewbox_height", "command_count", "coordinate_count" };

bool fail(FormatError* error, FormatError::ErrorCode code, const QString& field, const QString& message) {
    if (error) {
        error->error = code;
        error->field = field;
        error->message = message;
    }
    qDebug() << "CanonicalCodec: decode failed on" << field << "-" << message;
    return false;
}

// Line i of data without a trailing carriage return.
QByteArray lineAt(const QList<QByteArray>& lines, int i) {
    QByteArray line = lines.value(i);
    if (line.endsWith('\r')) line.chop(1);
    return line;
}

QList<QByteArray> splitFields(const QByteArray& line) {
    const QByteArray trimmed = line.simplified();
    if (trimmed.isEmpty()) return QList<QByteArray>();
    return trimmed.split(' ');
}

} // namespace

QString FormatError::errorString() const {
    if (error == NoError) return QStringLiteral("no error");
    return QStringLiteral("%1: %2").arg(field, message);
}

QVector<double> CanonicalStream::coordinates() const {
    QVector<double> result;
    result.reserve(coordinateCount());
    for (const Core::PathCommand& cmd : commands.commands) {
        for (int i = 0; i < cmd.pointCount(); ++i) {
            result.append(cmd.points[i].x());
            result.append(cmd.points[i].y());
        }
    }
    return result;
}

QString CanonicalCodec::formatCoordinate(double value) {
    return QString::number(value, 'g', QLocale::FloatingPointShortest);
}

quint32 CanonicalCodec::viewboxDimension(double value) {
    if (!qIsFinite(value) || value <= 0.0) return 0;
    const double rounded = std::ceil(value);
    if (rounded >= static_cast<double>(std::numeric_limits<quint32>::max()))
        return std::numeric_limits<quint32>::max();
    return static_cast<quint32>(rounded);
}

int CanonicalCodec::coordinatesRequired(const QString& tags) {
    int total = 0;
    for (const QChar c : tags) {
        Core::PathCommand::Type type;
        if (!Core::PathCommand::typeFromTag(c, &type)) return -1;
        total += 2 * Core::PathCommand::pointCount(type);
    }
    return total;
}

QByteArray CanonicalCodec::encode(const CanonicalStream& stream) {
    QStringList coords;
    coords.reserve(stream.coordinateCount());
    for (const Core::PathCommand& cmd : stream.commands.commands) {
        for (int i = 0; i < cmd.pointCount(); ++i) {
            coords << formatCoordinate(cmd.points[i].x()) << formatCoordinate(cmd.points[i].y());
        }
    }

    QString text = QStringLiteral("%1 %2 %3 %4\n")
                       .arg(stream.viewWidth)
                       .arg(stream.viewHeight)
                       .arg(stream.commandCount())
                       .arg(stream.coordinateCount());
    text += stream.tags();
    text += QLatin1Char('\n');
    text += coords.join(QLatin1Char(' '));
    text += QLatin1Char('\n');
    return text.toLatin1();
}

bool CanonicalCodec::decode(const QByteArray& data, CanonicalStream* stream, FormatError* error) {
    if (error) *error = FormatError();

    const QList<QByteArray> lines = data.split('\n');
    const QByteArray headerLine = lineAt(lines, 0);
    const QByteArray tagLine = lineAt(lines, 1);
    const QByteArray coordLine = lineAt(lines, 2);

    // Header
    const QList<QByteArray> header = splitFields(headerLine);
    if (header.size() != 4) {
        return fail(error, FormatError::HeaderFieldCount, QStringLiteral("header"),
                    QStringLiteral("expected 4 header fields, found %1").arg(header.size()));
    }
    quint32 values[4];
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        values[i] = header.at(i).toUInt(&ok);
        if (!ok) {
            return fail(error, FormatError::InvalidHeaderField, QString::fromLatin1(kHeaderFields[i]),
                        QStringLiteral("'%1' is not an unsigned integer").arg(QString::fromLatin1(header.at(i))));
        }
    }
    const quint32 commandCount = values[2];
    const quint32 coordinateCount = values[3];

    // Commands
    if (static_cast<quint32>(tagLine.size()) != commandCount) {
        return fail(error, FormatError::CommandCountMismatch, QStringLiteral("command_count"),
                    QStringLiteral("declared %1 commands, found %2 tags").arg(commandCount).arg(tagLine.size()));
    }
    QVector<Core::PathCommand::Type> types;
    types.reserve(tagLine.size());
    for (int i = 0; i < tagLine.size(); ++i) {
        Core::PathCommand::Type type;
        if (!Core::PathCommand::typeFromTag(QLatin1Char(tagLine.at(i)), &type)) {
            return fail(error, FormatError::InvalidCommandTag, QStringLiteral("commands"),
                        QStringLiteral("invalid command tag '%1' at position %2")
                            .arg(QString::fromLatin1(tagLine.mid(i, 1))).arg(i));
        }
        types.append(type);
    }
    if (!types.isEmpty() && types.first() != Core::PathCommand::Move) {
        return fail(error, FormatError::InvalidCommandSequence, QStringLiteral("commands"),
                    QStringLiteral("the first command must be M"));
    }

    // Coordinates
    if (coordinateCount % 2 != 0) {
        return fail(error, FormatError::OddCoordinateCount, QStringLiteral("coordinate_count"),
                    QStringLiteral("coordinate count %1 is odd").arg(coordinateCount));
    }
    const int required = coordinatesRequired(QString::fromLatin1(tagLine));
    if (static_cast<quint32>(required) != coordinateCount) {
        return fail(error, FormatError::CoordinateCountMismatch, QStringLiteral("coordinate_count"),
                    QStringLiteral("commands require %1 coordinates, header declares %2").arg(required).arg(coordinateCount));
    }
    const QList<QByteArray> fields = splitFields(coordLine);
    if (static_cast<quint32>(fields.size()) != coordinateCount) {
        return fail(error, FormatError::CoordinateCountMismatch, QStringLiteral("coordinates"),
                    QStringLiteral("expected %1 coordinates, found %2").arg(coordinateCount).arg(fields.size()));
    }
    QVector<double> coords;
    coords.reserve(fields.size());
    for (int i = 0; i < fields.size(); ++i) {
        bool ok = false;
        const double v = fields.at(i).toDouble(&ok);
        if (!ok || !qIsFinite(v)) {
            return fail(error, FormatError::InvalidCoordinate, QStringLiteral("coordinates"),
                        QStringLiteral("'%1' at index %2 is not a finite number")
                            .arg(QString::fromLatin1(fields.at(i))).arg(i));
        }
        coords.append(v);
    }

    if (!stream) return true;

    CanonicalStream result;
    result.viewWidth = values[0];
    result.viewHeight = values[1];
    result.commands.commands.reserve(types.size());
    int k = 0;
    for (Core::PathCommand::Type type : types) {
        Core::PathCommand cmd;
        cmd.type = type;
        for (int i = 0; i < Core::PathCommand::pointCount(type); ++i) {
            cmd.points[i] = QPointF(coords.at(k), coords.at(k + 1));
            k += 2;
        }
        result.commands.commands.append(cmd);
    }
    *stream = result;
    return true;
}

} // namespace Codec
