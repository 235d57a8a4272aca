#ifndef PATHPOLISHER_H
#define PATHPOLISHER_H

#include "pathTypes.h"

#include <QList>

namespace Geometry {
    class PathPolisher {
    public:
        struct Config {
            double minLength = -1.0;            // absolute threshold, < 0 uses the fraction
            double minLengthFraction = 0.002;   // of the viewbox diagonal
        };

        PathPolisher();
        explicit PathPolisher(const Config& config);

        const Config& config() const { return config_; }

        double effectiveMinLength(double viewWidth, double viewHeight) const;

        // Drops every subpath shorter than minLength. Survivors are untouched.
        static QList<Core::Path> polish(const QList<Core::Path>& subpaths, double minLength);
        QList<Core::Path> polish(const QList<Core::Path>& subpaths, double viewWidth, double viewHeight) const;

        // Total length including the closing segment of Close.
        static double arcLength(const Core::Path& subpath);

    private:
        Config config_;
    };
}

#endif // PATHPOLISHER_H
