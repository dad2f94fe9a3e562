#include "coordinate_scaler.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include <algorithm>
#include <cmath>

namespace marionette {

CoordinateScaler::CoordinateScaler(int sourceWidth, int sourceHeight,
                                   int targetWidth, int targetHeight,
                                   int originX, int originY)
    : m_sourceWidth(sourceWidth)
    , m_sourceHeight(sourceHeight)
    , m_targetWidth(targetWidth)
    , m_targetHeight(targetHeight)
    , m_originX(originX)
    , m_originY(originY)
    , m_scaleX(1.0)
    , m_scaleY(1.0) {
    if (sourceWidth <= 0 || sourceHeight <= 0) {
        MARIONETTE_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::HIGH,
                         "Source extents must be positive",
                         std::to_string(sourceWidth) + "x" + std::to_string(sourceHeight),
                         "CoordinateScaler");
    }
    if (targetWidth <= 0 || targetHeight <= 0) {
        MARIONETTE_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::HIGH,
                         "Target extents must be positive",
                         std::to_string(targetWidth) + "x" + std::to_string(targetHeight),
                         "CoordinateScaler");
    }
    updateScale();
}

std::pair<int, int> CoordinateScaler::scale(double x, double y,
                                            bool clamp,
                                            bool preventCornerLock,
                                            bool strict) const {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        throw CoordinateRangeError("Coordinates must be finite numbers, got (" +
                                   utils::StringUtils::formatDecimal(x) + ", " +
                                   utils::StringUtils::formatDecimal(y) + ")");
    }

    if (strict) {
        if (!(x >= 0.0 && x <= static_cast<double>(m_sourceWidth))) {
            throw CoordinateRangeError(
                "x coordinate " + utils::StringUtils::formatDecimal(x) +
                " out of valid range [0, " + std::to_string(m_sourceWidth) + "]. "
                "Coordinates must be normalized between 0 and " + std::to_string(m_sourceWidth) + ".");
        }
        if (!(y >= 0.0 && y <= static_cast<double>(m_sourceHeight))) {
            throw CoordinateRangeError(
                "y coordinate " + utils::StringUtils::formatDecimal(y) +
                " out of valid range [0, " + std::to_string(m_sourceHeight) + "]. "
                "Coordinates must be normalized between 0 and " + std::to_string(m_sourceHeight) + ".");
        }
    }

    int scaledX = scaleAxis(x, m_scaleX, m_targetWidth, clamp, preventCornerLock);
    int scaledY = scaleAxis(y, m_scaleY, m_targetHeight, clamp, preventCornerLock);

    return {utils::StringUtils::saturateToInt(static_cast<double>(scaledX) + m_originX),
            utils::StringUtils::saturateToInt(static_cast<double>(scaledY) + m_originY)};
}

void CoordinateScaler::setTargetSize(int width, int height) {
    if (width <= 0 || height <= 0) {
        MARIONETTE_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::HIGH,
                         "Target extents must be positive",
                         std::to_string(width) + "x" + std::to_string(height),
                         "CoordinateScaler");
    }
    m_targetWidth = width;
    m_targetHeight = height;
    updateScale();
}

void CoordinateScaler::setOrigin(int x, int y) {
    m_originX = x;
    m_originY = y;
}

void CoordinateScaler::applyScreen(const Screen& screen) {
    setTargetSize(screen.width, screen.height);
    setOrigin(screen.x, screen.y);
}

void CoordinateScaler::updateScale() {
    m_scaleX = static_cast<double>(m_targetWidth) / static_cast<double>(m_sourceWidth);
    m_scaleY = static_cast<double>(m_targetHeight) / static_cast<double>(m_sourceHeight);
}

int CoordinateScaler::scaleAxis(double value, double factor, int target,
                                bool clamp, bool preventCornerLock) {
    // nearbyint honours the default round-to-nearest-even mode
    double scaled = std::nearbyint(value * factor);

    // Clamp in double so the int conversion is always in range
    if (clamp) {
        scaled = std::clamp(scaled, 0.0, static_cast<double>(target - 1));
    }
    int result = utils::StringUtils::saturateToInt(scaled);

    // Never land on the outermost pixel row or column
    if (preventCornerLock && target > 2) {
        if (result == 0) {
            result = 1;
        } else if (result == target - 1) {
            result = target - 2;
        }
    }

    return result;
}

} // namespace marionette
