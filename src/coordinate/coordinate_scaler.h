#ifndef MARIONETTE_COORDINATE_SCALER_H
#define MARIONETTE_COORDINATE_SCALER_H

#include <utility>
#include "../common/types.h"

namespace marionette {

/**
 * @brief Linear remap from a model coordinate space onto a target display
 *
 * The source extents are fixed per dialect (1000x1000, 1024x768, 999x999).
 * Target extents and origin can be changed in place when the display changes.
 */
class CoordinateScaler {
public:
    /**
     * @throws MarionetteException (VALIDATION_ERROR) when any extent is not positive
     */
    CoordinateScaler(int sourceWidth, int sourceHeight,
                     int targetWidth, int targetHeight,
                     int originX = 0, int originY = 0);

    /**
     * @brief Map a source point into target pixels
     *
     * Rounds half to even. Order of operations:
     *  1. strict: throw CoordinateRangeError when x or y lies outside [0, source]
     *  2. clamp: limit each axis to [0, target-1]
     *  3. preventCornerLock: move a value on the outer pixel border one pixel inward
     *  4. add the origin offset
     */
    std::pair<int, int> scale(double x, double y,
                              bool clamp = true,
                              bool preventCornerLock = false,
                              bool strict = false) const;

    void setTargetSize(int width, int height);
    void setOrigin(int x, int y);
    void applyScreen(const Screen& screen);

    int getSourceWidth() const { return m_sourceWidth; }
    int getSourceHeight() const { return m_sourceHeight; }
    int getTargetWidth() const { return m_targetWidth; }
    int getTargetHeight() const { return m_targetHeight; }
    int getOriginX() const { return m_originX; }
    int getOriginY() const { return m_originY; }
    double getScaleX() const { return m_scaleX; }
    double getScaleY() const { return m_scaleY; }

private:
    int m_sourceWidth;
    int m_sourceHeight;
    int m_targetWidth;
    int m_targetHeight;
    int m_originX;
    int m_originY;
    double m_scaleX;
    double m_scaleY;

    void updateScale();
    static int scaleAxis(double value, double factor, int target,
                         bool clamp, bool preventCornerLock);
};

} // namespace marionette

#endif // MARIONETTE_COORDINATE_SCALER_H
