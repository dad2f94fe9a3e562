#ifndef MARIONETTE_TYPES_H
#define MARIONETTE_TYPES_H

#include <string>

namespace marionette {

// How the converter treats a lone capslock key
enum class CapsLockMode {
    SESSION,  // tracked in a virtual flag, text is upper-cased by the converter
    SYSTEM    // forwarded to the OS as a real key press
};

std::string capsLockModeToString(CapsLockMode mode);

/**
 * @brief Conversion settings, fixed for the lifetime of a converter
 *
 * Display changes go through the converter's scaler, never through this record.
 */
struct ConverterConfig {
    int targetWidth = 1920;
    int targetHeight = 1080;
    double dragDuration = 0.5;
    int scrollAmount = 2;
    double waitDuration = 1.0;
    double hotkeyInterval = 0.1;
    CapsLockMode capslockMode = CapsLockMode::SESSION;
    bool strictCoordinateValidation = false;
};

/**
 * @brief A physical display the commands are aimed at
 */
struct Screen {
    std::string name;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    bool primary = false;
};

} // namespace marionette

#endif // MARIONETTE_TYPES_H
