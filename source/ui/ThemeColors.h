#ifndef THEMECOLORS_H
#define THEMECOLORS_H

#include <QColor>

/**
 * @brief Color palette shared by the page view and the thumbnail rail.
 *
 * Every function takes the dark-mode flag so light and dark themes stay
 * in one place. Widgets should use these instead of hardcoded colors.
 */
namespace ThemeColors {

// ============================================================================
// Base Gray Palette
// ============================================================================

// Dark mode grays (cool-tinted)
inline QColor darkPrimary()     { return QColor(0x2a, 0x2e, 0x32); }  // #2a2e32 - backgrounds
inline QColor darkTertiary()    { return QColor(0x4d, 0x4d, 0x4d); }  // #4d4d4d - borders

// Light mode grays
inline QColor lightPrimary()    { return QColor(0xF5, 0xF5, 0xF5); }  // #F5F5F5 - backgrounds
inline QColor lightTertiary()   { return QColor(0xD0, 0xD0, 0xD0); }  // #D0D0D0 - borders

inline QColor background(bool dark)     { return dark ? darkPrimary() : lightPrimary(); }
inline QColor border(bool dark)         { return dark ? darkTertiary() : lightTertiary(); }

// ============================================================================
// Text Colors
// ============================================================================

inline QColor textPrimary(bool dark)    { return dark ? QColor(240, 240, 240) : QColor(30, 30, 30); }
inline QColor textMuted(bool dark)      { return dark ? QColor(150, 150, 150) : QColor(120, 120, 120); }

// ============================================================================
// Pages
// ============================================================================

// Off-white paper, slightly warm
inline QColor paper(bool dark)          { return dark ? QColor(55, 55, 50) : QColor(250, 250, 245); }

// Gap between pages and files in the stacked view
inline QColor pageGutter(bool dark)     { return dark ? QColor(35, 35, 38) : QColor(200, 200, 205); }

// ============================================================================
// Navigation Feedback
// ============================================================================

// Current / active page border
inline QColor selectionBorder(bool dark){ return dark ? QColor(138, 180, 248) : QColor(26, 115, 232); }

// Short-lived glow on a page that navigation just reached
inline QColor navigationGlow(bool dark) { return dark ? QColor(255, 200, 50) : QColor(230, 160, 20); }

// Hover/selection behind thumbnails
inline QColor itemHover(bool dark)      { return dark ? QColor(50, 50, 55) : QColor(240, 245, 250); }
inline QColor itemSelected(bool dark)   { return dark ? QColor(60, 60, 65) : QColor(230, 240, 250); }

} // namespace ThemeColors

#endif // THEMECOLORS_H
