#pragma once

// ============================================================================
// NavigationConfig - Tunable timing and threshold parameters
// ============================================================================
// Defaults match the behaviour the viewer has always shipped with. Values are
// persisted in QSettings under the "Navigation" group.
// ============================================================================

#include <QtGlobal>

class QSettings;

struct NavigationConfig {
    // Visibility
    qreal dominanceThreshold = 0.5;     ///< Ratio a page must exceed to become dominant

    // Retry policy
    int maxAttempts = 3;                ///< Execution attempts before giving up
    int retryBackoffMs = 200;           ///< Backoff = retryBackoffMs * attempt
    int stuckThresholdMs = 3000;        ///< busy older than this is force-reset

    // Scroll execution timing
    int preExecutionDelayMs = 50;       ///< Wait before the first scroll strategy runs
    int smoothSettleDelayMs = 500;      ///< Verify delay after an animated scroll
    int instantSettleDelayMs = 100;     ///< Verify delay after an instant scroll
    int correctionDelayMs = 100;        ///< Re-verify delay after forced correction
    int smoothScrollDurationMs = 300;   ///< Scroll animation length
    qreal alignTopMarginFraction = 0.05;///< Top margin (fraction of viewport) for alignToTop
    int correctionMarginPx = 100;       ///< Margin above the page for forced correction

    // Visual feedback
    int highlightDurationMs = 1500;
    int thumbnailHighlightDurationMs = 2000;

    // Event bus
    int eventThrottleMs = 10;
    int reentrancyWindowMs = 50;

    // Misc
    int fileChangeSuppressionMs = 1000; ///< Safety auto-clear of the file-changing flag
    int locatorCacheResetMs = 10000;

    /**
     * @brief Settle delay for the given animation mode.
     */
    int settleDelayMs(bool smooth) const
    {
        return smooth ? smoothSettleDelayMs : instantSettleDelayMs;
    }

    /**
     * @brief Clamp every field into a usable range.
     * @return The sanitized copy.
     */
    NavigationConfig sanitized() const;

    /**
     * @brief Read a configuration from settings; missing keys use defaults.
     */
    static NavigationConfig load(QSettings& settings);

    /**
     * @brief Read from the application's default settings store.
     */
    static NavigationConfig loadFromDefaultSettings();

    void save(QSettings& settings) const;
};
