#include "NavigationConfig.h"

#include <QSettings>
#include <QDebug>

namespace {
const QString SETTINGS_GROUP = QStringLiteral("Navigation");
}

NavigationConfig NavigationConfig::sanitized() const
{
    NavigationConfig c = *this;

    if (c.dominanceThreshold <= 0.0 || c.dominanceThreshold > 1.0) {
        qWarning() << "NavigationConfig::sanitized: dominance threshold out of range:"
                   << c.dominanceThreshold << "- using 0.5";
        c.dominanceThreshold = 0.5;
    }

    c.maxAttempts = qMax(1, c.maxAttempts);
    c.retryBackoffMs = qMax(0, c.retryBackoffMs);
    c.stuckThresholdMs = qMax(0, c.stuckThresholdMs);
    c.preExecutionDelayMs = qMax(0, c.preExecutionDelayMs);
    c.smoothSettleDelayMs = qMax(0, c.smoothSettleDelayMs);
    c.instantSettleDelayMs = qMax(0, c.instantSettleDelayMs);
    c.correctionDelayMs = qMax(0, c.correctionDelayMs);
    c.smoothScrollDurationMs = qMax(0, c.smoothScrollDurationMs);
    c.alignTopMarginFraction = qBound(0.0, c.alignTopMarginFraction, 0.5);
    c.correctionMarginPx = qMax(0, c.correctionMarginPx);
    c.highlightDurationMs = qMax(0, c.highlightDurationMs);
    c.thumbnailHighlightDurationMs = qMax(0, c.thumbnailHighlightDurationMs);
    c.eventThrottleMs = qMax(0, c.eventThrottleMs);
    c.reentrancyWindowMs = qMax(0, c.reentrancyWindowMs);
    c.fileChangeSuppressionMs = qMax(0, c.fileChangeSuppressionMs);
    // A zero interval would clear the cache on every event loop pass
    c.locatorCacheResetMs = qMax(100, c.locatorCacheResetMs);

    return c;
}

NavigationConfig NavigationConfig::load(QSettings& settings)
{
    NavigationConfig d;
    NavigationConfig c;

    settings.beginGroup(SETTINGS_GROUP);
    c.dominanceThreshold = settings.value("dominanceThreshold", d.dominanceThreshold).toDouble();
    c.maxAttempts = settings.value("maxAttempts", d.maxAttempts).toInt();
    c.retryBackoffMs = settings.value("retryBackoffMs", d.retryBackoffMs).toInt();
    c.stuckThresholdMs = settings.value("stuckThresholdMs", d.stuckThresholdMs).toInt();
    c.preExecutionDelayMs = settings.value("preExecutionDelayMs", d.preExecutionDelayMs).toInt();
    c.smoothSettleDelayMs = settings.value("smoothSettleDelayMs", d.smoothSettleDelayMs).toInt();
    c.instantSettleDelayMs = settings.value("instantSettleDelayMs", d.instantSettleDelayMs).toInt();
    c.correctionDelayMs = settings.value("correctionDelayMs", d.correctionDelayMs).toInt();
    c.smoothScrollDurationMs = settings.value("smoothScrollDurationMs", d.smoothScrollDurationMs).toInt();
    c.alignTopMarginFraction = settings.value("alignTopMarginFraction", d.alignTopMarginFraction).toDouble();
    c.correctionMarginPx = settings.value("correctionMarginPx", d.correctionMarginPx).toInt();
    c.highlightDurationMs = settings.value("highlightDurationMs", d.highlightDurationMs).toInt();
    c.thumbnailHighlightDurationMs = settings.value("thumbnailHighlightDurationMs",
                                                    d.thumbnailHighlightDurationMs).toInt();
    c.eventThrottleMs = settings.value("eventThrottleMs", d.eventThrottleMs).toInt();
    c.reentrancyWindowMs = settings.value("reentrancyWindowMs", d.reentrancyWindowMs).toInt();
    c.fileChangeSuppressionMs = settings.value("fileChangeSuppressionMs", d.fileChangeSuppressionMs).toInt();
    c.locatorCacheResetMs = settings.value("locatorCacheResetMs", d.locatorCacheResetMs).toInt();
    settings.endGroup();

    return c.sanitized();
}

NavigationConfig NavigationConfig::loadFromDefaultSettings()
{
    QSettings settings("SyncView", "App");
    return load(settings);
}

void NavigationConfig::save(QSettings& settings) const
{
    settings.beginGroup(SETTINGS_GROUP);
    settings.setValue("dominanceThreshold", dominanceThreshold);
    settings.setValue("maxAttempts", maxAttempts);
    settings.setValue("retryBackoffMs", retryBackoffMs);
    settings.setValue("stuckThresholdMs", stuckThresholdMs);
    settings.setValue("preExecutionDelayMs", preExecutionDelayMs);
    settings.setValue("smoothSettleDelayMs", smoothSettleDelayMs);
    settings.setValue("instantSettleDelayMs", instantSettleDelayMs);
    settings.setValue("correctionDelayMs", correctionDelayMs);
    settings.setValue("smoothScrollDurationMs", smoothScrollDurationMs);
    settings.setValue("alignTopMarginFraction", alignTopMarginFraction);
    settings.setValue("correctionMarginPx", correctionMarginPx);
    settings.setValue("highlightDurationMs", highlightDurationMs);
    settings.setValue("thumbnailHighlightDurationMs", thumbnailHighlightDurationMs);
    settings.setValue("eventThrottleMs", eventThrottleMs);
    settings.setValue("reentrancyWindowMs", reentrancyWindowMs);
    settings.setValue("fileChangeSuppressionMs", fileChangeSuppressionMs);
    settings.setValue("locatorCacheResetMs", locatorCacheResetMs);
    settings.endGroup();
}
