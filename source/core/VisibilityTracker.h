#pragma once

// ============================================================================
// VisibilityTracker - Per-page visibility ratios and dominant page detection
// ============================================================================
// Watches the render targets inside a scroll area and keeps, per (file, page),
// the fraction of the target currently inside the viewport. Ratios are
// recomputed when the viewport scrolls or resizes.
//
// A page becomes "dominant" when its ratio exceeds the threshold, it has the
// highest ratio of all tracked pages, and no deliberate navigation or file
// switch is in progress. pageDominant() fires once per change of dominant page.
//
// Without a scroll area the tracker is unavailable and does nothing (logged).
// Navigation itself does not depend on it.
// ============================================================================

#include "NavigationTypes.h"

#include <QObject>
#include <QAbstractScrollArea>
#include <QHash>
#include <QPointer>
#include <QVector>
#include <QWidget>

class QTimer;
class NavigationEventBus;
struct NavigationConfig;

class VisibilityTracker : public QObject {
    Q_OBJECT

public:
    using SuppressionCheck = std::function<bool()>;

    /**
     * @param bus Receives raw visibility samples (not owned, may be null).
     */
    explicit VisibilityTracker(NavigationEventBus* bus, QObject* parent = nullptr);
    ~VisibilityTracker() override;

    void setConfig(const NavigationConfig& config);
    qreal dominanceThreshold() const { return m_threshold; }

    /**
     * @brief Predicate that returns true while passive updates must be ignored.
     */
    void setSuppressionCheck(SuppressionCheck check);

    /**
     * @brief Set the scroll area whose viewport defines visibility.
     *
     * Passing nullptr makes the tracker unavailable. Existing observations
     * are kept; call rebuildAll() to rescan a new area.
     */
    void setScrollArea(QAbstractScrollArea* area);
    QAbstractScrollArea* scrollArea() const { return m_area; }
    bool isAvailable() const { return !m_area.isNull(); }

    // =========================================================================
    // Observation
    // =========================================================================

    /**
     * @brief Start tracking a render target.
     * @return True if an observation for (file, page) exists afterwards.
     *
     * Observing an already tracked (file, page) again is a no-op unless the
     * target widget was re-created, in which case the new widget replaces it.
     */
    bool observe(const FileKey& fileKey, int pageNumber, QWidget* target);
    void unobserve(const FileKey& fileKey, int pageNumber);

    /**
     * @brief Drop every observation and visibility record of a file.
     */
    void unobserveFile(const FileKey& fileKey);

    void disconnectAll();

    /**
     * @brief Dispose every observation, then rescan the scroll area content.
     *
     * Widgets carrying the fileKey/pageNumber properties are observed again.
     */
    void rebuildAll();

    int observerCount() const { return m_observations.size(); }
    bool isObserved(const FileKey& fileKey, int pageNumber) const;
    qreal visibilityRatio(const FileKey& fileKey, int pageNumber) const;
    QVector<PageVisibilityRecord> records() const;

    FileKey dominantFile() const { return m_dominantFile; }
    int dominantPage() const { return m_dominantPage; }

    // =========================================================================
    // Visibility Updates
    // =========================================================================

    /**
     * @brief Recompute ratios of every observed target inside the viewport.
     *
     * Targets not placed under the viewport are left untouched. Destroyed
     * targets drop to a ratio of 0 and lose dominance.
     */
    void refresh();

    /**
     * @brief Feed one visibility sample.
     * @return False if (file, page) is not observed.
     */
    bool reportVisibility(const FileKey& fileKey, int pageNumber, qreal ratio);

    /**
     * @brief Re-run dominance selection on the current ratios.
     *
     * Used after suppression ends (navigation completed) so the final
     * position is picked up without waiting for another scroll.
     */
    void reevaluate();

signals:
    void pageDominant(const FileKey& fileKey, int pageNumber, qreal ratio);
    void availabilityChanged(bool available);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    struct Observation {
        FileKey fileKey;
        int pageNumber = 0;
        QPointer<QWidget> target;
        qreal ratio = 0.0;
    };

    static QString observationKey(const FileKey& fileKey, int pageNumber);
    void scheduleRefresh();
    void evaluateDominance();
    qreal computeRatio(QWidget* target, QWidget* viewport) const;

    NavigationEventBus* m_bus = nullptr;
    SuppressionCheck m_suppressed;
    qreal m_threshold = 0.5;

    QPointer<QAbstractScrollArea> m_area;
    QVector<QMetaObject::Connection> m_areaConnections;
    QTimer* m_refreshTimer = nullptr;
    bool m_unavailableReported = false;

    QHash<QString, Observation> m_observations;

    FileKey m_dominantFile;
    int m_dominantPage = 0;
};
