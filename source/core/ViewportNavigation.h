#pragma once

// ============================================================================
// ViewportNavigation - Navigation service for one viewer
// ============================================================================
// Owns and wires together the navigation components:
//
//   NavigationEventBus     broadcast channel
//   PageStateStore         per-file current/active page
//   ElementLocator         (file, page) -> render target
//   VisibilityTracker      passive dominant-page detection
//   NavigationCoordinator  deliberate navigation requests
//
// Create one per viewer when it is constructed and destroy it with the
// viewer. Destruction cancels every pending navigation continuation.
// ============================================================================

#include "NavigationTypes.h"
#include "NavigationConfig.h"

#include <QObject>
#include <QAbstractScrollArea>
#include <QPointer>
#include <QVector>
#include <memory>

class QWidget;
class NavigationEventBus;
class PageStateStore;
class ElementLocator;
class VisibilityTracker;
class NavigationCoordinator;

class ViewportNavigation : public QObject {
    Q_OBJECT

public:
    explicit ViewportNavigation(const NavigationConfig& config = NavigationConfig(),
                                QObject* parent = nullptr);
    ~ViewportNavigation() override;

    void setConfig(const NavigationConfig& config);
    const NavigationConfig& config() const { return m_config; }

    /**
     * @brief Use a custom clock for timestamps and staleness checks.
     */
    void setClock(NavigationClock clock);

    // =========================================================================
    // Viewport
    // =========================================================================

    /**
     * @brief Attach the scroll area holding the page render targets.
     * @param primary Scrolled by navigation and watched for visibility.
     * @param secondary Optional area kept at the same offset.
     *
     * Rebuilds the observer set from the widgets already in the area.
     */
    void attachViewport(QAbstractScrollArea* primary, QAbstractScrollArea* secondary = nullptr);
    void detachViewport();
    QAbstractScrollArea* viewport() const { return m_primary; }

    // =========================================================================
    // Files
    // =========================================================================

    bool loadFile(const FileKey& fileKey, int totalPages);

    /**
     * @brief Remove a file's state, visibility records and cached targets.
     */
    void unloadFile(const FileKey& fileKey);

    /**
     * @brief Deliberately switch to a file, restoring its last offset.
     */
    bool activateFile(const FileKey& fileKey);

    // =========================================================================
    // Navigation
    // =========================================================================

    bool navigateToPage(int pageNumber, const FileKey& fileKey = FileKey(),
                        const ScrollOptions& options = ScrollOptions(),
                        const QString& source = NavigationSource::Coordinator);

    /**
     * @brief Called by the renderer once a page's target is in the tree.
     * @param target The render target, observed for visibility if given.
     */
    void notifyRenderComplete(const FileKey& fileKey, int pageNumber, QWidget* target = nullptr);

    /**
     * @brief Flag a programmatic file switch in progress.
     */
    void setFileChanging(bool changing);

    /**
     * @brief Dispose and recreate every visibility observation.
     */
    void rebuildObservers();

    // =========================================================================
    // Components
    // =========================================================================

    NavigationEventBus* eventBus() const { return m_bus.get(); }
    PageStateStore* pageState() const { return m_store.get(); }
    ElementLocator* locator() const { return m_locator.get(); }
    VisibilityTracker* tracker() const { return m_tracker.get(); }
    NavigationCoordinator* coordinator() const { return m_coordinator.get(); }

private:
    void applyConfig();
    void restoreScrollOffset(const FileKey& fileKey, qreal offset);

    NavigationConfig m_config;

    // Declaration order is destruction order in reverse: dependents first
    std::unique_ptr<NavigationEventBus> m_bus;
    std::unique_ptr<PageStateStore> m_store;
    std::unique_ptr<ElementLocator> m_locator;
    std::unique_ptr<VisibilityTracker> m_tracker;
    std::unique_ptr<NavigationCoordinator> m_coordinator;

    QPointer<QAbstractScrollArea> m_primary;
    QVector<QMetaObject::Connection> m_viewportConnections;
};
