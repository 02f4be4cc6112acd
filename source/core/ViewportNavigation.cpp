#include "ViewportNavigation.h"
#include "NavigationEventBus.h"
#include "PageStateStore.h"
#include "ElementLocator.h"
#include "VisibilityTracker.h"
#include "NavigationCoordinator.h"

#include <QAbstractScrollArea>
#include <QScrollArea>
#include <QScrollBar>
#include <QDebug>
#include <utility>

// ============================================================================
// Constructor / Destructor
// ============================================================================

ViewportNavigation::ViewportNavigation(const NavigationConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config.sanitized())
    , m_bus(std::make_unique<NavigationEventBus>())
{
    m_store = std::make_unique<PageStateStore>(m_bus.get());
    m_locator = std::make_unique<ElementLocator>();
    m_tracker = std::make_unique<VisibilityTracker>(m_bus.get());
    m_coordinator = std::make_unique<NavigationCoordinator>(m_store.get(), m_locator.get(), m_bus.get());

    // Passive updates wait while a deliberate navigation or file switch runs
    m_store->setNavigationActiveCheck([this]() {
        return m_coordinator->isBusy();
    });
    m_tracker->setSuppressionCheck([this]() {
        return m_coordinator->isBusy() || m_store->isFileChanging();
    });

    connect(m_tracker.get(), &VisibilityTracker::pageDominant,
            m_store.get(), &PageStateStore::handleDominantPage);
    connect(m_coordinator.get(), &NavigationCoordinator::navigationCompleted,
            m_tracker.get(), &VisibilityTracker::reevaluate);
    connect(m_store.get(), &PageStateStore::fileChangingChanged, this, [this](bool changing) {
        if (!changing) {
            m_tracker->reevaluate();
        }
    });
    connect(m_store.get(), &PageStateStore::scrollOffsetRestoreRequested,
            this, &ViewportNavigation::restoreScrollOffset);

    applyConfig();
}

ViewportNavigation::~ViewportNavigation()
{
    detachViewport();
}

void ViewportNavigation::setConfig(const NavigationConfig& config)
{
    m_config = config.sanitized();
    applyConfig();
}

void ViewportNavigation::applyConfig()
{
    m_bus->setConfig(m_config);
    m_store->setConfig(m_config);
    m_locator->setCacheResetInterval(m_config.locatorCacheResetMs);
    m_tracker->setConfig(m_config);
    m_coordinator->setConfig(m_config);
}

void ViewportNavigation::setClock(NavigationClock clock)
{
    m_bus->setClock(clock);
    m_coordinator->setClock(clock);
}

// ============================================================================
// Viewport
// ============================================================================

void ViewportNavigation::attachViewport(QAbstractScrollArea* primary, QAbstractScrollArea* secondary)
{
    detachViewport();
    if (!primary) {
        qWarning() << "ViewportNavigation::attachViewport: no scroll area";
        return;
    }

    m_primary = primary;

    QWidget* root = primary->viewport();
    if (auto* scrollArea = qobject_cast<QScrollArea*>(primary)) {
        if (scrollArea->widget()) {
            root = scrollArea->widget();
        }
    }

    m_locator->setRoot(root);
    m_coordinator->setScrollArea(primary);
    m_coordinator->setSecondaryScrollArea(secondary);
    m_tracker->setScrollArea(primary);
    m_tracker->rebuildAll();

    m_viewportConnections << connect(primary->verticalScrollBar(), &QScrollBar::valueChanged,
                                     this, [this](int value) {
        m_store->recordScrollOffset(m_store->currentFile(), value);
    });
}

void ViewportNavigation::detachViewport()
{
    for (const QMetaObject::Connection& connection : std::as_const(m_viewportConnections)) {
        disconnect(connection);
    }
    m_viewportConnections.clear();

    if (!m_primary) {
        return;
    }
    m_primary = nullptr;

    m_tracker->disconnectAll();
    m_tracker->setScrollArea(nullptr);
    m_coordinator->setScrollArea(nullptr);
    m_coordinator->setSecondaryScrollArea(nullptr);
    m_locator->setRoot(nullptr);
}

void ViewportNavigation::restoreScrollOffset(const FileKey& fileKey, qreal offset)
{
    if (!m_primary) {
        return;
    }
    qDebug() << "ViewportNavigation: restoring" << fileKey << "to offset" << offset;
    m_primary->verticalScrollBar()->setValue(qRound(offset));
}

// ============================================================================
// Files
// ============================================================================

bool ViewportNavigation::loadFile(const FileKey& fileKey, int totalPages)
{
    return m_store->addFile(fileKey, totalPages);
}

void ViewportNavigation::unloadFile(const FileKey& fileKey)
{
    m_tracker->unobserveFile(fileKey);
    m_locator->invalidateFile(fileKey);
    m_store->removeFile(fileKey);
}

bool ViewportNavigation::activateFile(const FileKey& fileKey)
{
    return m_store->activateFile(fileKey, NavigationSource::FileList);
}

// ============================================================================
// Navigation
// ============================================================================

bool ViewportNavigation::navigateToPage(int pageNumber, const FileKey& fileKey,
                                        const ScrollOptions& options, const QString& source)
{
    return m_coordinator->navigate(pageNumber, fileKey, options, source);
}

void ViewportNavigation::notifyRenderComplete(const FileKey& fileKey, int pageNumber, QWidget* target)
{
    if (target) {
        m_tracker->observe(fileKey, pageNumber, target);
    }
    m_coordinator->notifyRenderComplete(fileKey, pageNumber);
    m_bus->publishRenderComplete(fileKey, pageNumber);
}

void ViewportNavigation::setFileChanging(bool changing)
{
    m_store->setFileChanging(changing);
}

void ViewportNavigation::rebuildObservers()
{
    m_locator->clearCache();
    m_tracker->rebuildAll();
}
