#include "ElementLocator.h"
#include "NavigationConfig.h"

#include <QTimer>
#include <QDebug>
#include <algorithm>

// ============================================================================
// Constructor / Destructor
// ============================================================================

ElementLocator::ElementLocator(QObject* parent)
    : QObject(parent)
    , m_cacheResetTimer(new QTimer(this))
{
    m_cacheResetTimer->setInterval(NavigationConfig().locatorCacheResetMs);
    connect(m_cacheResetTimer, &QTimer::timeout, this, &ElementLocator::clearCache);
    m_cacheResetTimer->start();
}

ElementLocator::~ElementLocator()
{
}

void ElementLocator::setRoot(QWidget* root)
{
    m_root = root;
    if (!m_customStrategies) {
        m_strategies = defaultStrategies(root);
    }
    clearCache();
}

void ElementLocator::setStrategies(const QVector<Strategy>& strategies)
{
    m_strategies = strategies;
    m_customStrategies = true;
    clearCache();
}

void ElementLocator::useDefaultStrategies()
{
    m_strategies = defaultStrategies(m_root);
    m_customStrategies = false;
    clearCache();
}

void ElementLocator::addStrategy(const QString& name, MatchFunction match)
{
    if (!match) {
        return;
    }
    m_strategies.append({name, std::move(match)});
    m_customStrategies = true;
}

QStringList ElementLocator::strategyNames() const
{
    QStringList names;
    for (const Strategy& strategy : m_strategies) {
        names << strategy.name;
    }
    return names;
}

void ElementLocator::setCacheResetInterval(int ms)
{
    m_cacheResetTimer->setInterval(qMax(1, ms));
    m_cacheResetTimer->start();
}

// ============================================================================
// Lookup
// ============================================================================

QWidget* ElementLocator::locate(const FileKey& fileKey, int pageNumber)
{
    const CacheKey key = cacheKey(fileKey, pageNumber);

    auto it = m_cache.constFind(key);
    if (it != m_cache.constEnd() && !it.value().isNull()) {
        return it.value().data();
    }

    QWidget* target = runStrategies(fileKey, pageNumber);
    m_cache.insert(key, QPointer<QWidget>(target));
    return target;
}

QWidget* ElementLocator::warm(const FileKey& fileKey, int pageNumber)
{
    invalidate(fileKey, pageNumber);
    return locate(fileKey, pageNumber);
}

QWidget* ElementLocator::runStrategies(const FileKey& fileKey, int pageNumber) const
{
    for (const Strategy& strategy : m_strategies) {
        QWidget* target = strategy.match(fileKey, pageNumber);
        if (target) {
#ifdef SYNCVIEW_DEBUG
            qDebug() << "ElementLocator::locate:" << fileKey << pageNumber
                     << "found with strategy" << strategy.name;
#endif
            return target;
        }
    }
    return nullptr;
}

void ElementLocator::invalidate(const FileKey& fileKey, int pageNumber)
{
    m_cache.remove(cacheKey(fileKey, pageNumber));
}

void ElementLocator::invalidateFile(const FileKey& fileKey)
{
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (it.key().first == fileKey) {
            it = m_cache.erase(it);
        } else {
            ++it;
        }
    }
}

void ElementLocator::clearCache()
{
    m_cache.clear();
}

// ============================================================================
// Naming Conventions
// ============================================================================

QString ElementLocator::pageObjectName(const FileKey& fileKey, int pageNumber)
{
    return QStringLiteral("page:%1:%2").arg(fileKey).arg(pageNumber);
}

QString ElementLocator::fileObjectName(const FileKey& fileKey)
{
    return QStringLiteral("file:%1").arg(fileKey);
}

ElementLocator::CacheKey ElementLocator::cacheKey(const FileKey& fileKey, int pageNumber)
{
    return qMakePair(fileKey, pageNumber);
}

// ============================================================================
// Default Strategies
// ============================================================================

QVector<ElementLocator::Strategy> ElementLocator::defaultStrategies(QWidget* root)
{
    QVector<Strategy> strategies;
    if (!root) {
        return strategies;
    }

    QPointer<QWidget> guardedRoot(root);

    strategies.append({QStringLiteral("object-name"),
        [guardedRoot](const FileKey& fileKey, int pageNumber) -> QWidget* {
            if (!guardedRoot) {
                return nullptr;
            }
            return guardedRoot->findChild<QWidget*>(pageObjectName(fileKey, pageNumber));
        }});

    strategies.append({QStringLiteral("properties"),
        [guardedRoot](const FileKey& fileKey, int pageNumber) -> QWidget* {
            if (!guardedRoot) {
                return nullptr;
            }
            const QList<QWidget*> candidates = guardedRoot->findChildren<QWidget*>();
            for (QWidget* candidate : candidates) {
                const QVariant page = candidate->property(PageTargetProperty::PageNumber);
                if (page.isValid() && page.toInt() == pageNumber
                    && candidate->property(PageTargetProperty::FileKey).toString() == fileKey) {
                    return candidate;
                }
            }
            return nullptr;
        }});

    strategies.append({QStringLiteral("position"),
        [guardedRoot](const FileKey& fileKey, int pageNumber) -> QWidget* {
            if (!guardedRoot || pageNumber < 1) {
                return nullptr;
            }
            QWidget* section = guardedRoot->findChild<QWidget*>(fileObjectName(fileKey));
            if (!section) {
                return nullptr;
            }

            QList<QWidget*> pages = section->findChildren<QWidget*>(QString(), Qt::FindDirectChildrenOnly);
            pages.erase(std::remove_if(pages.begin(), pages.end(), [](QWidget* w) {
                return !w->property(PageTargetProperty::PageNumber).isValid();
            }), pages.end());

            // Layout order, not creation order
            std::stable_sort(pages.begin(), pages.end(), [](QWidget* a, QWidget* b) {
                return a->y() < b->y();
            });

            if (pageNumber > pages.size()) {
                return nullptr;
            }
            return pages.at(pageNumber - 1);
        }});

    return strategies;
}
