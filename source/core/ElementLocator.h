#pragma once

// ============================================================================
// ElementLocator - Resolve (file, page) to its current render target widget
// ============================================================================
// Render targets are created asynchronously by the renderer and may be torn
// down and re-created, so lookups try an ordered list of strategies from
// most to least specific and cache results for a short time.
//
// A nullptr result means "not rendered yet", never a hard error.
// ============================================================================

#include "NavigationTypes.h"

#include <QObject>
#include <QHash>
#include <QPair>
#include <QPointer>
#include <QVector>
#include <QWidget>

class QTimer;

class ElementLocator : public QObject {
    Q_OBJECT

public:
    using MatchFunction = std::function<QWidget*(const FileKey& fileKey, int pageNumber)>;

    /**
     * @brief A named, prioritized lookup strategy.
     */
    struct Strategy {
        QString name;
        MatchFunction match;
    };

    explicit ElementLocator(QObject* parent = nullptr);
    ~ElementLocator() override;

    /**
     * @brief Set the widget subtree searched by the default strategies.
     * @param root Usually the scroll area's content widget (not owned).
     *
     * Rebuilds the strategy list as defaultStrategies(root) unless custom
     * strategies were installed with setStrategies() or addStrategy(); those
     * are kept. Always clears the cache.
     */
    void setRoot(QWidget* root);
    QWidget* root() const { return m_root; }

    /**
     * @brief Replace the strategy list. Order is priority order.
     */
    void setStrategies(const QVector<Strategy>& strategies);
    void addStrategy(const QString& name, MatchFunction match);

    /**
     * @brief Drop custom strategies and go back to the defaults for root().
     */
    void useDefaultStrategies();
    QStringList strategyNames() const;

    /**
     * @brief Resolve a render target.
     * @return The first non-null strategy match, or nullptr.
     *
     * A live cached target is returned directly. Cached misses are retried.
     */
    QWidget* locate(const FileKey& fileKey, int pageNumber);

    /**
     * @brief Re-resolve bypassing the cache (after a render completes).
     */
    QWidget* warm(const FileKey& fileKey, int pageNumber);

    void invalidate(const FileKey& fileKey, int pageNumber);
    void invalidateFile(const FileKey& fileKey);
    void clearCache();
    int cacheSize() const { return m_cache.size(); }

    /**
     * @brief Set the periodic cache reset interval.
     */
    void setCacheResetInterval(int ms);

    // =========================================================================
    // Naming Conventions
    // =========================================================================

    /**
     * @brief Composite object name of a page render target: "page:<file>:<page>".
     */
    static QString pageObjectName(const FileKey& fileKey, int pageNumber);

    /**
     * @brief Object name of the section holding a file's pages: "file:<file>".
     */
    static QString fileObjectName(const FileKey& fileKey);

    /**
     * @brief Default strategies over a widget tree.
     *
     * 1. exact composite object name
     * 2. fileKey/pageNumber dynamic properties
     * 3. positional: the Nth page-like child of the file's section
     */
    static QVector<Strategy> defaultStrategies(QWidget* root);

private:
    using CacheKey = QPair<FileKey, int>;

    static CacheKey cacheKey(const FileKey& fileKey, int pageNumber);
    QWidget* runStrategies(const FileKey& fileKey, int pageNumber) const;

    QPointer<QWidget> m_root;
    QVector<Strategy> m_strategies;
    bool m_customStrategies = false;

    // Null entries mean "looked up, not rendered yet"
    QHash<CacheKey, QPointer<QWidget>> m_cache;
    QTimer* m_cacheResetTimer = nullptr;
};
