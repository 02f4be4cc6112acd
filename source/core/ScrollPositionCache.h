#pragma once

// ============================================================================
// ScrollPositionCache - Last known scroll offset per file
// ============================================================================
// In-memory only; discarded when the viewer is torn down.
// ============================================================================

#include "NavigationTypes.h"

#include <QHash>

class ScrollPositionCache {
public:
    void save(const FileKey& fileKey, qreal offset);

    /**
     * @brief Check whether an offset was recorded for a file.
     */
    bool contains(const FileKey& fileKey) const { return m_offsets.contains(fileKey); }

    /**
     * @brief Get the recorded offset.
     * @param fallback Returned when nothing was recorded for the file.
     */
    qreal offset(const FileKey& fileKey, qreal fallback = 0.0) const;

    void remove(const FileKey& fileKey);
    void clear() { m_offsets.clear(); }
    int size() const { return m_offsets.size(); }

private:
    QHash<FileKey, qreal> m_offsets;
};
