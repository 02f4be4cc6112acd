#include "ScrollPositionCache.h"

void ScrollPositionCache::save(const FileKey& fileKey, qreal offset)
{
    if (fileKey.isEmpty()) {
        return;
    }
    m_offsets.insert(fileKey, qMax<qreal>(0.0, offset));
}

qreal ScrollPositionCache::offset(const FileKey& fileKey, qreal fallback) const
{
    return m_offsets.value(fileKey, fallback);
}

void ScrollPositionCache::remove(const FileKey& fileKey)
{
    m_offsets.remove(fileKey);
}
