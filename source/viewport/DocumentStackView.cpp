// ============================================================================
// DocumentStackView - Implementation
// ============================================================================

#include "DocumentStackView.h"
#include "PageWidget.h"
#include "../core/ElementLocator.h"
#include "../core/ViewportNavigation.h"
#include "../ui/ThemeColors.h"

#include <QVBoxLayout>
#include <QLabel>
#include <QDebug>
#include <utility>

DocumentStackView::DocumentStackView(QWidget* parent)
    : QScrollArea(parent)
{
    m_content = new QWidget(this);
    m_content->setObjectName(QStringLiteral("documentStackContent"));
    m_contentLayout = new QVBoxLayout(m_content);
    m_contentLayout->setContentsMargins(CONTENT_MARGIN, CONTENT_MARGIN, CONTENT_MARGIN, CONTENT_MARGIN);
    m_contentLayout->setSpacing(FILE_SPACING);
    m_contentLayout->addStretch(1);

    setWidget(m_content);
    setWidgetResizable(true);
    setAlignment(Qt::AlignHCenter | Qt::AlignTop);
    setDarkMode(false);
}

DocumentStackView::~DocumentStackView()
{
    if (m_navigation && m_navigation->viewport() == this) {
        m_navigation->detachViewport();
    }
}

void DocumentStackView::setNavigation(ViewportNavigation* navigation)
{
    if (m_navigation == navigation) {
        return;
    }
    if (m_navigation && m_navigation->viewport() == this) {
        m_navigation->detachViewport();
    }

    m_navigation = navigation;
    if (!m_navigation) {
        return;
    }

    for (const FileKey& fileKey : std::as_const(m_fileOrder)) {
        m_navigation->loadFile(fileKey, pageCount(fileKey));
    }
    m_navigation->attachViewport(this);
}

ViewportNavigation* DocumentStackView::navigation() const
{
    return m_navigation;
}

// ============================================================================
// Files
// ============================================================================

bool DocumentStackView::addFile(const FileKey& fileKey, int pageCount, const QString& title)
{
    if (fileKey.isEmpty() || pageCount < 1) {
        qWarning() << "DocumentStackView::addFile: invalid file" << fileKey << pageCount;
        return false;
    }
    if (m_sections.contains(fileKey)) {
        qWarning() << "DocumentStackView::addFile: file already shown" << fileKey;
        return false;
    }

    FileSection entry;
    QWidget* section = new QWidget(m_content);
    section->setObjectName(ElementLocator::fileObjectName(fileKey));
    section->setProperty(PageTargetProperty::FileKey, fileKey);

    QVBoxLayout* layout = new QVBoxLayout(section);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(PAGE_SPACING);

    QLabel* header = new QLabel(title.isEmpty() ? fileKey : title, section);
    QFont headerFont = header->font();
    headerFont.setBold(true);
    header->setFont(headerFont);
    layout->addWidget(header);

    for (int page = 1; page <= pageCount; ++page) {
        PageWidget* pageWidget = new PageWidget(fileKey, page, section);
        pageWidget->setDarkMode(m_darkMode);
        connect(pageWidget, &PageWidget::renderCompleted,
                this, &DocumentStackView::onPageRendered);
        layout->addWidget(pageWidget, 0, Qt::AlignHCenter);
        entry.pages.append(pageWidget);
    }

    entry.section = section;
    m_sections.insert(fileKey, entry);
    m_fileOrder.append(fileKey);

    // Keep the trailing stretch last
    m_contentLayout->insertWidget(m_contentLayout->count() - 1, section);

    if (m_navigation) {
        m_navigation->loadFile(fileKey, pageCount);
        m_navigation->rebuildObservers();
    }

    emit fileAdded(fileKey, pageCount);
    return true;
}

void DocumentStackView::removeFile(const FileKey& fileKey)
{
    auto it = m_sections.find(fileKey);
    if (it == m_sections.end()) {
        return;
    }

    QWidget* section = it->section;
    m_sections.erase(it);
    m_fileOrder.removeAll(fileKey);

    if (m_navigation) {
        m_navigation->unloadFile(fileKey);
    }

    if (section) {
        m_contentLayout->removeWidget(section);
        delete section;
    }

    if (m_navigation) {
        m_navigation->rebuildObservers();
    }
    emit fileRemoved(fileKey);
}

int DocumentStackView::pageCount(const FileKey& fileKey) const
{
    auto it = m_sections.constFind(fileKey);
    return it == m_sections.constEnd() ? 0 : it->pages.size();
}

QWidget* DocumentStackView::fileSection(const FileKey& fileKey) const
{
    auto it = m_sections.constFind(fileKey);
    return it == m_sections.constEnd() ? nullptr : it->section.data();
}

PageWidget* DocumentStackView::pageWidget(const FileKey& fileKey, int pageNumber) const
{
    auto it = m_sections.constFind(fileKey);
    if (it == m_sections.constEnd() || pageNumber < 1 || pageNumber > it->pages.size()) {
        return nullptr;
    }
    return it->pages.at(pageNumber - 1);
}

void DocumentStackView::setDarkMode(bool dark)
{
    m_darkMode = dark;

    QPalette pal = m_content->palette();
    pal.setColor(QPalette::Window, ThemeColors::pageGutter(dark));
    pal.setColor(QPalette::WindowText, ThemeColors::textPrimary(dark));
    m_content->setPalette(pal);
    m_content->setAutoFillBackground(true);

    for (const FileSection& entry : std::as_const(m_sections)) {
        for (PageWidget* page : entry.pages) {
            page->setDarkMode(dark);
        }
    }
}

// ============================================================================
// Render Completion
// ============================================================================

void DocumentStackView::onPageRendered(const FileKey& fileKey, int pageNumber)
{
    if (m_navigation) {
        m_navigation->notifyRenderComplete(fileKey, pageNumber, pageWidget(fileKey, pageNumber));
    }
    emit pageRendered(fileKey, pageNumber);
}
