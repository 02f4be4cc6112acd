#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

#include "core/NavigationTypes.h"
#include "core/NavigationConfig.h"

class QComboBox;
class QSpinBox;
class QCheckBox;
class QPushButton;
class QLabel;
class ViewportNavigation;
class DocumentStackView;
class ThumbnailRail;

/**
 * @brief Viewer shell: stacked document view, thumbnail rail and navigation bar.
 *
 * Layout:
 *   [ navigation bar: file selector | page spin box | smooth | top | Go ]
 *   [ ThumbnailRail | DocumentStackView                                ]
 *   [ status bar: current / active page, failures                      ]
 *
 * Owns the ViewportNavigation for the lifetime of the window.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const NavigationConfig& config = NavigationConfig(), QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Load generated placeholder files "file-1" .. "file-N".
     */
    void loadDemoFiles(int fileCount, int pagesPerFile);

    ViewportNavigation* navigation() const { return m_navigation; }
    DocumentStackView* stackView() const { return m_stackView; }
    ThumbnailRail* thumbnailRail() const { return m_thumbnailRail; }

private slots:
    void onFileSelected(int index);
    void onGoToPage();
    void updateStatus();
    void onCurrentFileChanged(const FileKey& fileKey, const QString& source);
    void onScrollFailed(const ScrollFailedEvent& event);

private:
    void setupUi();
    void setupConnections();
    QWidget* createNavigationBar();

    ViewportNavigation* m_navigation = nullptr;

    DocumentStackView* m_stackView = nullptr;
    ThumbnailRail* m_thumbnailRail = nullptr;

    // Navigation bar
    QComboBox* m_fileSelector = nullptr;
    QSpinBox* m_pageSpin = nullptr;
    QCheckBox* m_smoothCheck = nullptr;
    QCheckBox* m_alignTopCheck = nullptr;
    QPushButton* m_goButton = nullptr;

    // Status bar
    QLabel* m_pageStatus = nullptr;
    QLabel* m_phaseStatus = nullptr;

    static constexpr int THUMBNAIL_RAIL_WIDTH = 180;
    static constexpr int FAILURE_MESSAGE_MS = 5000;
};

#endif // MAINWINDOW_H
