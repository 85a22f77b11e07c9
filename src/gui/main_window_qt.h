/*
 * src/gui/main_window_qt.h - Main window class for the Qt GUI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#ifndef DEMOLOADER_MAIN_WINDOW_QT_H
#define DEMOLOADER_MAIN_WINDOW_QT_H

#include <QMainWindow>
#include <QWidget>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QComboBox>
#include <QProgressBar>
#include <QLabel>
#include <QPushButton>
#include <QPlainTextEdit>
#include <QGroupBox>
#include <QTimer>
#include <QMutex>
#include <QSlider>
#include <QCheckBox>
#include <QTreeWidget>
#include <QHash>
#include <QCloseEvent>
#include <memory>
#include <vector>
#include <string>
#include <unordered_map>
#include <atomic>

#include "demoloader/cache_gate.h"
#include "demoloader/cache_index.h"
#include "demoloader/catalog.h"
#include "demoloader/config.h"
#include "demoloader/scheduler.h"

namespace demoloader {

// Log verbosity levels
enum class LogLevel {
    QUIET,    // Errors and completion only
    NORMAL,   // + Scheduler messages, summaries
    VERBOSE   // + Individual transfers
};

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    // config supplies the catalog, CDN and retry settings; the rest comes
    // from the widgets when a run starts
    explicit MainWindow(const TransferConfig& config, QWidget* parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent* event) override;

public slots:
    void onStartClicked();
    void onCancelClicked();
    void onBrowseClicked();
    void onRefreshDrivesClicked();
    void onDriveChanged(int index);
    void onConcurrencyChanged(int value);
    void onCategoryToggled();
    void onContentItemChanged(QTreeWidgetItem* item, int column);

signals:
    void logMessageReceived(const QString& message);
    void taskStarted(quint64 taskId, int slotIndex);
    void progressReceived(quint64 taskId, qint64 transferred, qint64 total, const QString& name);
    void taskFinished(quint64 taskId, int outcome, const QString& message);
    void batchComplete(int completed, int skipped, int failed, int cancelled);

private slots:
    void appendLog(const QString& message);
    void handleTaskStarted(quint64 taskId, int slotIndex);
    void handleProgress(quint64 taskId, qint64 transferred, qint64 total, const QString& name);
    void handleTaskFinished(quint64 taskId, int outcome, const QString& message);
    void handleBatchComplete(int completed, int skipped, int failed, int cancelled);
    void onStatsTimer();
    void flushPendingLogs();

private:
    void setupUi();
    void fetchCatalog();
    void populateCategories();
    void rebuildContentTree();
    void updateSummary();
    void openCacheIndex();
    void updateSlotVisibility();
    void resetSlotBars();
    void setRunningUi(bool running);
    std::vector<CatalogItem> selectedItems() const;
    std::vector<std::string> selectedCategories() const;
    QString destinationRoot() const;
    void updateProgressBar(QProgressBar* bar, int value);
    void updateLabel(QLabel* label, const QString& text);

    // Settings persistence
    void loadSettings();
    void saveSettings();

    // Leveled logging
    void log(LogLevel level, const QString& message);
    bool shouldLog(LogLevel level) const;

    // UI components
    QWidget* centralWidget_;
    QVBoxLayout* mainLayout_;

    // Destination
    QComboBox* driveCombo_;
    QPushButton* refreshDrivesButton_;
    QPushButton* browseButton_;

    // Transfer options
    QSlider* concurrencySlider_;
    QLabel* concurrencyLabel_;
    QCheckBox* useCacheCheck_;

    // Catalog selection
    QGroupBox* categoriesGroup_;
    QHBoxLayout* categoriesLayout_;
    std::vector<QCheckBox*> categoryChecks_;
    QTreeWidget* contentTree_;

    // Summary
    QLabel* summaryLabel_;
    QLabel* warningLabel_;

    // Progress bars, one per slot
    QGroupBox* slotsGroup_;
    std::vector<QProgressBar*> slotBars_;
    std::vector<bool> slotBusy_;
    QProgressBar* overallProgress_;
    QLabel* overallLabel_;

    // Log view - using QPlainTextEdit for performance
    QGroupBox* logGroup_;
    QComboBox* logVerbosityCombo_;
    QPlainTextEdit* logView_;

    // Control buttons
    QPushButton* startButton_;
    QPushButton* cancelButton_;

    // Engine
    TransferConfig config_;
    Catalog catalog_;
    bool catalogLoaded_;
    std::unique_ptr<CacheIndex> cacheIndex_;
    std::unique_ptr<CacheGate> cacheGate_;
    std::unique_ptr<Scheduler> scheduler_;

    // Timers
    QTimer* statsTimer_;
    QTimer* logFlushTimer_;

    // State
    LogLevel logLevel_;
    std::atomic<bool> isRunning_;
    int totalTasks_;
    int finishedTasks_;
    QHash<quint64, int> taskSlots_;

    // Last percent sent per task; touched only by the coordinator thread
    std::unordered_map<uint64_t, int> lastPercent_;

    // Log batching
    QMutex logMutex_;
    QStringList pendingLogs_;
    static constexpr int MAX_LOG_LINES = 500;
    static constexpr int LOG_FLUSH_INTERVAL_MS = 100;
};

} // namespace demoloader

#endif // DEMOLOADER_MAIN_WINDOW_QT_H
