/*
 * src/gui/main_window_qt.cpp - Main window for the Qt GUI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "main_window_qt.h"
#include <QDateTime>
#include <QScrollBar>
#include <QApplication>
#include <QFileDialog>
#include <QFileInfo>
#include <QStatusBar>
#include <QSettings>
#include <QPointer>
#include <QHeaderView>
#include <QtConcurrent>

#include "demoloader/downloader.h"
#include "demoloader/progress.h"
#include "demoloader/storage.h"
#include "demoloader/task_builder.h"

namespace demoloader {

namespace {

constexpr int ITEM_ROLE = Qt::UserRole + 1;   // index into items_for(category)

} // anonymous namespace

MainWindow::MainWindow(const TransferConfig& config, QWidget* parent)
    : QMainWindow(parent)
    , config_(config)
    , catalogLoaded_(false)
    , logLevel_(LogLevel::NORMAL)
    , isRunning_(false)
    , totalTasks_(0)
    , finishedTasks_(0)
{
    setWindowTitle("Demo Loader");
    resize(900, 800);

    setupUi();
    loadSettings();

    // Connect signals with queued connections for thread safety
    connect(this, &MainWindow::logMessageReceived, this, [this](const QString& message) {
        log(LogLevel::NORMAL, message);
    }, Qt::QueuedConnection);
    connect(this, &MainWindow::taskStarted, this, &MainWindow::handleTaskStarted, Qt::QueuedConnection);
    connect(this, &MainWindow::progressReceived, this, &MainWindow::handleProgress, Qt::QueuedConnection);
    connect(this, &MainWindow::taskFinished, this, &MainWindow::handleTaskFinished, Qt::QueuedConnection);
    connect(this, &MainWindow::batchComplete, this, &MainWindow::handleBatchComplete, Qt::QueuedConnection);

    statsTimer_ = new QTimer(this);
    statsTimer_->setTimerType(Qt::CoarseTimer);
    connect(statsTimer_, &QTimer::timeout, this, &MainWindow::onStatsTimer);

    // Log flush timer for batched log updates
    logFlushTimer_ = new QTimer(this);
    logFlushTimer_->setTimerType(Qt::CoarseTimer);
    connect(logFlushTimer_, &QTimer::timeout, this, &MainWindow::flushPendingLogs);
    logFlushTimer_->start(LOG_FLUSH_INTERVAL_MS);

    onRefreshDrivesClicked();
    fetchCatalog();
}

MainWindow::~MainWindow() {
    // Joins the coordinator before the gate and index go away
    scheduler_.reset();
    cacheGate_.reset();
    cacheIndex_.reset();
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (scheduler_ && isRunning_.load()) {
        scheduler_->cancel();
    }
    scheduler_.reset();
    saveSettings();
    event->accept();
}

void MainWindow::setupUi() {
    centralWidget_ = new QWidget(this);
    setCentralWidget(centralWidget_);

    mainLayout_ = new QVBoxLayout(centralWidget_);
    mainLayout_->setContentsMargins(6, 6, 6, 6);
    mainLayout_->setSpacing(8);

    // Destination drive
    QHBoxLayout* driveLayout = new QHBoxLayout();
    driveLayout->addWidget(new QLabel("Destination:"));
    driveCombo_ = new QComboBox();
    driveCombo_->setSizeAdjustPolicy(QComboBox::AdjustToContents);
    connect(driveCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onDriveChanged);
    driveLayout->addWidget(driveCombo_, 1);
    refreshDrivesButton_ = new QPushButton("Refresh");
    connect(refreshDrivesButton_, &QPushButton::clicked, this, &MainWindow::onRefreshDrivesClicked);
    driveLayout->addWidget(refreshDrivesButton_);
    browseButton_ = new QPushButton("Browse...");
    connect(browseButton_, &QPushButton::clicked, this, &MainWindow::onBrowseClicked);
    driveLayout->addWidget(browseButton_);
    mainLayout_->addLayout(driveLayout);

    // Concurrency and cache
    QHBoxLayout* optionsLayout = new QHBoxLayout();
    optionsLayout->addWidget(new QLabel("Simultaneous downloads:"));
    concurrencySlider_ = new QSlider(Qt::Horizontal);
    concurrencySlider_->setRange(MIN_CONCURRENCY, MAX_CONCURRENCY);
    concurrencySlider_->setValue(DEFAULT_CONCURRENCY);
    concurrencySlider_->setTickPosition(QSlider::TicksBelow);
    concurrencySlider_->setTickInterval(1);
    connect(concurrencySlider_, &QSlider::valueChanged, this, &MainWindow::onConcurrencyChanged);
    optionsLayout->addWidget(concurrencySlider_, 1);
    concurrencyLabel_ = new QLabel(QString::number(DEFAULT_CONCURRENCY));
    concurrencyLabel_->setMinimumWidth(24);
    optionsLayout->addWidget(concurrencyLabel_);
    useCacheCheck_ = new QCheckBox("Use cache");
    useCacheCheck_->setChecked(true);
    useCacheCheck_->setToolTip("Skip items already present in the cache folder");
    optionsLayout->addWidget(useCacheCheck_);
    connect(useCacheCheck_, &QCheckBox::toggled, this, [this]() { updateSummary(); });
    mainLayout_->addLayout(optionsLayout);

    // Categories
    categoriesGroup_ = new QGroupBox("Categories");
    categoriesLayout_ = new QHBoxLayout(categoriesGroup_);
    categoriesLayout_->addWidget(new QLabel("Loading catalog..."));
    mainLayout_->addWidget(categoriesGroup_);

    // Content list
    contentTree_ = new QTreeWidget();
    contentTree_->setColumnCount(4);
    contentTree_->setHeaderLabels({"Title", "Duration", "File Type", "Size"});
    contentTree_->header()->setSectionResizeMode(0, QHeaderView::Stretch);
    contentTree_->setMinimumHeight(180);
    connect(contentTree_, &QTreeWidget::itemChanged, this, &MainWindow::onContentItemChanged);
    mainLayout_->addWidget(contentTree_, 1);

    // Summary
    summaryLabel_ = new QLabel("Total Required Space: 0.00 GB / 0.00 GB Free");
    mainLayout_->addWidget(summaryLabel_);
    warningLabel_ = new QLabel(capacity_warning());
    warningLabel_->setStyleSheet("color: #f44336; font-weight: bold;");
    warningLabel_->setVisible(false);
    mainLayout_->addWidget(warningLabel_);

    // Per-slot progress
    slotsGroup_ = new QGroupBox("Downloads");
    QVBoxLayout* slotsLayout = new QVBoxLayout(slotsGroup_);
    for (int i = 0; i < MAX_CONCURRENCY; ++i) {
        QProgressBar* bar = new QProgressBar();
        bar->setRange(0, 100);
        bar->setValue(0);
        bar->setTextVisible(true);
        bar->setFormat("Idle");
        slotsLayout->addWidget(bar);
        slotBars_.push_back(bar);
        slotBusy_.push_back(false);
    }
    mainLayout_->addWidget(slotsGroup_);

    // Overall progress
    QGroupBox* overallGroup = new QGroupBox("Overall Progress");
    QVBoxLayout* overallLayout = new QVBoxLayout(overallGroup);
    overallProgress_ = new QProgressBar();
    overallProgress_->setRange(0, 100);
    overallProgress_->setValue(0);
    overallLayout->addWidget(overallProgress_);
    overallLabel_ = new QLabel("Ready to start");
    overallLayout->addWidget(overallLabel_);
    mainLayout_->addWidget(overallGroup);

    // Log view
    logGroup_ = new QGroupBox("Log");
    QVBoxLayout* logLayout = new QVBoxLayout(logGroup_);
    QHBoxLayout* verbosityLayout = new QHBoxLayout();
    verbosityLayout->addWidget(new QLabel("Verbosity:"));
    logVerbosityCombo_ = new QComboBox();
    logVerbosityCombo_->addItem("Quiet", static_cast<int>(LogLevel::QUIET));
    logVerbosityCombo_->addItem("Normal", static_cast<int>(LogLevel::NORMAL));
    logVerbosityCombo_->addItem("Verbose", static_cast<int>(LogLevel::VERBOSE));
    logVerbosityCombo_->setCurrentIndex(1);
    connect(logVerbosityCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        logLevel_ = static_cast<LogLevel>(logVerbosityCombo_->itemData(index).toInt());
    });
    verbosityLayout->addWidget(logVerbosityCombo_);
    verbosityLayout->addStretch();
    logLayout->addLayout(verbosityLayout);
    logView_ = new QPlainTextEdit();
    logView_->setReadOnly(true);
    logView_->setFont(QFont("Monospace", 9));
    logView_->setMaximumBlockCount(MAX_LOG_LINES);  // Auto-trim old lines
    logView_->setLineWrapMode(QPlainTextEdit::NoWrap);
    logView_->setMinimumHeight(100);
    logLayout->addWidget(logView_);
    mainLayout_->addWidget(logGroup_);

    // Control buttons
    QHBoxLayout* controlsLayout = new QHBoxLayout();
    controlsLayout->addStretch();

    startButton_ = new QPushButton("Start");
    startButton_->setStyleSheet("background-color: #4CAF50; color: white; padding: 8px 24px;");
    startButton_->setEnabled(false);
    connect(startButton_, &QPushButton::clicked, this, &MainWindow::onStartClicked);
    controlsLayout->addWidget(startButton_);

    cancelButton_ = new QPushButton("Cancel");
    cancelButton_->setStyleSheet("background-color: #f44336; color: white; padding: 8px 24px;");
    cancelButton_->setEnabled(false);
    connect(cancelButton_, &QPushButton::clicked, this, &MainWindow::onCancelClicked);
    controlsLayout->addWidget(cancelButton_);

    controlsLayout->addStretch();
    mainLayout_->addLayout(controlsLayout);

    updateSlotVisibility();
    statusBar()->showMessage("Select a destination drive and the content to copy");
}

void MainWindow::fetchCatalog() {
    std::string url = config_.catalog_url;
    std::string agent = config_.user_agent;
    QPointer<MainWindow> self(this);

    log(LogLevel::NORMAL, "Fetching catalog...");
    (void)QtConcurrent::run([self, url, agent]() {
        CatalogResult result = fetch_catalog(url, agent);
        if (!self) return;
        QMetaObject::invokeMethod(self.data(), [self, result]() {
            if (!self) return;
            if (!result.success) {
                self->log(LogLevel::QUIET, QString::fromStdString(result.error_message));
                self->statusBar()->showMessage("Catalog unavailable");
                return;
            }
            self->catalog_ = result.catalog;
            self->catalogLoaded_ = true;
            self->log(LogLevel::NORMAL, QString("Catalog loaded: %1 items in %2 categories")
                .arg(result.catalog.item_count())
                .arg(result.catalog.categories().size()));
            self->populateCategories();
        }, Qt::QueuedConnection);
    });
}

void MainWindow::populateCategories() {
    while (QLayoutItem* item = categoriesLayout_->takeAt(0)) {
        delete item->widget();
        delete item;
    }
    categoryChecks_.clear();

    for (const auto& category : catalog_.categories()) {
        QCheckBox* check = new QCheckBox(QString::fromStdString(category));
        connect(check, &QCheckBox::toggled, this, &MainWindow::onCategoryToggled);
        categoriesLayout_->addWidget(check);
        categoryChecks_.push_back(check);
    }
    categoriesLayout_->addStretch();
    rebuildContentTree();
}

void MainWindow::onCategoryToggled() {
    rebuildContentTree();
}

void MainWindow::rebuildContentTree() {
    contentTree_->blockSignals(true);
    contentTree_->clear();

    for (QCheckBox* check : categoryChecks_) {
        if (!check->isChecked()) continue;
        std::string category = check->text().toStdString();

        QTreeWidgetItem* parent = new QTreeWidgetItem(contentTree_);
        parent->setText(0, check->text());
        parent->setFlags(parent->flags() | Qt::ItemIsUserCheckable | Qt::ItemIsAutoTristate);
        parent->setCheckState(0, Qt::Checked);

        const auto& items = catalog_.items_for(category);
        for (size_t i = 0; i < items.size(); ++i) {
            const CatalogItem& item = items[i];
            QTreeWidgetItem* child = new QTreeWidgetItem(parent);
            child->setText(0, QString::fromStdString(item.title));
            child->setText(1, QString::fromStdString(item.duration));
            child->setText(2, QString::fromStdString(item.filetype));
            child->setText(3, QString::fromStdString(item.size));
            child->setData(0, ITEM_ROLE, static_cast<int>(i));
            child->setFlags(child->flags() | Qt::ItemIsUserCheckable);
            child->setCheckState(0, Qt::Checked);
        }
        parent->setExpanded(true);
    }

    contentTree_->blockSignals(false);
    updateSummary();
}

void MainWindow::onContentItemChanged(QTreeWidgetItem* item, int column) {
    Q_UNUSED(item);
    if (column == 0) {
        updateSummary();
    }
}

std::vector<CatalogItem> MainWindow::selectedItems() const {
    std::vector<CatalogItem> items;
    for (int i = 0; i < contentTree_->topLevelItemCount(); ++i) {
        QTreeWidgetItem* parent = contentTree_->topLevelItem(i);
        const auto& categoryItems = catalog_.items_for(parent->text(0).toStdString());
        for (int j = 0; j < parent->childCount(); ++j) {
            QTreeWidgetItem* child = parent->child(j);
            if (child->checkState(0) != Qt::Checked) continue;
            int index = child->data(0, ITEM_ROLE).toInt();
            if (index >= 0 && static_cast<size_t>(index) < categoryItems.size()) {
                items.push_back(categoryItems[static_cast<size_t>(index)]);
            }
        }
    }
    return items;
}

std::vector<std::string> MainWindow::selectedCategories() const {
    std::vector<std::string> categories;
    for (QCheckBox* check : categoryChecks_) {
        if (check->isChecked()) {
            categories.push_back(check->text().toStdString());
        }
    }
    return categories;
}

QString MainWindow::destinationRoot() const {
    return driveCombo_->currentData().toString();
}

void MainWindow::updateSummary() {
    std::vector<CatalogItem> items = selectedItems();
    QString root = destinationRoot();

    int64_t required = 0;
    uint64_t freeBytes = 0;
    if (root.isEmpty()) {
        for (const auto& item : items) {
            required += gb_to_bytes(item.size_gb);
        }
    } else {
        TransferConfig probe = config_;
        probe.destination_root = root.toStdString();
        std::string cacheRoot = cache_root(probe);

        // Without the index every file already on the drive counts as cached;
        // onStartClicked repeats the check with it
        CacheGate gate(cacheRoot, useCacheCheck_->isChecked());
        required = gate.bytes_to_transfer(build_tasks(items, config_.cdn_base, cacheRoot));

        auto space = query_free_space(root.toStdString());
        if (space) {
            freeBytes = space->free_bytes;
        }
    }

    bool fits = !root.isEmpty() && check_capacity(required, freeBytes);
    updateLabel(summaryLabel_, QString::fromStdString(format_capacity_summary(required, freeBytes)));
    warningLabel_->setVisible(!root.isEmpty() && !fits);
    startButton_->setEnabled(!isRunning_.load() && !items.empty() && fits);
}

void MainWindow::openCacheIndex() {
    cacheIndex_.reset();
    try {
        cacheIndex_ = std::make_unique<CacheIndex>(cache_index_path(config_));
        if (!cacheIndex_->initialize()) {
            log(LogLevel::QUIET, "Cache index unavailable: " +
                QString::fromStdString(cacheIndex_->get_last_error()));
            cacheIndex_.reset();
        }
    } catch (const std::runtime_error& e) {
        log(LogLevel::QUIET, QString("Cache index unavailable: %1").arg(e.what()));
        cacheIndex_.reset();
    }
}

void MainWindow::onRefreshDrivesClicked() {
    QString previous = destinationRoot();

    driveCombo_->blockSignals(true);
    driveCombo_->clear();
    for (const auto& drive : list_removable_drives()) {
        driveCombo_->addItem(QString::fromStdString(format_drive_label(drive)),
                             QString::fromStdString(drive.mount_point));
    }

    // Keep a folder picked with Browse... selectable after a refresh
    QSettings settings;
    QString last = settings.value("lastDestination").toString();
    if (!last.isEmpty() && driveCombo_->findData(last) < 0) {
        auto space = query_free_space(last.toStdString());
        if (space) {
            RemovableDrive folder;
            folder.name = QFileInfo(last).fileName().toStdString();
            folder.mount_point = last.toStdString();
            folder.free_bytes = space->free_bytes;
            folder.total_bytes = space->total_bytes;
            driveCombo_->addItem(QString::fromStdString(format_drive_label(folder)), last);
        }
    }

    int index = driveCombo_->findData(previous.isEmpty() ? last : previous);
    driveCombo_->setCurrentIndex(index >= 0 ? index : 0);
    driveCombo_->blockSignals(false);

    if (driveCombo_->count() == 0) {
        statusBar()->showMessage("No removable drives found");
    }
    updateSummary();
}

void MainWindow::onBrowseClicked() {
    QString dir = QFileDialog::getExistingDirectory(this, "Select Destination Folder",
                                                     destinationRoot(),
                                                     QFileDialog::ShowDirsOnly);
    if (dir.isEmpty()) return;

    QSettings settings;
    settings.setValue("lastDestination", dir);
    onRefreshDrivesClicked();
    int index = driveCombo_->findData(dir);
    if (index >= 0) {
        driveCombo_->setCurrentIndex(index);
    }
}

void MainWindow::onDriveChanged(int index) {
    Q_UNUSED(index);
    updateSummary();
}

void MainWindow::onConcurrencyChanged(int value) {
    updateLabel(concurrencyLabel_, QString::number(value));
    if (scheduler_ && isRunning_.load()) {
        try {
            scheduler_->set_concurrency(value);
        } catch (const ConfigError& e) {
            log(LogLevel::QUIET, QString::fromStdString(e.what()));
        }
    }
    updateSlotVisibility();
}

void MainWindow::onStartClicked() {
    if (isRunning_.load() || !catalogLoaded_) return;

    std::vector<CatalogItem> items = selectedItems();
    QString root = destinationRoot();
    if (items.empty() || root.isEmpty()) return;

    config_.destination_root = root.toStdString();
    config_.concurrency = concurrencySlider_->value();
    config_.use_cache = useCacheCheck_->isChecked();

    // Tear down the previous run before its gate and index
    scheduler_.reset();
    cacheGate_.reset();
    cacheIndex_.reset();

    std::string cacheRoot = cache_root(config_);
    std::vector<TransferTask> tasks = build_tasks(items, config_.cdn_base, cacheRoot);

    // Nothing on the drive changes until the run is known to fit. The index
    // sits under the cache root, so with caching off it is opened after the wipe.
    if (config_.use_cache) {
        openCacheIndex();
    }
    cacheGate_ = std::make_unique<CacheGate>(cacheRoot, config_.use_cache, cacheIndex_.get());

    std::optional<uint64_t> freeBytes;
    if (auto space = query_free_space(config_.destination_root)) {
        freeBytes = space->free_bytes;
    }
    int64_t required = cacheGate_->bytes_to_transfer(tasks);
    if (freeBytes && !check_capacity(required, *freeBytes)) {
        log(LogLevel::QUIET, QString::fromStdString(capacity_warning()));
        updateSummary();
        return;
    }

    std::string error;
    if (!prepare_cache_root(cacheRoot, selectedCategories(), !config_.use_cache, error)) {
        log(LogLevel::QUIET, QString::fromStdString(error));
        return;
    }
    if (!config_.use_cache) {
        openCacheIndex();
        cacheGate_ = std::make_unique<CacheGate>(cacheRoot, false, cacheIndex_.get());
    }

    scheduler_ = std::make_unique<Scheduler>(make_downloader_factory(config_), cacheGate_.get(),
                                             config_.retry_attempts);

    // Coordinator-thread callbacks; everything crosses to the GUI thread via
    // queued signals
    SchedulerCallbacks callbacks;
    callbacks.on_log_message = [this](const std::string& message) {
        emit logMessageReceived(QString::fromStdString(message));
    };
    callbacks.on_task_started = [this](uint64_t taskId, size_t slotIndex) {
        emit taskStarted(taskId, static_cast<int>(slotIndex));
    };
    callbacks.on_progress = [this](uint64_t taskId, int64_t transferred, int64_t total,
                                   const std::string& name) {
        int percent = compute_percent(transferred, total);
        auto it = lastPercent_.find(taskId);
        if (it != lastPercent_.end() && it->second == percent) return;
        lastPercent_[taskId] = percent;
        emit progressReceived(taskId, transferred, total, QString::fromStdString(name));
    };
    callbacks.on_task_terminal = [this](uint64_t taskId, TransferStatus outcome,
                                        const std::string& message) {
        lastPercent_.erase(taskId);
        emit taskFinished(taskId, static_cast<int>(outcome), QString::fromStdString(message));
    };
    callbacks.on_batch_complete = [this](const BatchSummary& summary) {
        emit batchComplete(static_cast<int>(summary.completed), static_cast<int>(summary.skipped),
                           static_cast<int>(summary.failed), static_cast<int>(summary.cancelled));
    };
    scheduler_->set_callbacks(callbacks);

    totalTasks_ = static_cast<int>(tasks.size());
    finishedTasks_ = 0;
    taskSlots_.clear();
    lastPercent_.clear();
    resetSlotBars();
    updateProgressBar(overallProgress_, 0);

    try {
        scheduler_->start(tasks, config_.concurrency, freeBytes);
    } catch (const ConfigError& e) {
        log(LogLevel::QUIET, QString::fromStdString(e.what()));
        scheduler_.reset();
        return;
    }

    isRunning_.store(true);
    setRunningUi(true);
    statsTimer_->start(1000);
    saveSettings();
    log(LogLevel::NORMAL, QString("Started %1 downloads to %2").arg(totalTasks_).arg(root));
}

void MainWindow::onCancelClicked() {
    if (!scheduler_ || !isRunning_.load()) return;
    scheduler_->cancel();
    cancelButton_->setEnabled(false);
    log(LogLevel::QUIET, "Cancelling downloads...");
}

void MainWindow::setRunningUi(bool running) {
    startButton_->setEnabled(!running);
    cancelButton_->setEnabled(running);
    driveCombo_->setEnabled(!running);
    refreshDrivesButton_->setEnabled(!running);
    browseButton_->setEnabled(!running);
    useCacheCheck_->setEnabled(!running);
    categoriesGroup_->setEnabled(!running);
    contentTree_->setEnabled(!running);
    if (!running) {
        updateSummary();
    }
}

void MainWindow::resetSlotBars() {
    for (size_t i = 0; i < slotBars_.size(); ++i) {
        slotBusy_[i] = false;
        slotBars_[i]->setValue(0);
        slotBars_[i]->setFormat("Idle");
    }
    updateSlotVisibility();
}

// Bars beyond the limit stay visible while their transfer finishes
void MainWindow::updateSlotVisibility() {
    int limit = concurrencySlider_->value();
    for (size_t i = 0; i < slotBars_.size(); ++i) {
        slotBars_[i]->setVisible(static_cast<int>(i) < limit || slotBusy_[i]);
    }
}

void MainWindow::handleTaskStarted(quint64 taskId, int slotIndex) {
    if (slotIndex < 0 || static_cast<size_t>(slotIndex) >= slotBars_.size()) return;
    taskSlots_.insert(taskId, slotIndex);
    slotBusy_[static_cast<size_t>(slotIndex)] = true;
    QProgressBar* bar = slotBars_[static_cast<size_t>(slotIndex)];
    bar->setValue(0);
    bar->setFormat("Connecting...");
    updateSlotVisibility();
}

void MainWindow::handleProgress(quint64 taskId, qint64 transferred, qint64 total, const QString& name) {
    auto it = taskSlots_.find(taskId);
    if (it == taskSlots_.end()) return;
    QProgressBar* bar = slotBars_[static_cast<size_t>(it.value())];
    updateProgressBar(bar, compute_percent(transferred, total));
    QString label = QString::fromStdString(format_progress_label(name.toStdString(), transferred, total));
    if (bar->format() != label) {
        bar->setFormat(label);
    }
}

void MainWindow::handleTaskFinished(quint64 taskId, int outcome, const QString& message) {
    TransferStatus status = static_cast<TransferStatus>(outcome);
    finishedTasks_++;

    auto it = taskSlots_.find(taskId);
    if (it != taskSlots_.end()) {
        size_t slot = static_cast<size_t>(it.value());
        slotBusy_[slot] = false;
        slotBars_[slot]->setFormat("Idle");
        slotBars_[slot]->setValue(0);
        taskSlots_.erase(it);
        updateSlotVisibility();
    }

    if (status == TransferStatus::FAILED) {
        log(LogLevel::QUIET, message);
    } else {
        log(LogLevel::VERBOSE, message);
    }

    int percent = totalTasks_ > 0 ? static_cast<int>(100LL * finishedTasks_ / totalTasks_) : 0;
    updateProgressBar(overallProgress_, percent);
    updateLabel(overallLabel_, QString("%1 / %2 items (%3%)")
        .arg(finishedTasks_).arg(totalTasks_).arg(percent));
}

void MainWindow::handleBatchComplete(int completed, int skipped, int failed, int cancelled) {
    statsTimer_->stop();
    isRunning_.store(false);
    setRunningUi(false);
    resetSlotBars();
    onStatsTimer();

    log(LogLevel::QUIET, QString("All downloads finished: %1 completed, %2 skipped, %3 failed, %4 cancelled")
        .arg(completed).arg(skipped).arg(failed).arg(cancelled));
    statusBar()->showMessage(failed > 0 ? "Finished with errors" : "All downloads finished!");
}

void MainWindow::onStatsTimer() {
    if (!scheduler_) return;
    SchedulerStats stats = scheduler_->get_stats();
    double speed = stats.elapsed_seconds > 0
        ? static_cast<double>(stats.bytes_transferred) / stats.elapsed_seconds : 0.0;
    statusBar()->showMessage(QString("Active: %1 | Pending: %2 | Downloaded: %3 | %4/s")
        .arg(stats.active)
        .arg(stats.pending)
        .arg(QString::fromStdString(format_bytes(stats.bytes_transferred)))
        .arg(QString::fromStdString(format_bytes(static_cast<int64_t>(speed)))));
}

void MainWindow::loadSettings() {
    QSettings settings;
    int concurrency = settings.value("concurrency", DEFAULT_CONCURRENCY).toInt();
    if (concurrency < MIN_CONCURRENCY || concurrency > MAX_CONCURRENCY) {
        concurrency = DEFAULT_CONCURRENCY;
    }
    concurrencySlider_->setValue(concurrency);
    updateLabel(concurrencyLabel_, QString::number(concurrency));
    useCacheCheck_->setChecked(settings.value("useCache", true).toBool());
    int verbosity = settings.value("logVerbosity", 1).toInt();
    if (verbosity >= 0 && verbosity < logVerbosityCombo_->count()) {
        logVerbosityCombo_->setCurrentIndex(verbosity);
    }
}

void MainWindow::saveSettings() {
    QSettings settings;
    settings.setValue("concurrency", concurrencySlider_->value());
    settings.setValue("useCache", useCacheCheck_->isChecked());
    settings.setValue("logVerbosity", logVerbosityCombo_->currentIndex());
    QString root = destinationRoot();
    if (!root.isEmpty()) {
        settings.setValue("lastDestination", root);
    }
}

bool MainWindow::shouldLog(LogLevel level) const {
    return static_cast<int>(level) <= static_cast<int>(logLevel_);
}

void MainWindow::log(LogLevel level, const QString& message) {
    if (shouldLog(level)) {
        appendLog(message);
    }
}

void MainWindow::appendLog(const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("[HH:mm:ss] ");
    QMutexLocker locker(&logMutex_);
    pendingLogs_.append(timestamp + message);
}

void MainWindow::flushPendingLogs() {
    QStringList logs;
    {
        QMutexLocker locker(&logMutex_);
        if (pendingLogs_.isEmpty()) return;
        logs.swap(pendingLogs_);
    }

    // Batch append all logs at once
    logView_->setUpdatesEnabled(false);
    for (const QString& line : logs) {
        logView_->appendPlainText(line);
    }
    logView_->setUpdatesEnabled(true);

    // Scroll to bottom
    QScrollBar* scrollBar = logView_->verticalScrollBar();
    scrollBar->setValue(scrollBar->maximum());
}

void MainWindow::updateProgressBar(QProgressBar* bar, int value) {
    if (bar->value() != value) {
        bar->setValue(value);
    }
}

void MainWindow::updateLabel(QLabel* label, const QString& text) {
    if (label->text() != text) {
        label->setText(text);
    }
}

} // namespace demoloader
