#include "mainwindow.h"

#include <QColorDialog>
#include <QHBoxLayout>
#include <QItemSelectionModel>
#include <QLabel>
#include <QLineEdit>
#include <QListView>
#include <QPalette>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSlider>
#include <QSortFilterProxyModel>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>

#include "deconz_log.h"
#include "lightlistmodel.h"
#include "lightsession.h"

namespace deconzctl {

namespace {

constexpr int kPreviewIntervalMs = 120;
constexpr int kStatusTimeoutMs = 8000;

} // namespace

MainWindow::MainWindow(LightSession *session, QWidget *parent)
    : QMainWindow(parent)
    , m_session(session)
{
    if (m_session)
        m_session->setParent(this);

    m_model = new LightListModel(this);
    m_filter = new QSortFilterProxyModel(this);
    m_filter->setSourceModel(m_model);
    m_filter->setFilterCaseSensitivity(Qt::CaseInsensitive);
    m_filter->setFilterRole(Qt::DisplayRole);

    m_previewTimer = new QTimer(this);
    m_previewTimer->setSingleShot(true);
    m_previewTimer->setInterval(kPreviewIntervalMs);

    buildUi();
    wireSignals();
    updateControls();

    // Load after the window is shown so a slow bridge does not delay it.
    QTimer::singleShot(0, this, &MainWindow::onRefresh);
}

MainWindow::~MainWindow() = default;

void MainWindow::buildUi()
{
    auto *central = new QWidget(this);
    auto *layout = new QHBoxLayout(central);

    auto *listColumn = new QVBoxLayout();
    m_editSearch = new QLineEdit(central);
    m_editSearch->setPlaceholderText(tr("Search lights"));
    m_editSearch->setClearButtonEnabled(true);
    m_listLights = new QListView(central);
    m_listLights->setModel(m_filter);
    m_listLights->setSelectionMode(QAbstractItemView::SingleSelection);
    m_listLights->setEditTriggers(QAbstractItemView::NoEditTriggers);
    listColumn->addWidget(m_editSearch);
    listColumn->addWidget(m_listLights, 1);

    auto *controller = new QVBoxLayout();
    controller->setSpacing(10);
    m_lblName = new QLabel(tr("No lamp selected"), central);
    QFont nameFont = m_lblName->font();
    nameFont.setBold(true);
    m_lblName->setFont(nameFont);
    m_lblStatus = new QLabel(central);
    m_lblSwatch = new QLabel(central);
    m_lblSwatch->setMinimumHeight(32);
    m_lblSwatch->setAutoFillBackground(true);

    m_btnToggle = new QPushButton(tr("Toggle lamp"), central);
    m_btnToggle->setToolTip(tr("Toggles the on/off state of the lamp"));
    m_btnColor = new QPushButton(tr("Change color"), central);
    m_btnColor->setToolTip(tr("Opens a color picker for the lamp"));

    m_sliderBrightness = new QSlider(Qt::Horizontal, central);
    m_sliderBrightness->setRange(0, 255);
    m_sliderBrightness->setToolTip(tr("Brightness"));

    m_btnRefresh = new QPushButton(tr("Refresh"), central);

    controller->addWidget(m_lblName);
    controller->addWidget(m_lblStatus);
    controller->addWidget(m_lblSwatch);
    controller->addWidget(m_btnToggle);
    controller->addWidget(m_btnColor);
    controller->addWidget(new QLabel(tr("Brightness"), central));
    controller->addWidget(m_sliderBrightness);
    controller->addStretch(1);
    controller->addWidget(m_btnRefresh);

    layout->addLayout(listColumn, 1);
    layout->addLayout(controller, 1);
    setCentralWidget(central);

    QString title = tr("Deconz Control");
    if (m_session && m_session->client() && m_session->client()->isDemo())
        title += tr(" (demo)");
    setWindowTitle(title);
    resize(500, 700);
}

void MainWindow::wireSignals()
{
    connect(m_editSearch, &QLineEdit::textChanged, this, &MainWindow::onSearchTextChanged);
    connect(m_listLights->selectionModel(), &QItemSelectionModel::currentChanged,
            this, &MainWindow::onCurrentLightChanged);
    connect(m_btnToggle, &QPushButton::clicked, this, &MainWindow::onToggle);
    connect(m_btnColor, &QPushButton::clicked, this, &MainWindow::onPickColor);
    connect(m_btnRefresh, &QPushButton::clicked, this, &MainWindow::onRefresh);
    connect(m_sliderBrightness, &QSlider::sliderReleased, this, &MainWindow::onBrightnessCommitted);
    connect(m_sliderBrightness, &QSlider::valueChanged, this, [this]() {
        if (!m_sliderBrightness->isSliderDown())
            onBrightnessCommitted();
    });
    connect(m_previewTimer, &QTimer::timeout, this, [this]() {
        if (m_session && m_pendingPreview.isValid())
            m_session->previewColor(m_pendingPreview);
    });

    if (!m_session)
        return;
    connect(m_session, &LightSession::lightsChanged, this, &MainWindow::onLightsChanged);
    connect(m_session, &LightSession::selectionChanged, this, &MainWindow::onSelectionChanged);
    connect(m_session, &LightSession::stateChanged, this, &MainWindow::onStateChanged);
    connect(m_session, &LightSession::errorOccurred, this, &MainWindow::onError);
}

void MainWindow::onSearchTextChanged(const QString &text)
{
    m_filter->setFilterFixedString(text.trimmed());
    syncListSelection();
}

void MainWindow::onCurrentLightChanged(const QModelIndex &current, const QModelIndex &previous)
{
    Q_UNUSED(previous);
    if (m_syncingSelection || !m_session || !current.isValid())
        return;

    const QModelIndex source = m_filter->mapToSource(current);
    const uint id = m_model->data(source, LightListModel::IdRole).toUInt();
    qCDebug(uiLog) << "Row" << source.row() << "was selected";
    m_session->select(id);
}

void MainWindow::onToggle()
{
    if (m_session)
        m_session->toggleSelected();
}

void MainWindow::onPickColor()
{
    if (!m_session || !m_session->selectedLight())
        return;

    const QColor initial = m_session->beginColorEdit();

    QColorDialog dialog(initial, this);
    dialog.setWindowTitle(tr("Color of %1").arg(m_session->selectedLight()->name));
    dialog.setOption(QColorDialog::NoButtons, false);

    connect(&dialog, &QColorDialog::currentColorChanged, this, [this](const QColor &color) {
        m_pendingPreview = color;
        if (!m_previewTimer->isActive())
            m_previewTimer->start();
    });

    const int result = dialog.exec();
    m_previewTimer->stop();
    m_pendingPreview = QColor();

    m_session->finishColorEdit(result == QDialog::Accepted, dialog.selectedColor());
}

void MainWindow::onBrightnessCommitted()
{
    if (!m_session || !m_session->selectedLight())
        return;
    const auto state = m_session->selectedState();
    if (state && state->bri && *state->bri == m_sliderBrightness->value())
        return;
    m_session->setSelectedBrightness(m_sliderBrightness->value());
}

void MainWindow::onRefresh()
{
    if (!m_session)
        return;
    if (m_session->reload() && m_session->selectedLight())
        m_session->refreshSelected();
}

void MainWindow::onLightsChanged()
{
    m_model->setLights(m_session->lights());
    syncListSelection();
    statusBar()->showMessage(tr("%n light(s) loaded", nullptr, m_model->rowCount()), kStatusTimeoutMs);
}

void MainWindow::onSelectionChanged()
{
    syncListSelection();
    updateControls();
}

void MainWindow::onStateChanged()
{
    updateControls();
}

void MainWindow::onError(const QString &message)
{
    qCWarning(uiLog).noquote() << message;
    statusBar()->showMessage(message, kStatusTimeoutMs);
}

void MainWindow::syncListSelection()
{
    m_syncingSelection = true;
    const auto selected = m_session ? m_session->selectedLight() : std::nullopt;
    const int sourceRow = selected ? m_model->rowForId(selected->id) : -1;
    const QModelIndex proxyIndex = sourceRow >= 0
        ? m_filter->mapFromSource(m_model->index(sourceRow))
        : QModelIndex();

    if (proxyIndex.isValid()) {
        m_listLights->selectionModel()->setCurrentIndex(proxyIndex, QItemSelectionModel::ClearAndSelect);
    } else {
        m_listLights->selectionModel()->clearSelection();
        m_listLights->selectionModel()->setCurrentIndex(QModelIndex(), QItemSelectionModel::NoUpdate);
    }
    m_syncingSelection = false;
}

void MainWindow::updateControls()
{
    const auto light = m_session ? m_session->selectedLight() : std::nullopt;
    const auto state = m_session ? m_session->selectedState() : std::nullopt;

    m_lblName->setText(light ? light->name : tr("No lamp selected"));
    m_btnToggle->setEnabled(light.has_value());
    m_btnColor->setEnabled(light.has_value());
    m_sliderBrightness->setEnabled(state.has_value() && state->bri.has_value());

    if (!state) {
        m_lblStatus->setText(light ? tr("State unknown") : QString());
        m_lblSwatch->setPalette(palette());
        return;
    }

    m_lblStatus->setText(tr("%1, %2").arg(state->on ? tr("On") : tr("Off"),
                                          state->reachable ? tr("reachable") : tr("unreachable")));

    QPalette swatch = m_lblSwatch->palette();
    swatch.setColor(QPalette::Window, hueSatBriToColor(displayColor(*state)));
    m_lblSwatch->setPalette(swatch);

    const QSignalBlocker blocker(m_sliderBrightness);
    m_sliderBrightness->setValue(state->bri.value_or(255));
}

} // namespace deconzctl
