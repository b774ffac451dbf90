#pragma once

#include <QColor>
#include <QMainWindow>

class QLabel;
class QLineEdit;
class QListView;
class QModelIndex;
class QPushButton;
class QSlider;
class QSortFilterProxyModel;
class QTimer;

namespace deconzctl {

class LightListModel;
class LightSession;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(LightSession *session, QWidget *parent = nullptr);
    ~MainWindow() override;

private slots:
    void onSearchTextChanged(const QString &text);
    void onCurrentLightChanged(const QModelIndex &current, const QModelIndex &previous);
    void onToggle();
    void onPickColor();
    void onBrightnessCommitted();
    void onRefresh();

    void onLightsChanged();
    void onSelectionChanged();
    void onStateChanged();
    void onError(const QString &message);

private:
    void buildUi();
    void wireSignals();
    void syncListSelection();
    void updateControls();

    LightSession *m_session = nullptr;
    LightListModel *m_model = nullptr;
    QSortFilterProxyModel *m_filter = nullptr;
    bool m_syncingSelection = false;

    QLineEdit *m_editSearch = nullptr;
    QListView *m_listLights = nullptr;

    QLabel *m_lblName = nullptr;
    QLabel *m_lblStatus = nullptr;
    QLabel *m_lblSwatch = nullptr;
    QPushButton *m_btnToggle = nullptr;
    QPushButton *m_btnColor = nullptr;
    QSlider *m_sliderBrightness = nullptr;
    QPushButton *m_btnRefresh = nullptr;

    // Coalesces color picker drags into one request per interval.
    QTimer *m_previewTimer = nullptr;
    QColor m_pendingPreview;
};

} // namespace deconzctl
