// Drop target: forwards external file drags as notifications and shows the
// hover highlight it is told to show.
#pragma once
#include <QFrame>
#include <QStringList>

class QLabel;

class DropArea : public QFrame {
    Q_OBJECT
public:
    explicit DropArea(QWidget* parent = nullptr);

    // Compact layout once the queue has entries.
    void setCompact(bool compact);

public slots:
    void setHighlighted(bool on);

signals:
    void hoverStarted();
    void dragCancelled();
    void filesDropped(const QStringList& paths);
    void clicked();

protected:
    void dragEnterEvent(QDragEnterEvent* e) override;
    void dragLeaveEvent(QDragLeaveEvent* e) override;
    void dropEvent(QDropEvent* e) override;
    void mouseReleaseEvent(QMouseEvent* e) override;

private:
    void applyStyle();

    QLabel* label_ = nullptr; // child
    bool highlighted_ = false;
    bool compact_ = false;
};
