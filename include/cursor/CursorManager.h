#ifndef CURSORMANAGER_H
#define CURSORMANAGER_H

#include <QCursor>
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QWidget>

/**
 * @brief Applies named cursor identities to the overlay widget.
 *
 * Cursor names follow the CSS vocabulary ("crosshair", "grab", "nw-resize",
 * ...). The name-to-QCursor cache is filled once at construction; applying
 * the identity that is already shown does nothing.
 *
 * Usage:
 * @code
 * CursorManager cursors;
 * cursors.setTargetWidget(overlay);
 * cursors.applyCursor(QStringLiteral("crosshair"));
 * @endcode
 */
class CursorManager : public QObject {
    Q_OBJECT

public:
    explicit CursorManager(QObject* parent = nullptr);

    // Disable copy
    CursorManager(const CursorManager&) = delete;
    CursorManager& operator=(const CursorManager&) = delete;

    /**
     * @brief Set the target widget for cursor changes.
     *
     * Resets the last applied identity so the next applyCursor() always
     * reaches the new widget.
     */
    void setTargetWidget(QWidget* widget);
    QWidget* targetWidget() const { return m_targetWidget; }

    /**
     * @brief Apply a cursor by name.
     * @return true if the widget cursor was changed, false when the name is
     *         unknown or already applied.
     */
    bool applyCursor(const QString& name);

    QString currentCursorName() const { return m_lastAppliedName; }

    bool hasCursor(const QString& name) const { return m_cursorCache.contains(name); }
    QStringList cursorNames() const { return m_cursorCache.keys(); }
    QCursor cursorFor(const QString& name) const;

    /**
     * @brief Number of times a cursor actually reached the widget.
     */
    int applyCount() const { return m_applyCount; }

private:
    void populateCache();

    QHash<QString, QCursor> m_cursorCache;
    QPointer<QWidget> m_targetWidget;
    QString m_lastAppliedName;
    int m_applyCount = 0;
};

#endif // CURSORMANAGER_H
