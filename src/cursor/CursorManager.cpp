#include "cursor/CursorManager.h"

#include <QDebug>

CursorManager::CursorManager(QObject* parent)
    : QObject(parent)
{
    populateCache();
}

void CursorManager::populateCache()
{
    m_cursorCache.insert(QStringLiteral("default"), QCursor(Qt::ArrowCursor));
    m_cursorCache.insert(QStringLiteral("crosshair"), QCursor(Qt::CrossCursor));
    m_cursorCache.insert(QStringLiteral("pointer"), QCursor(Qt::PointingHandCursor));
    m_cursorCache.insert(QStringLiteral("grab"), QCursor(Qt::OpenHandCursor));
    m_cursorCache.insert(QStringLiteral("grabbing"), QCursor(Qt::ClosedHandCursor));
    m_cursorCache.insert(QStringLiteral("nw-resize"), QCursor(Qt::SizeFDiagCursor));
    m_cursorCache.insert(QStringLiteral("se-resize"), QCursor(Qt::SizeFDiagCursor));
    m_cursorCache.insert(QStringLiteral("ne-resize"), QCursor(Qt::SizeBDiagCursor));
    m_cursorCache.insert(QStringLiteral("sw-resize"), QCursor(Qt::SizeBDiagCursor));
    m_cursorCache.insert(QStringLiteral("n-resize"), QCursor(Qt::SizeVerCursor));
    m_cursorCache.insert(QStringLiteral("s-resize"), QCursor(Qt::SizeVerCursor));
    m_cursorCache.insert(QStringLiteral("e-resize"), QCursor(Qt::SizeHorCursor));
    m_cursorCache.insert(QStringLiteral("w-resize"), QCursor(Qt::SizeHorCursor));
}

void CursorManager::setTargetWidget(QWidget* widget)
{
    m_targetWidget = widget;
    m_lastAppliedName.clear();
}

QCursor CursorManager::cursorFor(const QString& name) const
{
    return m_cursorCache.value(name, QCursor(Qt::ArrowCursor));
}

bool CursorManager::applyCursor(const QString& name)
{
    if (name == m_lastAppliedName) {
        return false;
    }

    const auto it = m_cursorCache.constFind(name);
    if (it == m_cursorCache.constEnd()) {
        qWarning() << "CursorManager: Unknown cursor" << name;
        return false;
    }

    m_lastAppliedName = name;
    if (m_targetWidget) {
        m_targetWidget->setCursor(it.value());
    }
    ++m_applyCount;
    return true;
}
