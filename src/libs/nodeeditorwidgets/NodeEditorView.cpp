// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodeeditorwidgets/NodeEditorView.hpp"

#include "nodeeditorwidgets/PrimitivePainter.hpp"

#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>
#include <QtGui/QWheelEvent>

namespace NodeEditor {

namespace {

PointerButton toPointerButton(Qt::MouseButton button)
{
    switch (button) {
    case Qt::LeftButton: return PointerButton::Left;
    case Qt::MiddleButton: return PointerButton::Middle;
    case Qt::RightButton: return PointerButton::Right;
    default: return PointerButton::None;
    }
}

} // namespace

NodeEditorView::NodeEditorView(QWidget* parent)
    : QWidget(parent)
    , m_commands(&m_graph)
    , m_renderer(&m_theme)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(true);
    setAttribute(Qt::WA_OpaquePaintEvent, true);

    m_controller = std::make_unique<InteractionController>(m_graph, m_viewport, m_selection, m_commands);
    setConfig(m_config);

    m_graphListener = m_graph.addListener([this](const GraphChange&) {
        update();
        emit graphChanged();
    });
    m_selectionListener = m_selection.addListener([this] {
        update();
        emit selectionChanged();
    });
}

NodeEditorView::~NodeEditorView()
{
    m_graph.removeListener(m_graphListener);
    m_selection.removeListener(m_selectionListener);
}

void NodeEditorView::setConfig(const NodeEditorConfig& config)
{
    m_config = config.validated();
    m_graph.applyConfig(m_config);
    m_renderer.setConfig(m_config);
    m_controller->setConfig(m_config);
    update();
}

void NodeEditorView::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter p(this);
    p.setRenderHints(QPainter::Antialiasing | QPainter::TextAntialiasing, true);
    p.fillRect(rect(), m_theme.color(ColorRole::Background));

    const DrawList list = m_renderer.render(m_graph, m_viewport, m_selection,
                                            m_controller->overlay(), QSizeF(size()));
    PrimitivePainter::paint(p, list);
}

void NodeEditorView::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    m_controller->setViewportSize(QSizeF(size()));
}

void NodeEditorView::mousePressEvent(QMouseEvent* event)
{
    setFocus(Qt::MouseFocusReason);
    const PointerEvent ev{event->position(), toPointerButton(event->button()), event->modifiers()};
    if (m_controller->pointerDown(ev)) {
        event->accept();
        update();
        return;
    }
    QWidget::mousePressEvent(event);
}

void NodeEditorView::mouseMoveEvent(QMouseEvent* event)
{
    const PointerEvent ev{event->position(), PointerButton::None, event->modifiers()};
    m_controller->pointerMove(ev);
    event->accept();
    update();
}

void NodeEditorView::mouseReleaseEvent(QMouseEvent* event)
{
    const PointerEvent ev{event->position(), toPointerButton(event->button()), event->modifiers()};
    if (m_controller->pointerUp(ev)) {
        event->accept();
        update();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

void NodeEditorView::wheelEvent(QWheelEvent* event)
{
    // One notch is 120 eighths of a degree.
    const WheelEvent ev{event->position(), event->angleDelta().y() / 120.0, event->modifiers()};
    if (m_controller->wheel(ev)) {
        event->accept();
        update();
        return;
    }
    QWidget::wheelEvent(event);
}

void NodeEditorView::keyPressEvent(QKeyEvent* event)
{
    if (m_controller->keyDown(KeyEvent{event->key(), event->modifiers()})) {
        // Grid and snap toggles live in the controller's copy.
        m_config = m_controller->config();
        m_renderer.setConfig(m_config);
        event->accept();
        update();
        return;
    }
    QWidget::keyPressEvent(event);
}

} // namespace NodeEditor
