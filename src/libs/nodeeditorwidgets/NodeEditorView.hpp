// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditorwidgets/NodeEditorWidgetsGlobal.hpp"

#include <nodeeditor/GraphStore.hpp>
#include <nodeeditor/NodeEditorConfig.hpp>
#include <nodeeditor/SelectionModel.hpp>
#include <nodeeditor/ViewportTransform.hpp>
#include <nodeeditor/commands/GraphCommandManager.hpp>
#include <nodeeditor/controllers/InteractionController.hpp>
#include <nodeeditor/render/RendererAdapter.hpp>
#include <nodeeditor/render/ThemeProvider.hpp>

#include <QtWidgets/QWidget>

#include <memory>

namespace NodeEditor {

// Hosts the editor core inside a QWidget: translates Qt input into normalized
// events and paints the renderer's draw list.
class NODEEDITORWIDGETS_EXPORT NodeEditorView final : public QWidget
{
    Q_OBJECT

public:
    explicit NodeEditorView(QWidget* parent = nullptr);
    ~NodeEditorView() override;

    GraphStore& graph() noexcept { return m_graph; }
    SelectionModel& selection() noexcept { return m_selection; }
    ViewportTransform& viewport() noexcept { return m_viewport; }
    GraphCommandManager& commands() noexcept { return m_commands; }
    InteractionController& controller() noexcept { return *m_controller; }
    DefaultThemeProvider& theme() noexcept { return m_theme; }

    const NodeEditorConfig& config() const noexcept { return m_config; }
    void setConfig(const NodeEditorConfig& config);

signals:
    void graphChanged();
    void selectionChanged();

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    NodeEditorConfig m_config;
    GraphStore m_graph;
    SelectionModel m_selection;
    ViewportTransform m_viewport;
    GraphCommandManager m_commands;
    DefaultThemeProvider m_theme;
    RendererAdapter m_renderer;
    std::unique_ptr<InteractionController> m_controller;

    GraphStore::ListenerId m_graphListener = 0;
    SelectionModel::ListenerId m_selectionListener = 0;
};

} // namespace NodeEditor
