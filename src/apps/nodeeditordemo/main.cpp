// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QDebug>
#include <QtCore/QFile>
#include <QtCore/QSettings>
#include <QtCore/QTimer>

#include <QtGui/QAction>
#include <QtGui/QKeySequence>

#include <QtWidgets/QApplication>
#include <QtWidgets/QFileDialog>
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QMenu>
#include <QtWidgets/QMenuBar>
#include <QtWidgets/QMessageBox>
#include <QtWidgets/QStatusBar>

#include <nodeeditor/NodeEditorConfig.hpp>
#include <nodeeditor/document/GraphJsonSerializer.hpp>
#include <nodeeditorwidgets/NodeEditorView.hpp>

using namespace NodeEditor;
using namespace Qt::StringLiterals;

static void addSocket(GraphStore& graph, NodeId node, SocketDirection dir, const QString& type, const QString& label)
{
	if (auto sid = graph.addSocket(node, dir, type, label); !sid)
		qWarning().noquote() << "demo: addSocket failed:" << sid.error().toString();
}

static NodeId addNode(GraphStore& graph, const QPointF& pos, const QString& title, const QString& typeTag)
{
	NodePayload payload;
	payload.title = title;
	payload.typeTag = typeTag;
	return graph.addNode(pos, payload);
}

static void buildSampleGraph(GraphStore& graph)
{
	const NodeId constant = addNode(graph, QPointF(40.0, 60.0), u"Constant"_s, u"constant"_s);
	addSocket(graph, constant, SocketDirection::Output, u"number"_s, u"Value"_s);

	const NodeId math = addNode(graph, QPointF(240.0, 40.0), u"Add"_s, u"math.add"_s);
	addSocket(graph, math, SocketDirection::Input, u"number"_s, u"A"_s);
	addSocket(graph, math, SocketDirection::Input, u"number"_s, u"B"_s);
	addSocket(graph, math, SocketDirection::Output, u"number"_s, u"Result"_s);

	const NodeId print = addNode(graph, QPointF(440.0, 60.0), u"Print"_s, u"print"_s);
	addSocket(graph, print, SocketDirection::Input, u"any"_s, u"Value"_s);

	const auto link = [&graph](NodeId from, NodeId to, size_t inputIndex) {
		const Node* a = graph.node(from);
		const Node* b = graph.node(to);
		if (!a || !b || a->outputs.empty() || b->inputs.size() <= inputIndex)
			return;
		if (auto cid = graph.connect(a->outputs.front(), b->inputs[inputIndex]); !cid)
			qWarning().noquote() << "demo: connect failed:" << cid.error().toString();
	};
	link(constant, math, 0);
	link(math, print, 0);
}

static bool loadGraph(NodeEditorView& view, const QString& path, QString* error)
{
	QFile file(path);
	if (!file.open(QIODevice::ReadOnly)) {
		*error = file.errorString();
		return false;
	}
	auto snapshot = GraphJsonSerializer::fromBytes(file.readAll(), &view.viewport());
	if (!snapshot) {
		*error = snapshot.error().toString();
		return false;
	}
	if (auto ok = view.graph().importGraph(*snapshot); !ok) {
		*error = ok.error().toString();
		return false;
	}
	view.commands().clear();
	return true;
}

static bool saveGraph(NodeEditorView& view, const QString& path, QString* error)
{
	QFile file(path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		*error = file.errorString();
		return false;
	}
	const QByteArray bytes = GraphJsonSerializer::toBytes(view.graph().exportGraph(), &view.viewport());
	if (file.write(bytes) != bytes.size()) {
		*error = file.errorString();
		return false;
	}
	return true;
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QApplication::setOrganizationName(u"PanelKit"_s);
	QApplication::setApplicationName(u"NodeEditorDemo"_s);

	QCommandLineParser parser;
	parser.setApplicationDescription(u"Node editor panel demo"_s);
	parser.addHelpOption();
	parser.addPositionalArgument(u"graph"_s, u"Graph JSON file to open."_s);
	parser.process(app);

	QSettings settings;
	const NodeEditorConfig config = NodeEditorConfig::loadFromSettings(settings);

	QMainWindow window;
	auto* view = new NodeEditorView(&window);
	view->setConfig(config);
	view->graph().typeRules().declareConversion(u"number"_s, u"string"_s);
	window.setCentralWidget(view);
	window.resize(960, 640);

	const QStringList args = parser.positionalArguments();
	if (!args.isEmpty()) {
		QString error;
		if (!loadGraph(*view, args.front(), &error)) {
			qCritical().noquote() << "Failed to load" << args.front() << ":" << error;
			return 1;
		}
	} else {
		buildSampleGraph(view->graph());
	}

	QMenu* fileMenu = window.menuBar()->addMenu(u"&File"_s);
	QAction* openAction = fileMenu->addAction(u"&Open..."_s);
	openAction->setShortcut(QKeySequence::Open);
	QObject::connect(openAction, &QAction::triggered, &window, [&window, view] {
		const QString path = QFileDialog::getOpenFileName(&window, u"Open Graph"_s, {}, u"Graph (*.json)"_s);
		if (path.isEmpty())
			return;
		QString error;
		if (!loadGraph(*view, path, &error))
			QMessageBox::warning(&window, u"Open Graph"_s, error);
	});

	QAction* saveAction = fileMenu->addAction(u"&Save As..."_s);
	saveAction->setShortcut(QKeySequence::SaveAs);
	QObject::connect(saveAction, &QAction::triggered, &window, [&window, view] {
		const QString path = QFileDialog::getSaveFileName(&window, u"Save Graph"_s, {}, u"Graph (*.json)"_s);
		if (path.isEmpty())
			return;
		QString error;
		if (!saveGraph(*view, path, &error))
			QMessageBox::warning(&window, u"Save Graph"_s, error);
	});

	const auto showCounts = [&window, view] {
		window.statusBar()->showMessage(u"%1 nodes, %2 connections"_s
		                                    .arg(view->graph().nodeCount())
		                                    .arg(view->graph().connectionCount()));
	};
	QObject::connect(view, &NodeEditorView::graphChanged, &window, showCounts);
	showCounts();

	window.show();
	QTimer::singleShot(0, view, [view] { view->controller().frameAll(); view->update(); });

	const int rc = app.exec();
	view->config().saveToSettings(settings);
	return rc;
}
