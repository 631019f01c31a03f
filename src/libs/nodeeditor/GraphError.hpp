// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"

#include <QtCore/QString>

#include <expected>

namespace NodeEditor {

enum class GraphErrorCode : quint8 {
	NotFound,
	InvalidDirection,
	TypeMismatch,
	SlotOccupied,
	SameNode,
	CycleDetected,
	MalformedGraph
};

inline const char* graphErrorCodeToString(GraphErrorCode code)
{
	switch (code) {
		case GraphErrorCode::NotFound: return "NotFound";
		case GraphErrorCode::InvalidDirection: return "InvalidDirection";
		case GraphErrorCode::TypeMismatch: return "TypeMismatch";
		case GraphErrorCode::SlotOccupied: return "SlotOccupied";
		case GraphErrorCode::SameNode: return "SameNode";
		case GraphErrorCode::CycleDetected: return "CycleDetected";
		case GraphErrorCode::MalformedGraph: return "MalformedGraph";
	}
	return "Unknown";
}

class NODEEDITOR_EXPORT GraphError final {
public:
	GraphError(GraphErrorCode code, QString message)
		: m_code(code), m_message(std::move(message)) {}

	GraphErrorCode code() const noexcept { return m_code; }
	const QString& message() const noexcept { return m_message; }

	QString toString() const
	{
		return QStringLiteral("%1: %2").arg(QString::fromLatin1(graphErrorCodeToString(m_code)), m_message);
	}

private:
	GraphErrorCode m_code;
	QString m_message;
};

template <typename T>
using GraphResult = std::expected<T, GraphError>;

inline std::unexpected<GraphError> graphError(GraphErrorCode code, QString message)
{
	return std::unexpected<GraphError>(GraphError(code, std::move(message)));
}

} // namespace NodeEditor
