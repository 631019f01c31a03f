// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodeeditor/NodeEditorGlobal.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QtGlobal>

namespace NodeEditor {

template <typename Tag>
class StrongId final
{
public:
	using value_type = quint64;

	constexpr StrongId() = default;
	explicit constexpr StrongId(value_type v) : m_value(v) {}

	constexpr value_type value() const { return m_value; }
	constexpr bool isValid() const { return m_value != 0; }

	explicit operator bool() const { return isValid(); }

	friend constexpr bool operator==(StrongId a, StrongId b) { return a.m_value == b.m_value; }
	friend constexpr bool operator!=(StrongId a, StrongId b) { return a.m_value != b.m_value; }
	friend constexpr bool operator<(StrongId a, StrongId b) { return a.m_value < b.m_value; }

private:
	value_type m_value = 0;
};

struct NodeIdTag {};
struct SocketIdTag {};
struct ConnectionIdTag {};

using NodeId       = StrongId<NodeIdTag>;
using SocketId     = StrongId<SocketIdTag>;
using ConnectionId = StrongId<ConnectionIdTag>;

#define DEFINE_QHASH_OVERLOAD(Id) \
inline size_t qHash(Id id, size_t seed = 0) noexcept {	\
	return ::qHash(id.value(), seed);					\
}

DEFINE_QHASH_OVERLOAD(NodeEditor::NodeId)
DEFINE_QHASH_OVERLOAD(NodeEditor::SocketId)
DEFINE_QHASH_OVERLOAD(NodeEditor::ConnectionId)

#undef DEFINE_QHASH_OVERLOAD

} // namespace NodeEditor
