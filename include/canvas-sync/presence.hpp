/// @file presence.hpp
/// @brief Presence and cursor tracking for remote participants.

#pragma once

#include <canvas-sync/protocol.hpp>

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace canvas_sync {

/// Last known pointer position of a remote participant.
struct CursorInfo {
    UserId user_id{0};
    std::string username;
    Position position;

    auto operator==(const CursorInfo&) const -> bool = default;
};

/// Online status of a remote participant.
struct PresenceInfo {
    UserId user_id{0};
    std::string username;
    PresenceStatus status{PresenceStatus::idle};
    std::string color;  ///< Display color assigned on join.

    auto operator==(const PresenceInfo&) const -> bool = default;
};

/// Colors handed out to participants in join order, cycling.
inline constexpr auto cursor_palette = std::array<std::string_view, 8>{
    "#6366f1", "#ec4899", "#f59e0b", "#10b981",
    "#3b82f6", "#8b5cf6", "#ef4444", "#14b8a6",
};

/// Tracks who else is in the document and where their pointer is.
///
/// Independent of document content: nothing here is merged or
/// persisted, and cursor positions are last-write-wins by arrival.
class PresenceTracker {
public:
    PresenceTracker() = default;

    /// Register a participant with status idle and the next palette color.
    auto on_user_joined(const UserJoined& msg) -> const PresenceInfo&;

    /// Forget a participant's presence entry and cursor.
    /// @return True if the participant was known.
    auto on_user_left(const UserLeft& msg) -> bool;

    /// Overwrite the participant's cursor.
    auto on_cursor_update(const CursorUpdate& msg) -> const CursorInfo&;

    /// Change the status of a known participant.
    /// @return The updated entry, or nullopt if the participant never joined.
    auto on_presence_update(const PresenceUpdate& msg) -> std::optional<PresenceInfo>;

    auto cursor(UserId user_id) const -> std::optional<CursorInfo>;
    auto peer(UserId user_id) const -> std::optional<PresenceInfo>;

    /// Copies of the current maps.
    auto cursors() const -> std::map<UserId, CursorInfo> { return cursors_; }
    auto peers() const -> std::map<UserId, PresenceInfo> { return peers_; }

private:
    std::map<UserId, CursorInfo> cursors_;
    std::map<UserId, PresenceInfo> peers_;
    std::size_t color_index_{0};
};

}  // namespace canvas_sync
