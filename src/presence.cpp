#include <canvas-sync/presence.hpp>

#include <canvas-sync/log.hpp>

namespace canvas_sync {

auto PresenceTracker::on_user_joined(const UserJoined& msg) -> const PresenceInfo& {
    const auto color = cursor_palette[color_index_++ % cursor_palette.size()];
    auto& entry = peers_[msg.user_id];
    entry = PresenceInfo{
        .user_id = msg.user_id,
        .username = msg.username,
        .status = PresenceStatus::idle,
        .color = std::string{color},
    };
    logger("presence")->debug("user {} ({}) joined with color {}", msg.user_id, msg.username, color);
    return entry;
}

auto PresenceTracker::on_user_left(const UserLeft& msg) -> bool {
    const auto had_cursor = cursors_.erase(msg.user_id) > 0;
    const auto had_peer = peers_.erase(msg.user_id) > 0;
    logger("presence")->debug("user {} ({}) left", msg.user_id, msg.username);
    return had_cursor || had_peer;
}

auto PresenceTracker::on_cursor_update(const CursorUpdate& msg) -> const CursorInfo& {
    auto& entry = cursors_[msg.user_id];
    entry = CursorInfo{.user_id = msg.user_id, .username = msg.username, .position = msg.position};
    return entry;
}

auto PresenceTracker::on_presence_update(const PresenceUpdate& msg) -> std::optional<PresenceInfo> {
    auto it = peers_.find(msg.user_id);
    if (it == peers_.end()) {
        logger("presence")->debug("ignoring status for unknown user {}", msg.user_id);
        return std::nullopt;
    }
    it->second.status = msg.status;
    return it->second;
}

auto PresenceTracker::cursor(UserId user_id) const -> std::optional<CursorInfo> {
    auto it = cursors_.find(user_id);
    if (it == cursors_.end()) return std::nullopt;
    return it->second;
}

auto PresenceTracker::peer(UserId user_id) const -> std::optional<PresenceInfo> {
    auto it = peers_.find(user_id);
    if (it == peers_.end()) return std::nullopt;
    return it->second;
}

}  // namespace canvas_sync
