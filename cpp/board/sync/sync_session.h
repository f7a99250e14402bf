#pragma once

#include "board/core/config.h"
#include "board/core/element.h"
#include "board/sync/cursor_throttle.h"
#include "board/sync/sync_types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace board {

class ElementStore;

struct LocalIdentity {
    std::string userId;
    std::string displayName;
    std::string color;
};

// Deterministic palette color for a user without a profile color.
const std::string& presenceColorFor(const std::string& userId);

/**
 * SyncSession: bridge between the ElementStore and the external persistence
 * and realtime capabilities for one collaborative space.
 *
 * Local mutations are already applied to the store when persist* is called;
 * failures are logged and counted but never rolled back. Remote notifications
 * are merged by id with last-writer-wins semantics.
 */
class SyncSession {
public:
    using RemovalHandler = std::function<void(const std::string& id)>;
    using FailureHandler = std::function<void(const PersistResult& result)>;

    SyncSession(ElementStore& store, ElementRepository& repository, RealtimeChannel& channel, const BoardConfig& config);
    ~SyncSession();

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;

    // Fetches the space, seeds the store, then subscribes to changes and presence.
    void join(const std::string& spaceId, LocalIdentity identity);
    void leave();

    bool joined() const noexcept { return joined_; }
    bool loaded() const noexcept { return loaded_; }
    const std::string& spaceId() const noexcept { return spaceId_; }
    const LocalIdentity& identity() const noexcept { return identity_; }

    void persistInsert(const Element& element);
    void persistUpdate(const std::string& id, const ElementPatch& patch);
    void persistDelete(const std::string& id);

    void handleChange(const ChangeEvent& event);
    void handlePresence(const std::vector<PresenceCursor>& snapshot);

    void publishCursor(Point2 canvasPoint, double nowMs);
    void tick(double nowMs);

    const std::vector<PresenceCursor>& remoteCursors() const noexcept { return remoteCursors_; }

    std::size_t failedWrites() const noexcept { return failedWrites_; }
    std::size_t pendingWrites() const noexcept { return pendingWrites_; }
    const PersistResult& lastFailure() const noexcept { return lastFailure_; }

    void setRemovalHandler(RemovalHandler handler) { onRemoved_ = std::move(handler); }
    void setFailureHandler(FailureHandler handler) { onFailure_ = std::move(handler); }

private:
    void onFetched(const PersistResult& result, std::vector<Element> elements);
    void onInserted(const std::string& id, const PersistResult& result, const std::optional<Element>& stored);
    void onWriteDone(const char* op, const std::string& id, const PersistResult& result);
    void sendPresence(Point2 point);

    ElementStore& store_;
    ElementRepository& repository_;
    RealtimeChannel& channel_;

    std::string spaceId_;
    LocalIdentity identity_;
    bool joined_ = false;
    bool loaded_ = false;
    bool subscribed_ = false;
    std::uint64_t epoch_ = 0;

    std::unordered_set<std::string> pendingInserts_;
    std::vector<PresenceCursor> remoteCursors_;
    CursorThrottle cursorThrottle_;

    std::size_t failedWrites_ = 0;
    std::size_t pendingWrites_ = 0;
    PersistResult lastFailure_;

    RemovalHandler onRemoved_;
    FailureHandler onFailure_;

    // Expires with the session; in-flight callbacks check it before touching `this`.
    std::shared_ptr<bool> alive_;
};

} // namespace board
