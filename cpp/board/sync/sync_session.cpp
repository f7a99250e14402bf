#include "board/sync/sync_session.h"

#include "board/core/logging.h"
#include "board/core/string_utils.h"
#include "board/entity/element_store.h"

#include <array>
#include <utility>

namespace board {

namespace {

const std::array<std::string, 8> kPresencePalette = {
    "#e03131", "#2f9e44", "#1971c2", "#f08c00",
    "#9c36b5", "#0c8599", "#e8590c", "#5c940d",
};

} // namespace

const char* persistStatusName(PersistStatus status) noexcept {
    switch (status) {
        case PersistStatus::Ok: return "ok";
        case PersistStatus::NetworkError: return "network-error";
        case PersistStatus::Denied: return "denied";
        case PersistStatus::NotFound: return "not-found";
        case PersistStatus::Rejected: return "rejected";
    }
    return "unknown";
}

const std::string& presenceColorFor(const std::string& userId) {
    return kPresencePalette[hashString(userId) % kPresencePalette.size()];
}

SyncSession::SyncSession(ElementStore& store, ElementRepository& repository, RealtimeChannel& channel, const BoardConfig& config)
    : store_(store),
      repository_(repository),
      channel_(channel),
      cursorThrottle_(config.cursorBroadcastIntervalMs),
      alive_(std::make_shared<bool>(true)) {}

SyncSession::~SyncSession() {
    leave();
}

void SyncSession::join(const std::string& spaceId, LocalIdentity identity) {
    if (joined_) leave();

    spaceId_ = spaceId;
    identity_ = std::move(identity);
    if (identity_.color.empty()) identity_.color = presenceColorFor(identity_.userId);
    joined_ = true;
    loaded_ = false;
    const std::uint64_t epoch = ++epoch_;

    BOARD_LOG_DEBUG("sync: joining space %s as %s", spaceId_.c_str(), identity_.userId.c_str());

    std::weak_ptr<bool> alive = alive_;
    repository_.fetch(spaceId_, [this, alive, epoch](const PersistResult& result, std::vector<Element> elements) {
        if (alive.expired() || epoch != epoch_) return;
        onFetched(result, std::move(elements));
    });
}

void SyncSession::onFetched(const PersistResult& result, std::vector<Element> elements) {
    if (!result.ok()) {
        lastFailure_ = result;
        BOARD_LOG_ERROR("sync: fetch of space %s failed (%s): %s",
            spaceId_.c_str(), persistStatusName(result.status), result.message.c_str());
        if (onFailure_) onFailure_(result);
        return;
    }

    // Local creations still waiting for their insert ack survive the reseed.
    std::vector<ElementPtr> unconfirmed;
    for (const std::string& id : pendingInserts_) {
        if (ElementPtr el = store_.find(id)) unconfirmed.push_back(std::move(el));
    }

    store_.load(elements);
    for (ElementPtr& el : unconfirmed) {
        if (!store_.contains(el->id)) store_.upsert(std::move(el));
    }
    loaded_ = true;

    BOARD_LOG_DEBUG("sync: loaded %zu elements", store_.size());

    std::weak_ptr<bool> alive = alive_;
    const std::uint64_t epoch = epoch_;
    channel_.subscribe(spaceId_,
        [this, alive, epoch](const ChangeEvent& event) {
            if (alive.expired() || epoch != epoch_) return;
            handleChange(event);
        },
        [this, alive, epoch](const std::vector<PresenceCursor>& snapshot) {
            if (alive.expired() || epoch != epoch_) return;
            handlePresence(snapshot);
        });
    subscribed_ = true;
}

void SyncSession::leave() {
    if (!joined_) return;
    if (subscribed_) channel_.unsubscribe();
    subscribed_ = false;
    joined_ = false;
    loaded_ = false;
    ++epoch_;
    pendingInserts_.clear();
    remoteCursors_.clear();
    cursorThrottle_.reset();
    BOARD_LOG_DEBUG("sync: left space %s", spaceId_.c_str());
}

void SyncSession::persistInsert(const Element& element) {
    pendingInserts_.insert(element.id);
    ++pendingWrites_;
    std::weak_ptr<bool> alive = alive_;
    const std::string id = element.id;
    repository_.insert(element, [this, alive, id](const PersistResult& result, std::optional<Element> stored) {
        if (alive.expired()) return;
        onInserted(id, result, stored);
    });
}

void SyncSession::onInserted(const std::string& id, const PersistResult& result, const std::optional<Element>& stored) {
    pendingInserts_.erase(id);
    onWriteDone("insert", id, result);
    if (!result.ok() || !stored) return;

    // Merge server-assigned fields; everything else stays as the user left it.
    ElementPtr local = store_.find(id);
    if (!local) return;
    if (local->createdAt == stored->createdAt && local->updatedAt == stored->updatedAt) return;
    Element merged = *local;
    merged.createdAt = stored->createdAt;
    merged.updatedAt = stored->updatedAt;
    store_.replace(makeElement(std::move(merged)));
}

void SyncSession::persistUpdate(const std::string& id, const ElementPatch& patch) {
    if (patch.empty()) return;
    ++pendingWrites_;
    std::weak_ptr<bool> alive = alive_;
    repository_.update(id, patch, [this, alive, id](const PersistResult& result) {
        if (alive.expired()) return;
        onWriteDone("update", id, result);
    });
}

void SyncSession::persistDelete(const std::string& id) {
    ElementPatch patch;
    patch.deleted = true;
    ++pendingWrites_;
    std::weak_ptr<bool> alive = alive_;
    repository_.update(id, patch, [this, alive, id](const PersistResult& result) {
        if (alive.expired()) return;
        onWriteDone("delete", id, result);
    });
}

void SyncSession::onWriteDone(const char* op, const std::string& id, const PersistResult& result) {
    if (pendingWrites_ > 0) --pendingWrites_;
    if (result.ok()) return;

    ++failedWrites_;
    lastFailure_ = result;
    BOARD_LOG_WARN("sync: %s of %s failed (%s): %s",
        op, id.c_str(), persistStatusName(result.status), result.message.c_str());
    if (onFailure_) onFailure_(result);
}

void SyncSession::handleChange(const ChangeEvent& event) {
    const Element& incoming = event.element;
    if (incoming.id.empty()) return;

    if (event.type == ChangeType::Insert) {
        // Echo of our own optimistic insert; the local copy may already be newer.
        // Only ids already held (live or tombstoned) count as echoes: an insert
        // by the same user under an unseen id comes from another session of
        // that user and is merged like any remote insert.
        const bool known = store_.contains(incoming.id) || store_.findTombstone(incoming.id) != nullptr;
        if (incoming.authorId == identity_.userId && known) return;
        store_.upsert(makeElement(incoming));
        return;
    }

    if (incoming.deleted) {
        const bool wasLive = store_.contains(incoming.id);
        store_.upsert(makeElement(incoming));
        if (wasLive && onRemoved_) onRemoved_(incoming.id);
        return;
    }

    store_.upsert(makeElement(incoming));
}

void SyncSession::handlePresence(const std::vector<PresenceCursor>& snapshot) {
    std::vector<PresenceCursor> next;
    next.reserve(snapshot.size());
    for (const PresenceCursor& cursor : snapshot) {
        if (cursor.userId.empty() || cursor.userId == identity_.userId) continue;
        next.push_back(cursor);
    }
    remoteCursors_ = std::move(next);
}

void SyncSession::publishCursor(Point2 canvasPoint, double nowMs) {
    if (!subscribed_) return;
    if (std::optional<Point2> out = cursorThrottle_.offer(canvasPoint, nowMs)) {
        sendPresence(*out);
    }
}

void SyncSession::tick(double nowMs) {
    if (!subscribed_) return;
    if (std::optional<Point2> out = cursorThrottle_.flush(nowMs)) {
        sendPresence(*out);
    }
}

void SyncSession::sendPresence(Point2 point) {
    channel_.publishPresence(PresenceCursor{identity_.userId, point, identity_.color, identity_.displayName});
}

} // namespace board
