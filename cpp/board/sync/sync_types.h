#pragma once

#include "board/core/element.h"
#include "board/core/types.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace board {

enum class PersistStatus : std::uint8_t {
    Ok = 0,
    NetworkError = 1,
    Denied = 2,
    NotFound = 3,
    Rejected = 4,
};

struct PersistResult {
    PersistStatus status = PersistStatus::Ok;
    std::string message;

    bool ok() const noexcept { return status == PersistStatus::Ok; }
};

const char* persistStatusName(PersistStatus status) noexcept;

enum class ChangeType : std::uint8_t {
    Insert = 0,
    Update = 1,
};

// Row-level notification from the realtime feed. Deletes arrive as updates
// with `element.deleted` set.
struct ChangeEvent {
    ChangeType type = ChangeType::Insert;
    Element element;
};

struct PresenceCursor {
    std::string userId;
    Point2 point{0.0f, 0.0f};
    std::string color;
    std::string displayName;
};

using FetchCallback = std::function<void(const PersistResult&, std::vector<Element>)>;
using InsertCallback = std::function<void(const PersistResult&, std::optional<Element>)>;
using AckCallback = std::function<void(const PersistResult&)>;
using ChangeHandler = std::function<void(const ChangeEvent&)>;
using PresenceHandler = std::function<void(const std::vector<PresenceCursor>&)>;

// Persistent store. Callbacks may run synchronously or on a later turn of the
// event loop.
class ElementRepository {
public:
    virtual ~ElementRepository() = default;

    // Non-deleted elements of the space, ordered by (layer, createdAt).
    virtual void fetch(const std::string& spaceId, FetchCallback done) = 0;
    // Stored row with server-assigned fields on success.
    virtual void insert(const Element& element, InsertCallback done) = 0;
    virtual void update(const std::string& id, const ElementPatch& patch, AckCallback done) = 0;
};

// Realtime transport: change feed plus presence for one space at a time.
class RealtimeChannel {
public:
    virtual ~RealtimeChannel() = default;

    virtual void subscribe(const std::string& spaceId, ChangeHandler onChange, PresenceHandler onPresence) = 0;
    virtual void publishPresence(const PresenceCursor& cursor) = 0;
    virtual void unsubscribe() = 0;
};

// Produces encoded preview image bytes of the current board.
class ThumbnailRenderer {
public:
    virtual ~ThumbnailRenderer() = default;

    virtual std::vector<std::uint8_t> render() = 0;
};

class ThumbnailUploader {
public:
    virtual ~ThumbnailUploader() = default;

    using UploadCallback = std::function<void(const PersistResult&, const std::string& publicUrl)>;
    virtual void upload(const std::string& spaceId, std::vector<std::uint8_t> imageBytes, UploadCallback done) = 0;
};

} // namespace board
