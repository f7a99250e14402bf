#pragma once

#include "board/core/element.h"
#include "board/core/types.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace board {

/**
 * ElementStore: canonical element list for the active space.
 *
 * Live elements are kept sorted by (layer, createdAt); the last entry is
 * drawn on top. Records are immutable and replaced wholesale on every change
 * so a reader holding an ElementPtr always sees a complete snapshot.
 * Soft-deleted elements leave the list and are parked as tombstones so that
 * undo/redo can bring them back.
 */
class ElementStore {
public:
    void clear() noexcept;

    // Replaces the whole content (initial fetch). Deleted records become tombstones.
    void load(const std::vector<Element>& elements);

    const std::vector<ElementPtr>& elements() const noexcept { return elements_; }
    std::size_t size() const noexcept { return elements_.size(); }

    ElementPtr find(const std::string& id) const;
    ElementPtr findTombstone(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    // Inserts or replaces by id and re-sorts. A record flagged deleted is parked instead.
    void upsert(ElementPtr element);

    // Replaces an existing live element; returns false when the id is not live.
    bool replace(ElementPtr element);

    // Moves a live element to the tombstones with deleted=true.
    ElementPtr softDelete(const std::string& id);

    // Brings a tombstoned element back with deleted=false.
    ElementPtr restore(const std::string& id);

    // Topmost live element hit by `point` (reverse draw order).
    ElementPtr topmostHit(Point2 point, float padding) const;

    std::int64_t maxLayer() const noexcept;
    std::int64_t minLayer() const noexcept;

    // Bumped on every change; the render loop compares it between frames.
    std::uint64_t generation() const noexcept { return generation_; }

private:
    std::vector<ElementPtr>::iterator findLive(const std::string& id);
    void sortByLayer();

    std::vector<ElementPtr> elements_;
    std::unordered_map<std::string, ElementPtr> tombstones_;
    std::uint64_t generation_ = 0;
};

} // namespace board
