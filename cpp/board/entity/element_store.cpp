#include "board/entity/element_store.h"

#include "board/geometry/geometry.h"

#include <algorithm>

namespace board {

void ElementStore::clear() noexcept {
    elements_.clear();
    tombstones_.clear();
    generation_++;
}

void ElementStore::load(const std::vector<Element>& elements) {
    elements_.clear();
    tombstones_.clear();
    elements_.reserve(elements.size());
    for (const Element& el : elements) {
        if (el.deleted) {
            tombstones_[el.id] = makeElement(el);
        } else {
            elements_.push_back(makeElement(el));
        }
    }
    sortByLayer();
    generation_++;
}

std::vector<ElementPtr>::iterator ElementStore::findLive(const std::string& id) {
    return std::find_if(elements_.begin(), elements_.end(), [&](const ElementPtr& e) { return e->id == id; });
}

ElementPtr ElementStore::find(const std::string& id) const {
    auto it = std::find_if(elements_.begin(), elements_.end(), [&](const ElementPtr& e) { return e->id == id; });
    return it != elements_.end() ? *it : nullptr;
}

ElementPtr ElementStore::findTombstone(const std::string& id) const {
    auto it = tombstones_.find(id);
    return it != tombstones_.end() ? it->second : nullptr;
}

void ElementStore::upsert(ElementPtr element) {
    if (!element) return;

    auto it = findLive(element->id);
    if (element->deleted) {
        if (it != elements_.end()) elements_.erase(it);
        tombstones_[element->id] = std::move(element);
        generation_++;
        return;
    }

    tombstones_.erase(element->id);
    if (it != elements_.end()) {
        *it = std::move(element);
    } else {
        elements_.push_back(std::move(element));
    }
    sortByLayer();
    generation_++;
}

bool ElementStore::replace(ElementPtr element) {
    if (!element || element->deleted) return false;
    auto it = findLive(element->id);
    if (it == elements_.end()) return false;

    const bool reorder = (*it)->layer != element->layer;
    *it = std::move(element);
    if (reorder) sortByLayer();
    generation_++;
    return true;
}

ElementPtr ElementStore::softDelete(const std::string& id) {
    auto it = findLive(id);
    if (it == elements_.end()) return nullptr;

    Element copy = **it;
    copy.deleted = true;
    ElementPtr parked = makeElement(std::move(copy));
    elements_.erase(it);
    tombstones_[id] = parked;
    generation_++;
    return parked;
}

ElementPtr ElementStore::restore(const std::string& id) {
    auto it = tombstones_.find(id);
    if (it == tombstones_.end()) return nullptr;

    Element copy = *it->second;
    copy.deleted = false;
    ElementPtr live = makeElement(std::move(copy));
    tombstones_.erase(it);
    elements_.push_back(live);
    sortByLayer();
    generation_++;
    return live;
}

ElementPtr ElementStore::topmostHit(Point2 point, float padding) const {
    for (auto it = elements_.rbegin(); it != elements_.rend(); ++it) {
        if (geometry::isHit(point, **it, padding)) return *it;
    }
    return nullptr;
}

std::int64_t ElementStore::maxLayer() const noexcept {
    return elements_.empty() ? 0 : elements_.back()->layer;
}

std::int64_t ElementStore::minLayer() const noexcept {
    return elements_.empty() ? 0 : elements_.front()->layer;
}

void ElementStore::sortByLayer() {
    std::stable_sort(elements_.begin(), elements_.end(), [](const ElementPtr& a, const ElementPtr& b) {
        if (a->layer != b->layer) return a->layer < b->layer;
        return a->createdAt < b->createdAt;
    });
}

} // namespace board
