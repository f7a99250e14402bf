#pragma once

#include "board/core/element.h"

#include <cstdint>
#include <string>

namespace board {

enum class HistoryKind : std::uint8_t {
    Create = 0,
    Delete = 1,
    Update = 2,
};

// One reversible local operation. Update items carry only the fields that
// changed, in both directions.
struct HistoryItem {
    HistoryKind kind = HistoryKind::Create;
    std::string id;
    ElementPatch previous;
    ElementPatch next;

    static HistoryItem create(std::string id) { return {HistoryKind::Create, std::move(id), {}, {}}; }
    static HistoryItem remove(std::string id) { return {HistoryKind::Delete, std::move(id), {}, {}}; }
    static HistoryItem update(std::string id, ElementPatch previous, ElementPatch next) {
        return {HistoryKind::Update, std::move(id), std::move(previous), std::move(next)};
    }
};

} // namespace board
