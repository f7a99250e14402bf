#pragma once

#include "board/interaction/interaction_session.h"

namespace board {

class InteractionSessionTestAccess {
public:
    static ToolState& state(InteractionSession& session) {
        return session.state_;
    }

    static const DrawStyle& style(const InteractionSession& session) {
        return session.style_;
    }

    static float hitPadding(const InteractionSession& session) {
        return session.hitPadding();
    }
};

} // namespace board
