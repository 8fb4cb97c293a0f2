#include "vp/focus.h"
#include <cmath>

namespace vp {

bool sameFocus(const FocusTarget& a, const FocusTarget& b, double tol) {
    if (a.type != b.type) return false;
    if (a.targetPlayerId != b.targetPlayerId) return false;
    return std::abs(a.anchor.x - b.anchor.x) <= tol && std::abs(a.anchor.y - b.anchor.y) <= tol;
}

} // namespace vp
