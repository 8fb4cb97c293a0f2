#include "vp/tactic.h"

namespace vp {

const PlayerMeta* TacticMeta::findPlayer(const std::string& id) const {
    auto it = players.find(id);
    if (it == players.end()) return nullptr;
    return &it->second;
}

const Vec2* Frame::findPlayer(const std::string& id) const {
    for (auto& p : players) {
        if (p.id == id) return &p.pos;
    }
    return nullptr;
}

} // namespace vp
