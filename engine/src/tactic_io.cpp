#include "vp/tactic_io.h"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace vp {

namespace {

double requireNumber(const Json& obj, const char* key, const std::string& context) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        throw std::invalid_argument(context + " missing numeric '" + key + "'");
    }
    return it->get<double>();
}

// Integral epoch value; floats are truncated, anything outside int64 throws
int64_t asTimestamp(const Json& v) {
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::invalid_argument("meta.last_modified out of range");
        }
        return static_cast<int64_t>(v.get<uint64_t>());
    }
    if (v.is_number_integer()) return v.get<int64_t>();

    // [-2^63, 2^63) is exactly representable as double
    double d = v.get<double>();
    double limit = std::ldexp(1.0, 63);
    if (!(d >= -limit && d < limit)) {
        throw std::invalid_argument("meta.last_modified out of range");
    }
    return static_cast<int64_t>(d);
}

// Strings pass through, null becomes empty, anything else is dumped
std::string asText(const Json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

std::string optionalText(const Json& obj, const char* key) {
    auto it = obj.find(key);
    return it == obj.end() ? std::string() : asText(*it);
}

Json anchorToJson(Vec2 v) {
    return Json::array({v.x, v.y});
}

Json textOrNull(const std::string& s) {
    return s.empty() ? Json(nullptr) : Json(s);
}

} // anonymous namespace

Json loadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::invalid_argument("JSON file not found: " + path);
    }
    return Json::parse(file);
}

Json selectTactic(const Json& root, const std::string& tacticId, int tacticIndex) {
    if (root.is_object()) return root;

    if (!root.is_array()) {
        throw std::invalid_argument(
            "Tactic JSON must be an object (single tactic) or a list (tactic export)");
    }
    if (root.empty()) {
        throw std::invalid_argument("Tactic JSON is an empty list");
    }

    if (!tacticId.empty()) {
        for (auto& t : root) {
            if (!t.is_object()) continue;
            auto meta = t.find("meta");
            if (meta == t.end() || !meta->is_object()) continue;
            if (optionalText(*meta, "tactic_id") == tacticId) return t;
        }
        throw std::invalid_argument("tactic_id '" + tacticId + "' not found in tactic list");
    }

    if (tacticIndex < 0 || tacticIndex >= static_cast<int>(root.size())) {
        throw std::invalid_argument("tactic_index " + std::to_string(tacticIndex) +
                                    " out of range (len=" + std::to_string(root.size()) + ")");
    }
    const Json& t = root[static_cast<size_t>(tacticIndex)];
    if (!t.is_object()) {
        throw std::invalid_argument("tactic_data[" + std::to_string(tacticIndex) +
                                    "] is not an object");
    }
    return t;
}

void ensureTacticSchema(const Json& tactic) {
    if (!tactic.is_object()) {
        throw std::invalid_argument("Tactic must be an object");
    }
    auto meta = tactic.find("meta");
    if (meta == tactic.end() || !meta->is_object()) {
        throw std::invalid_argument("Tactic missing 'meta' object");
    }
    auto frames = tactic.find("frames");
    if (frames == tactic.end() || !frames->is_array()) {
        throw std::invalid_argument("Tactic missing 'frames' list");
    }
}

TacticMeta parseMeta(const Json& meta) {
    TacticMeta out;

    auto pitch = meta.find("pitch");
    if (pitch == meta.end() || !pitch->is_object()) {
        throw std::invalid_argument("meta missing 'pitch' object");
    }
    out.pitch.length = requireNumber(*pitch, "length", "meta.pitch");
    out.pitch.width = requireNumber(*pitch, "width", "meta.pitch");
    if (out.pitch.length <= 0.0 || out.pitch.width <= 0.0) {
        throw std::invalid_argument("meta.pitch dimensions must be positive");
    }

    auto teams = meta.find("teams");
    if (teams != meta.end() && teams->is_object()) {
        for (auto it = teams->begin(); it != teams->end(); ++it) {
            TeamMeta tm;
            tm.name = optionalText(it.value(), "name");
            tm.color = optionalText(it.value(), "color");
            out.teams[parseTeam(it.key())] = tm;
        }
    }

    auto players = meta.find("players");
    if (players != meta.end() && players->is_array()) {
        for (auto& p : *players) {
            if (!p.is_object() || !p.contains("id")) {
                throw std::invalid_argument("meta.players entries need an 'id'");
            }
            PlayerMeta pm;
            pm.id = asText(p["id"]);
            pm.team = parseTeam(optionalText(p, "team"));
            pm.label = optionalText(p, "label");
            pm.role = optionalText(p, "role");
            out.players[pm.id] = pm;
        }
    }

    out.tacticId = optionalText(meta, "tactic_id");
    out.title = optionalText(meta, "title");

    auto lastModified = meta.find("last_modified");
    if (lastModified != meta.end() && lastModified->is_number()) {
        out.lastModified = asTimestamp(*lastModified);
        out.hasLastModified = true;
    }

    return out;
}

std::vector<RawFrame> parseRawFrames(const Json& frames) {
    if (!frames.is_array()) {
        throw std::invalid_argument("'frames' must be a list");
    }

    std::vector<RawFrame> out;
    out.reserve(frames.size());
    for (size_t i = 0; i < frames.size(); ++i) {
        const Json& f = frames[i];
        if (!f.is_object()) {
            throw std::invalid_argument("frame " + std::to_string(i) + " is not an object");
        }

        RawFrame rf;
        rf.id = optionalText(f, "id");
        rf.note = optionalText(f, "note");

        auto ball = f.find("ball");
        if (ball != f.end() && ball->is_object()) {
            auto x = ball->find("x");
            auto y = ball->find("y");
            if (x != ball->end() && x->is_number()) {
                rf.ball.x = x->get<double>();
                rf.ball.hasX = true;
            }
            if (y != ball->end() && y->is_number()) {
                rf.ball.y = y->get<double>();
                rf.ball.hasY = true;
            }
            rf.ball.ownerId = optionalText(*ball, "owner_id");
        }

        auto pos = f.find("player_pos");
        if (pos != f.end() && pos->is_object()) {
            for (auto it = pos->begin(); it != pos->end(); ++it) {
                const Json& xy = it.value();
                // Malformed entries are skipped, not fatal
                if (!xy.is_array() || xy.size() != 2 || !xy[0].is_number() || !xy[1].is_number()) {
                    continue;
                }
                rf.playerPos.push_back({it.key(), {xy[0].get<double>(), xy[1].get<double>()}});
            }
        }

        out.push_back(std::move(rf));
    }

    if (out.empty()) {
        throw std::invalid_argument("No frames parsed from tactic data");
    }
    return out;
}

Tactic parseTactic(const Json& tactic) {
    ensureTacticSchema(tactic);
    Tactic out;
    out.meta = parseMeta(tactic["meta"]);
    out.frames = parseRawFrames(tactic["frames"]);
    return out;
}

FocusPlan recommendPlayerFocusJson(const Json& root, const AlgoConfig& cfg,
                                   const std::string& tacticId, int tacticIndex) {
    Tactic tactic = parseTactic(selectTactic(root, tacticId, tacticIndex));
    return recommendPlayerFocus(tactic, cfg);
}

Json focusTargetToJson(const FocusTarget& focus) {
    Json j;
    j["target_type"] = focusTargetTypeName(focus.type);
    j["anchor"] = anchorToJson(focus.anchor);
    j["target_player_id"] = textOrNull(focus.targetPlayerId);
    j["tag"] = textOrNull(focus.tag);
    return j;
}

Json scoredEventToJson(const ScoredEvent& event) {
    Json j;
    j["name"] = event.name;
    j["score"] = event.score;
    j["focus"] = focusTargetToJson(event.focus);
    j["features"] = Json::object();
    for (auto& kv : event.features) {
        j["features"][kv.first] = kv.second;
    }
    j["reasons"] = event.reasons;
    if (!event.meta.empty()) {
        j["meta"] = Json::object();
        for (auto& kv : event.meta) {
            j["meta"][kv.first] = kv.second;
        }
    }
    return j;
}

Json recommendationToJson(const PlayerFocusRecommendation& rec, bool includeTopK) {
    Json j;
    j["player_id"] = rec.playerId;
    j["frame_idx"] = rec.frameIdx;
    j["t_rel"] = rec.tRel;
    j["primary"] = focusTargetToJson(rec.primary);
    j["primary_score"] = rec.primaryScore;
    j["rationale"] = rec.rationale;
    if (includeTopK) {
        j["top_k"] = Json::array();
        for (auto& ev : rec.topK) {
            j["top_k"].push_back(scoredEventToJson(ev));
        }
    }
    return j;
}

Json focusPlanToJson(const FocusPlan& plan, bool includeTopK) {
    Json players = Json::object();
    for (auto& pid : plan.playerIds) {
        Json list = Json::array();
        for (auto& rec : plan.forPlayer(pid)) {
            list.push_back(recommendationToJson(rec, includeTopK));
        }
        players[pid] = std::move(list);
    }

    Json j;
    j["num_frames"] = plan.numFrames;
    j["players"] = std::move(players);
    return j;
}

} // namespace vp
