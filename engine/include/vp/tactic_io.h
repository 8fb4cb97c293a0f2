#pragma once

#include "vp/config.h"
#include "vp/policy.h"
#include "vp/tactic.h"
#include <nlohmann/json.hpp>
#include <string>

namespace vp {

using Json = nlohmann::ordered_json;  // keeps authored key order

Json loadJsonFile(const std::string& path);

// Pick one tactic from a single tactic object or a list export.
// With a list: tacticId (when non-empty) matches meta.tactic_id, else tacticIndex.
Json selectTactic(const Json& root, const std::string& tacticId = "", int tacticIndex = 0);

// meta must be an object, frames a list
void ensureTacticSchema(const Json& tactic);

TacticMeta parseMeta(const Json& meta);
std::vector<RawFrame> parseRawFrames(const Json& frames);
Tactic parseTactic(const Json& tactic);

FocusPlan recommendPlayerFocusJson(const Json& root, const AlgoConfig& cfg,
                                   const std::string& tacticId = "", int tacticIndex = 0);

Json focusTargetToJson(const FocusTarget& focus);
Json scoredEventToJson(const ScoredEvent& event);
Json recommendationToJson(const PlayerFocusRecommendation& rec, bool includeTopK = true);
Json focusPlanToJson(const FocusPlan& plan, bool includeTopK = true);

} // namespace vp
