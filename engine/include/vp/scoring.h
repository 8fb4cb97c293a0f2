#pragma once

#include "vp/config.h"
#include "vp/focus.h"
#include "vp/frame_graph.h"
#include <string>
#include <vector>

namespace vp {

// Role bonus for a candidate kind; 0 when the pair is not in the table.
// Role labels are matched trimmed and upper-cased.
double rolePrior(const std::vector<RolePrior>& table, const std::string& role,
                 const std::string& candidateName);

// Score one candidate. Reasons are appended in the order terms are applied.
ScoredEvent scoreCandidate(const FrameGraph& graph, const GraphNode& player,
                           const CandidateEvent& cand, const PlayerSummary& summary,
                           const AlgoConfig& cfg);

// Score, clamp if enabled, and rank descending. Equal scores keep
// generation order.
std::vector<ScoredEvent> scoreCandidates(const FrameGraph& graph, const std::string& playerId,
                                         const std::vector<CandidateEvent>& candidates,
                                         const SummaryMap& summaries, const AlgoConfig& cfg);

void rankByScore(std::vector<ScoredEvent>& events);

} // namespace vp
