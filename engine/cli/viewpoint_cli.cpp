#include "vp/config_io.h"
#include "vp/policy.h"
#include "vp/tactic_io.h"
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

using namespace vp;

namespace {

struct Options {
    std::string tacticPath;
    std::string tacticId;
    int tacticIndex = 0;
    std::string configPath;
    int topK = 0;               // 0 = keep the config's value
    std::string mode = "primary";
    std::string outPath;
    bool verbose = false;
};

void printUsage() {
    std::cout << "Usage: viewpoint_cli --tactic=PATH [options]\n"
              << "\nOptions:\n"
              << "  --tactic=PATH       Tactic JSON (single tactic or tactic export list)\n"
              << "  --tactic-id=ID      Select tactic by meta.tactic_id when the JSON is a list\n"
              << "  --tactic-index=N    Select tactic by index when the JSON is a list (default: 0)\n"
              << "  --config=PATH       JSON file of config overrides (snake_case keys)\n"
              << "  --top-k=N           Ranked alternatives to keep (overrides config)\n"
              << "  --mode=MODE         primary: focus only, topk: include ranked alternatives\n"
              << "                      (default: primary)\n"
              << "  --out=PATH          Write recommendations here instead of stdout\n"
              << "  --verbose           Print config and focus switches to stderr\n"
              << "  --help              Show this help\n";
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--tactic=") == 0) opts.tacticPath = arg.substr(9);
        else if (arg.find("--tactic-id=") == 0) opts.tacticId = arg.substr(12);
        else if (arg.find("--tactic-index=") == 0) opts.tacticIndex = std::stoi(arg.substr(15));
        else if (arg.find("--config=") == 0) opts.configPath = arg.substr(9);
        else if (arg.find("--top-k=") == 0) opts.topK = std::stoi(arg.substr(8));
        else if (arg.find("--mode=") == 0) opts.mode = arg.substr(7);
        else if (arg.find("--out=") == 0) opts.outPath = arg.substr(6);
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help") { printUsage(); std::exit(0); }
        else { std::cerr << "Unknown option: " << arg << "\n"; printUsage(); std::exit(1); }
    }
    if (opts.tacticPath.empty()) {
        std::cerr << "Missing --tactic\n";
        printUsage();
        std::exit(1);
    }
    if (opts.mode != "primary" && opts.mode != "topk") {
        std::cerr << "Unknown mode: " << opts.mode << "\n";
        printUsage();
        std::exit(1);
    }
    return opts;
}

// Frames where a player's primary target differs from the previous frame
void reportSwitches(const FocusPlan& plan) {
    for (auto& pid : plan.playerIds) {
        const auto& recs = plan.forPlayer(pid);
        int switches = 0;
        for (size_t i = 1; i < recs.size(); ++i) {
            if (!sameFocus(recs[i].primary, recs[i - 1].primary)) ++switches;
        }
        std::cerr << "  " << pid << ": " << switches << " switch(es), frame 0 -> "
                  << focusTargetTypeName(recs.front().primary.type);
        if (!recs.front().primary.targetPlayerId.empty()) {
            std::cerr << " " << recs.front().primary.targetPlayerId;
        }
        std::cerr << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        Options opts = parseArgs(argc, argv);

        AlgoConfig cfg;
        if (!opts.configPath.empty()) {
            cfg = loadConfig(opts.configPath);
        }
        if (opts.topK > 0) cfg.topK = opts.topK;

        Json root = loadJsonFile(opts.tacticPath);
        Json selected = selectTactic(root, opts.tacticId, opts.tacticIndex);
        Tactic tactic = parseTactic(selected);

        if (opts.verbose) {
            std::cerr << "Config: " << configToJson(cfg).dump() << "\n";
            std::cerr << "Tactic: " << tactic.meta.tacticId;
            if (!tactic.meta.title.empty()) std::cerr << " (" << tactic.meta.title << ")";
            std::cerr << "\nFrames: " << tactic.frames.size() << "\n";
        }

        FocusPlan plan = recommendPlayerFocus(tactic, cfg);

        if (opts.verbose) {
            std::cerr << "Players: " << plan.playerIds.size() << "\n";
            reportSwitches(plan);
        }

        Json out = focusPlanToJson(plan, opts.mode == "topk");
        out["tactic_id"] = tactic.meta.tacticId;

        if (opts.outPath.empty()) {
            std::cout << out.dump(2) << "\n";
        } else {
            std::ofstream file(opts.outPath);
            if (!file.is_open()) {
                std::cerr << "error: cannot write " << opts.outPath << "\n";
                return 1;
            }
            file << out.dump(2) << "\n";
            std::cout << "Wrote " << plan.playerIds.size() << " players x " << plan.numFrames
                      << " frames to " << opts.outPath << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
