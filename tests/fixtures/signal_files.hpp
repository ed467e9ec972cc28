#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include "tracker/ingestion/signal_source.hpp"

/// Declaration payloads in the layouts signal generators actually write
namespace fixtures {

/// Flat layout written by the forex scalper
inline nlohmann::json flat_signal(
    const std::string& signal_id,
    const std::string& symbol,
    const std::string& direction,
    double entry_price,
    double stop_loss,
    double take_profit,
    const std::string& source = "venom_scalp_master"
) {
    return nlohmann::json{
        {"signal_id", signal_id},
        {"symbol", symbol},
        {"direction", direction},
        {"entry_price", entry_price},
        {"stop_loss", stop_loss},
        {"take_profit", take_profit},
        {"source", source},
        {"tcs_score", 82.5},
        {"created_at", "2025-06-01T12:00:00Z"}
    };
}

/// Nested layout written by the crypto engine: levels inside enhanced_signal, symbol in pair
inline nlohmann::json enhanced_signal(
    const std::string& mission_id,
    const std::string& pair,
    const std::string& direction,
    double entry_price,
    double stop_loss,
    double take_profit,
    const std::string& engine = "C.O.R.E"
) {
    return nlohmann::json{
        {"mission_id", mission_id},
        {"pair", pair},
        {"engine", engine},
        {"confidence", 71.0},
        {"timestamp", 1748779200.0},
        {"citadel_shield", {{"score", 6.4}}},
        {"ml_result", {{"passed", true}}},
        {"enhanced_signal", {
            {"direction", direction},
            {"entry_price", entry_price},
            {"stop_loss", stop_loss},
            {"take_profit", take_profit}
        }}
    };
}

/// Wraps a payload the way DirectorySignalSource hands a file to the ingestion loop
inline TruthTracker::Core::SignalDeclaration declaration_from(
    const std::string& origin_name,
    const nlohmann::json& payload,
    double modified_at = 1748779200.0
) {
    TruthTracker::Core::SignalDeclaration declaration;
    declaration.origin_name = origin_name;
    declaration.raw_content = payload.dump();
    declaration.modified_at = modified_at;
    return declaration;
}

inline TruthTracker::Core::SignalDeclaration raw_declaration(
    const std::string& origin_name,
    const std::string& raw_content,
    double modified_at = 1748779200.0
) {
    TruthTracker::Core::SignalDeclaration declaration;
    declaration.origin_name = origin_name;
    declaration.raw_content = raw_content;
    declaration.modified_at = modified_at;
    return declaration;
}

} // namespace fixtures
