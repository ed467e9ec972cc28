#ifndef QUOTE_NORMALIZER_HPP
#define QUOTE_NORMALIZER_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace TruthTracker {
namespace API {

enum class QuoteResponseShape {
    SYMBOL_MAP,         // {"EURUSD": {"bid":..,"ask":..}, ...}
    DATA_WRAPPER,       // {"data": [{"symbol":..,"bid":..,"ask":..}, ...]}
    FLAT_ARRAY,         // [{"symbol":..,"bid":..,"ask":..}, ...]
    UNRECOGNIZED
};

std::string quote_response_shape_to_string(QuoteResponseShape shape);

struct NormalizedQuotes {
    QuoteResponseShape shape;
    Core::QuoteSnapshot quotes;
    size_t skipped_entry_count;     // entries without a symbol or a positive bid and ask

    NormalizedQuotes() : shape(QuoteResponseShape::UNRECOGNIZED), skipped_entry_count(0) {}
};

QuoteResponseShape detect_quote_response_shape(const nlohmann::json& response);

// Symbols are upper-cased. Quotes missing a positive bid or ask are dropped, never filled in.
NormalizedQuotes normalize_quote_response(const nlohmann::json& response, double received_at);

} // namespace API
} // namespace TruthTracker

#endif // QUOTE_NORMALIZER_HPP
