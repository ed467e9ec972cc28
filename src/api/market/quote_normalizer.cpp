#include "quote_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>

using json = nlohmann::json;

namespace TruthTracker {
namespace API {

namespace {
    std::optional<double> read_price(const json& entry, const char* key) {
        if (!entry.contains(key)) {
            return std::nullopt;
        }
        const json& value = entry.at(key);
        if (value.is_number()) {
            return value.get<double>();
        }
        if (value.is_string()) {
            const std::string text = value.get<std::string>();
            char* parse_end = nullptr;
            double parsed_value = std::strtod(text.c_str(), &parse_end);
            if (!text.empty() && *parse_end == '\0') {
                return parsed_value;
            }
        }
        return std::nullopt;
    }

    std::string upper_symbol(const std::string& symbol) {
        std::string normalized_symbol = symbol;
        std::transform(normalized_symbol.begin(), normalized_symbol.end(), normalized_symbol.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return normalized_symbol;
    }

    void add_quote(const std::string& symbol, const json& entry, double received_at, NormalizedQuotes& normalized) {
        if (symbol.empty() || !entry.is_object()) {
            normalized.skipped_entry_count++;
            return;
        }
        std::optional<double> bid_price = read_price(entry, "bid");
        std::optional<double> ask_price = read_price(entry, "ask");
        if (!bid_price || !ask_price || *bid_price <= 0.0 || *ask_price <= 0.0) {
            normalized.skipped_entry_count++;
            return;
        }
        double observed_at = received_at;
        if (entry.contains("timestamp") && entry.at("timestamp").is_number()) {
            observed_at = entry.at("timestamp").get<double>();
        }
        normalized.quotes[upper_symbol(symbol)] = Core::MarketQuote(*bid_price, *ask_price, observed_at);
    }

    void add_symbol_entries(const json& entries, double received_at, NormalizedQuotes& normalized) {
        for (const json& entry : entries) {
            std::string symbol;
            if (entry.is_object() && entry.contains("symbol") && entry.at("symbol").is_string()) {
                symbol = entry.at("symbol").get<std::string>();
            }
            add_quote(symbol, entry, received_at, normalized);
        }
    }
}

std::string quote_response_shape_to_string(QuoteResponseShape shape) {
    switch (shape) {
        case QuoteResponseShape::SYMBOL_MAP:
            return "SYMBOL_MAP";
        case QuoteResponseShape::DATA_WRAPPER:
            return "DATA_WRAPPER";
        case QuoteResponseShape::FLAT_ARRAY:
            return "FLAT_ARRAY";
        case QuoteResponseShape::UNRECOGNIZED:
            return "UNRECOGNIZED";
        default:
            return "UNKNOWN";
    }
}

QuoteResponseShape detect_quote_response_shape(const json& response) {
    if (response.is_array()) {
        return QuoteResponseShape::FLAT_ARRAY;
    }
    if (!response.is_object()) {
        return QuoteResponseShape::UNRECOGNIZED;
    }
    // A blank reply carries no quotes and must not replace the cached snapshot
    if (response.empty()) {
        return QuoteResponseShape::UNRECOGNIZED;
    }

    bool every_value_is_quote = std::all_of(response.begin(), response.end(), [](const json& value) {
        return value.is_object() && (value.contains("bid") || value.contains("ask"));
    });
    if (every_value_is_quote) {
        return QuoteResponseShape::SYMBOL_MAP;
    }
    if (response.contains("data") && response.at("data").is_array()) {
        return QuoteResponseShape::DATA_WRAPPER;
    }
    return QuoteResponseShape::UNRECOGNIZED;
}

NormalizedQuotes normalize_quote_response(const json& response, double received_at) {
    NormalizedQuotes normalized;
    normalized.shape = detect_quote_response_shape(response);

    switch (normalized.shape) {
        case QuoteResponseShape::SYMBOL_MAP:
            for (auto quote_iterator = response.begin(); quote_iterator != response.end(); ++quote_iterator) {
                add_quote(quote_iterator.key(), quote_iterator.value(), received_at, normalized);
            }
            break;
        case QuoteResponseShape::DATA_WRAPPER:
            add_symbol_entries(response.at("data"), received_at, normalized);
            break;
        case QuoteResponseShape::FLAT_ARRAY:
            add_symbol_entries(response, received_at, normalized);
            break;
        case QuoteResponseShape::UNRECOGNIZED:
            break;
    }
    return normalized;
}

} // namespace API
} // namespace TruthTracker
