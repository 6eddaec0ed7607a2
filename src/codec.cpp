#include "tix/codec.hpp"
#include "tix/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace tix {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

// Salvage a string id from a document that failed envelope validation.
std::string best_effort_id(const nlohmann::json& j) {
    if (!j.is_object()) return {};
    auto it = j.find("id");
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // anonymous namespace

nlohmann::json Codec::parse_document(std::string_view raw) {
    if (raw.empty()) {
        throw TixParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw TixParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw TixParseError(std::string("JSON parse error: ") + simdjson::error_message(val.error()));
        }
        nlohmann::json j = simdjson_to_nlohmann(val.value());
        // On-demand parsing only validates what it visits; reject trailing content.
        if (!doc.at_end()) {
            throw TixParseError("JSON parse error: trailing content after document");
        }
        return j;
    } catch (const TixParseError&) {
        throw;
    } catch (const simdjson::simdjson_error& e) {
        throw TixParseError(std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        throw TixParseError(std::string("JSON conversion error: ") + e.what());
    }
}

Request Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_document(raw);

    if (!j.is_object()) {
        throw TixParseError("Message must be a JSON object");
    }

    std::string id = best_effort_id(j);
    if (j.contains("id") && !j.at("id").is_string()) {
        throw TixParseError("Request id must be a string");
    }
    if (!j.contains("method")) {
        throw TixParseError("Missing 'method' field", id);
    }
    if (!j.at("method").is_string()) {
        throw TixParseError("'method' must be a string", id);
    }

    Request req;
    req.id = std::move(id);
    req.method = j.at("method").get<std::string>();
    if (j.contains("params") && !j.at("params").is_null()) req.params = j.at("params");
    return req;
}

Response Codec::parse_response(std::string_view raw) {
    nlohmann::json j = parse_document(raw);

    if (!j.is_object()) {
        throw TixParseError("Message must be a JSON object");
    }
    std::string id = best_effort_id(j);
    bool has_result = j.contains("result");
    bool has_error = j.contains("error");
    if (has_result == has_error) {
        throw TixParseError("Response must carry exactly one of 'result' or 'error'", id);
    }

    try {
        return j.get<Response>();
    } catch (const nlohmann::json::exception& e) {
        throw TixParseError(std::string("Malformed response: ") + e.what(), id);
    }
}

std::string Codec::serialize(const Response& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

std::string Codec::serialize(const Request& req) {
    nlohmann::json j;
    to_json(j, req);
    return j.dump();
}

} // namespace tix
