#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace reagent::agent {

enum class ParseStatus {
    kOk,
    // The reply contains an "Observation:" line or more than one action:
    // the model ran ahead of the protocol and the whole reply is discarded.
    kRunaway,
    // "Action:" or "Action Input:" is missing.
    kMalformed,
    // Both tags are present but the input is not a JSON object.
    kInvalidInput
};

const char* ToString(ParseStatus status);

struct Directive {
    std::string action;
    nlohmann::json input = nlohmann::json::object();
};

struct ParseResult {
    ParseStatus status = ParseStatus::kMalformed;
    Directive directive;

    bool ok() const { return status == ParseStatus::kOk; }
};

// Recognizes replies of the form
//
//   Thought: <free text>
//   Action: <tool name>
//   Action Input: <JSON object, may span several lines>
//
// Exactly one Action and one Action Input line are accepted.
class ResponseParser {
public:
    static ParseResult Parse(const std::string& response);
};

}  // namespace reagent::agent
