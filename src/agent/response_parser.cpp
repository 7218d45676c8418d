#include "agent/response_parser.hpp"

#include <regex>
#include <vector>

namespace reagent::agent {
namespace {

struct Line {
    std::size_t offset = 0;
    std::string text;
};

// Splits on '\n', dropping a trailing '\r' and leading blanks of each line.
// offset is the position of the first kept character in the response.
std::vector<Line> SplitLines(const std::string& response) {
    std::vector<Line> lines;
    std::size_t start = 0;
    while (start <= response.size()) {
        auto end = response.find('\n', start);
        if (end == std::string::npos) {
            end = response.size();
        }
        std::size_t first = start;
        while (first < end && (response[first] == ' ' || response[first] == '\t')) {
            ++first;
        }
        std::size_t last = end;
        if (last > first && response[last - 1] == '\r') {
            --last;
        }
        lines.push_back(Line{first, response.substr(first, last - first)});
        start = end + 1;
    }
    return lines;
}

bool StartsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

}  // namespace

const char* ToString(ParseStatus status) {
    switch (status) {
        case ParseStatus::kOk: return "ok";
        case ParseStatus::kRunaway: return "runaway";
        case ParseStatus::kMalformed: return "malformed";
        case ParseStatus::kInvalidInput: return "invalid_input";
    }
    return "unknown";
}

ParseResult ResponseParser::Parse(const std::string& response) {
    static const std::regex kAction(R"(^Action:\s*([_a-zA-Z][_a-zA-Z0-9]*))");
    static const char* kActionInputTag = "Action Input:";

    ParseResult result{};
    const auto lines = SplitLines(response);

    for (const auto& line : lines) {
        if (StartsWith(line.text, "Observation:")) {
            result.status = ParseStatus::kRunaway;
            return result;
        }
    }

    std::vector<std::string> actions;
    std::vector<std::size_t> input_offsets;
    for (const auto& line : lines) {
        std::smatch match;
        if (std::regex_search(line.text, match, kAction)) {
            actions.push_back(match[1].str());
        } else if (StartsWith(line.text, kActionInputTag)) {
            input_offsets.push_back(line.offset + std::char_traits<char>::length(kActionInputTag));
        }
    }

    if (actions.empty() || input_offsets.empty()) {
        result.status = ParseStatus::kMalformed;
        return result;
    }
    if (actions.size() > 1 || input_offsets.size() > 1) {
        result.status = ParseStatus::kRunaway;
        return result;
    }

    // The object must open right after the tag; anything past its last '}' is ignored.
    const auto payload = response.substr(input_offsets.front());
    const auto open = payload.find_first_not_of(" \t\r\n");
    const auto close = payload.rfind('}');
    if (open == std::string::npos || payload[open] != '{' || close == std::string::npos ||
        close < open) {
        result.status = ParseStatus::kInvalidInput;
        return result;
    }
    auto input = nlohmann::json::parse(payload.substr(open, close - open + 1), nullptr, false);
    if (input.is_discarded() || !input.is_object()) {
        result.status = ParseStatus::kInvalidInput;
        return result;
    }

    result.status = ParseStatus::kOk;
    result.directive.action = actions.front();
    result.directive.input = std::move(input);
    return result;
}

}  // namespace reagent::agent
