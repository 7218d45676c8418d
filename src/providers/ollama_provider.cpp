#include "providers/ollama_provider.hpp"

#include <stdexcept>
#include <utility>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace reagent::providers {

OllamaProvider::OllamaProvider(std::string host,
                               std::string default_model,
                               int num_ctx,
                               int read_timeout_s)
    : host_(std::move(host))
    , default_model_(std::move(default_model))
    , num_ctx_(num_ctx)
    , read_timeout_s_(read_timeout_s) {}

std::string OllamaProvider::BuildPayload(
    const std::vector<Message>& messages,
    const std::string& model,
    int num_ctx) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["stream"] = false;
    payload["options"] = {{"num_ctx", num_ctx}};
    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return payload.dump();
}

std::string OllamaProvider::ParseReply(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw TransportError("ollama: invalid json from /api/chat");
    }
    if (json.contains("error") && json["error"].is_string()) {
        throw TransportError("ollama: " + json["error"].get<std::string>());
    }
    if (!json.contains("message") || !json["message"].is_object() ||
        !json["message"].contains("content") || !json["message"]["content"].is_string()) {
        throw TransportError("ollama: response has no message content");
    }
    return json["message"]["content"].get<std::string>();
}

std::string OllamaProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model) {
    const auto chosen_model = model.empty() ? default_model_ : model;
    utils::Url parsed{};
    try {
        parsed = utils::ParseUrl(host_, utils::Url{.https = false, .port = 11434});
    } catch (const std::invalid_argument& ex) {
        throw TransportError(std::string("ollama: ") + ex.what());
    }

    const auto scheme_host_port = parsed.Origin();
    httplib::Client client(scheme_host_port);
    client.set_connection_timeout(5);
    client.set_read_timeout(read_timeout_s_);
    client.set_write_timeout(30);

    const std::string endpoint = parsed.base_path + "/api/chat";
    utils::LogDebug("llm", "POST " + scheme_host_port + endpoint + " model=" + chosen_model +
                               " messages=" + std::to_string(messages.size()));

    auto response = client.Post(endpoint.c_str(),
                                BuildPayload(messages, chosen_model, num_ctx_),
                                "application/json");
    if (!response) {
        const auto err_text = httplib::to_string(response.error());
        utils::LogError("llm", "request failed: httplib error=" + err_text);
        throw TransportError("ollama: request failed (" + err_text + ")");
    }
    if (response->status >= 400) {
        utils::LogError("llm", "HTTP " + std::to_string(response->status) + " body=" + response->body);
        throw TransportError("ollama: HTTP " + std::to_string(response->status));
    }
    return ParseReply(response->body);
}

}  // namespace reagent::providers
