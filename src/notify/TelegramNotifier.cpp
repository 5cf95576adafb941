#include "TelegramNotifier.h"

#include <format>

#include <nlohmann/json.hpp>

namespace {

std::string TrimTrailingSlashes(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

}  // namespace

TelegramNotifier::TelegramNotifier(const Config& config, IHttpClient& http)
    : http_(http),
      send_message_url_(std::format("{}/bot{}/sendMessage",
                                    TrimTrailingSlashes(
                                        config.telegram_base_url),
                                    config.telegram_bot_token)),
      chat_id_(config.telegram_chat_id),
      timeout_(config.request_timeout) {}

std::string TelegramNotifier::buildPayload(const Alert& alert) const {
  nlohmann::json payload = {
      {"chat_id", chat_id_},
      {"text", FormatAlertText(alert)},
      {"parse_mode", "Markdown"},
  };
  return payload.dump();
}

std::expected<void, std::string> TelegramNotifier::send(const Alert& alert) {
  auto response = http_.postJson(send_message_url_, buildPayload(alert),
                                 timeout_);
  if (!response) {
    return std::unexpected(
        std::format("Telegram request failed: {}", response.error()));
  }

  // {"ok": false, "error_code": 400, "description": "..."}
  auto json = nlohmann::json::parse(response->body, nullptr, false);
  const bool ok = !json.is_discarded() && json.is_object() &&
                  json.contains("ok") && json["ok"].is_boolean() &&
                  json["ok"].get<bool>();

  if (response->status_code >= 400 || !ok) {
    std::string description = "unexpected response";
    if (!json.is_discarded() && json.is_object() &&
        json.contains("description") && json["description"].is_string()) {
      description = json["description"].get<std::string>();
    }
    return std::unexpected(std::format("Telegram error (HTTP {}): {}",
                                       response->status_code, description));
  }

  return {};
}
