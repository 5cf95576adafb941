#ifndef EMACROSSWATCH_TELEGRAMNOTIFIER_H
#define EMACROSSWATCH_TELEGRAMNOTIFIER_H

#include <chrono>
#include <string>

#include "Notifier.h"
#include "config/Config.h"
#include "net/HttpClient.h"

// Bot API sendMessage. Credentials are checked by ConfigManager at startup.
class TelegramNotifier : public INotifier {
 public:
  TelegramNotifier(const Config& config, IHttpClient& http);

  std::expected<void, std::string> send(const Alert& alert) override;

  [[nodiscard]] std::string buildPayload(const Alert& alert) const;

 private:
  IHttpClient& http_;
  std::string send_message_url_;
  std::string chat_id_;
  std::chrono::nanoseconds timeout_;
};

#endif  // EMACROSSWATCH_TELEGRAMNOTIFIER_H
