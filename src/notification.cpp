#include "notification.hpp"
#include "backup.hpp"
#include <curl/curl.h>
#include <format>

namespace {

size_t writeCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

std::string escape(CURL* curl, const std::string& text) {
    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.length()));
    if (!escaped) {
        return {};
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace

TelegramNotificationStrategy::TelegramNotificationStrategy(const TelegramSettings& settings)
    : botToken(settings.botToken), chatId(settings.chatId) {}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::string url = std::format("https://api.telegram.org/bot{}/sendMessage", botToken);
    std::string body = std::format("chat_id={}&text={}", escape(curl, chatId), escape(curl, message));

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        return std::unexpected(std::format("Failed to send Telegram notification: {}", curl_easy_strerror(res)));
    }

    curl_easy_cleanup(curl);
    return {};
}

std::string formatRunSummary(const RunSummary& summary) {
    std::string text = std::format("SiteVault backup to {}", summary.destination.string());
    for (const auto& result : summary.results) {
        text += std::format("\n{}: {}", result.siteId, describe(result.status));
    }
    if (summary.interrupted) {
        text += "\nRun interrupted before all sites were attempted";
    }
    return text;
}
