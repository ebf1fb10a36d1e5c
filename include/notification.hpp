/**
 * @file notification.hpp
 * @brief Defines run notification strategies for SiteVault.
 *
 * After a run, a one-message summary of every site's aggregate outcome can be sent
 * to a Telegram chat.
 *
 * @note Requires libcurl for Telegram notifications.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <expected>
#include <string>
#include "backup_types.hpp"
#include "sitevault_config.hpp"

/**
 * @brief Interface for notification strategies.
 *
 * Defines the contract for sending notifications about backup status.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& message) = 0;
};

/**
 * @brief Telegram notification strategy.
 *
 * Sends notifications using the Telegram Bot API sendMessage method.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a Telegram notification strategy.
     *
     * @param settings Bot token and chat ID.
     */
    explicit TelegramNotificationStrategy(const TelegramSettings& settings);

    /**
     * @brief Sends a notification via Telegram.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> notify(const std::string& message) override;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId; ///< Telegram chat ID.
};

/**
 * @brief Formats a run summary as a multi-line notification text.
 *
 * One line per site ("blog: complete success"), preceded by the destination.
 */
std::string formatRunSummary(const RunSummary& summary);

#endif // NOTIFICATION_HPP
