#pragma once

#include "mail_sender.hpp"
#include "notification_channel.hpp"

struct MailContent {
    std::string subject;
    std::string body;
};

class MailChannel : public NotificationChannel {
public:
    MailChannel(const MailConfig& config, MailSender& sender);

    std::string name() const override { return "Mail"; }
    bool enabled() const override { return config_.use; }
    const ChannelPolicy& policy() const override { return config_.policy; }

    bool deliver(const Report& report, std::chrono::system_clock::time_point received) override;

    MailContent compose(const Report& report, std::chrono::system_clock::time_point received) const;

private:
    const MailConfig& config_;
    MailSender& sender_;
};
