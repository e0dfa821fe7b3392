#pragma once

#include "config.hpp"
#include <chrono>
#include <string>

class ShutdownSignal;

// Mail transport capability. send() never throws for transport errors.
class MailSender {
public:
    virtual ~MailSender() = default;
    virtual bool send(const std::string& subject, const std::string& body) = 0;
};

// SMTP over libcurl
class CurlMailSender : public MailSender {
public:
    // shutdown may be null; when set, a pending send is aborted on request
    CurlMailSender(const MailConfig& config, ShutdownSignal* shutdown);

    bool send(const std::string& subject, const std::string& body) override;

    // RFC 5322 message with a UTF-8 base64 body and RFC 2047 subject
    static std::string build_message(const MailConfig& config,
                                     const std::string& subject,
                                     const std::string& body,
                                     std::chrono::system_clock::time_point date);

private:
    const MailConfig& config_;
    ShutdownSignal* shutdown_;
};

std::string base64_encode(const std::string& input);
