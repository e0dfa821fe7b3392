
#include "mail_sender.hpp"
#include "shutdown.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <memory>

namespace {

struct UploadState {
    const std::string* payload;
    size_t offset;
};

size_t read_payload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<UploadState*>(userdata);
    size_t room = size * nitems;
    size_t left = state->payload->size() - state->offset;
    size_t len = std::min(room, left);
    if (len > 0) {
        std::memcpy(buffer, state->payload->data() + state->offset, len);
        state->offset += len;
    }
    return len;
}

int abort_on_shutdown(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* shutdown = static_cast<const ShutdownSignal*>(clientp);
    return (shutdown && shutdown->requested()) ? 1 : 0;
}

std::string rfc2822_date(std::chrono::system_clock::time_point tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S %z", &tm);
    return buf;
}

}

std::string base64_encode(const std::string& input) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((input.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i + 2 < input.size()) {
        uint32_t n = (static_cast<unsigned char>(input[i]) << 16) |
                     (static_cast<unsigned char>(input[i + 1]) << 8) |
                     static_cast<unsigned char>(input[i + 2]);
        out += table[(n >> 18) & 0x3f];
        out += table[(n >> 12) & 0x3f];
        out += table[(n >> 6) & 0x3f];
        out += table[n & 0x3f];
        i += 3;
    }

    size_t rest = input.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<unsigned char>(input[i]) << 16;
        out += table[(n >> 18) & 0x3f];
        out += table[(n >> 12) & 0x3f];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<unsigned char>(input[i]) << 16) |
                     (static_cast<unsigned char>(input[i + 1]) << 8);
        out += table[(n >> 18) & 0x3f];
        out += table[(n >> 12) & 0x3f];
        out += table[(n >> 6) & 0x3f];
        out += '=';
    }
    return out;
}

CurlMailSender::CurlMailSender(const MailConfig& config, ShutdownSignal* shutdown)
    : config_(config), shutdown_(shutdown) {}

std::string CurlMailSender::build_message(const MailConfig& config,
                                          const std::string& subject,
                                          const std::string& body,
                                          std::chrono::system_clock::time_point date) {
    std::string message;
    message += fmt::format("Date: {}\r\n", rfc2822_date(date));
    message += fmt::format("From: {}\r\n", config.address);
    message += fmt::format("To: {}\r\n", config.address);
    message += fmt::format("Subject: =?UTF-8?B?{}?=\r\n", base64_encode(subject));
    message += "MIME-Version: 1.0\r\n";
    message += "Content-Type: text/plain; charset=utf-8\r\n";
    message += "Content-Transfer-Encoding: base64\r\n";
    message += "\r\n";

    const auto encoded = base64_encode(body);
    for (size_t pos = 0; pos < encoded.size(); pos += 76) {
        message += encoded.substr(pos, 76);
        message += "\r\n";
    }
    return message;
}

bool CurlMailSender::send(const std::string& subject, const std::string& body) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        spdlog::error("Mail: curl_easy_init failed");
        return false;
    }

    const auto payload = build_message(config_, subject, body, std::chrono::system_clock::now());
    UploadState upload{&payload, 0};

    const auto url = fmt::format("{}://{}:{}", config_.ssl ? "smtps" : "smtp", config_.host, config_.port);
    const auto mailbox = fmt::format("<{}>", config_.address);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> recipients(
        curl_slist_append(nullptr, mailbox.c_str()), curl_slist_free_all);

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    if (!config_.ssl && config_.tls) {
        curl_easy_setopt(handle, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    }
    if (!config_.id.empty()) {
        curl_easy_setopt(handle, CURLOPT_USERNAME, config_.id.c_str());
        curl_easy_setopt(handle, CURLOPT_PASSWORD, config_.password.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_MAIL_FROM, mailbox.c_str());
    curl_easy_setopt(handle, CURLOPT_MAIL_RCPT, recipients.get());
    curl_easy_setopt(handle, CURLOPT_READFUNCTION, read_payload);
    curl_easy_setopt(handle, CURLOPT_READDATA, &upload);
    curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.timeout_seconds));
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, abort_on_shutdown);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, shutdown_);

    CURLcode res = curl_easy_perform(handle);
    if (res != CURLE_OK) {
        spdlog::error("Mail: SMTP transfer to {} failed: {}", url, curl_easy_strerror(res));
        return false;
    }
    return true;
}
