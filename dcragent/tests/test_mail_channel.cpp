#include <doctest/doctest.h>
#include "mail_channel.hpp"
#include "mail_sender.hpp"
#include "shutdown.hpp"
#include "test_support.hpp"
#include "util.hpp"

using testing_support::at;
using testing_support::FakeMailSender;
using testing_support::make_report;

TEST_CASE("JMA report mail uses the header as subject and strips it from the body") {
    MailConfig config;
    config.use = true;
    FakeMailSender sender;
    MailChannel channel(config, sender);

    auto report = make_report(Category::SeismicIntensity);
    report.header = "震度速報";
    report.text = "震度速報\n東京都で震度３";
    report.timestamp = at(60);

    auto content = channel.compose(report, at(100));
    CHECK(content.subject == "震度速報");
    CHECK(content.body == "\n東京都で震度３\n\nReceived at: " + util::format_local(at(60)) + "\n");
}

TEST_CASE("Header stays in the body when suppression is off or it is not a prefix") {
    MailConfig config;
    FakeMailSender sender;
    MailChannel channel(config, sender);

    auto report = make_report(Category::Hypocenter);
    report.header = "震源に関する情報";
    report.text = "震源に関する情報 本文";

    SUBCASE("suppression disabled") {
        config.suppress_header_from_text = false;
        auto content = channel.compose(report, at(0));
        CHECK(content.body.rfind("震源に関する情報 本文", 0) == 0);
    }

    SUBCASE("header not a prefix") {
        report.text = "本文 震源に関する情報";
        auto content = channel.compose(report, at(0));
        CHECK(content.body.rfind("本文 震源に関する情報", 0) == 0);
    }
}

TEST_CASE("Receipt time falls back to the arrival time") {
    MailConfig config;
    FakeMailSender sender;
    MailChannel channel(config, sender);

    auto report = make_report(Category::Typhoon, "台風情報");
    auto content = channel.compose(report, at(500));
    CHECK(content.body.find("Received at: " + util::format_local(at(500))) != std::string::npos);
}

TEST_CASE("Extended messages use a fixed subject with a training marker") {
    MailConfig config;
    FakeMailSender sender;
    MailChannel channel(config, sender);

    auto jalert = make_report(Category::JAlert);
    CHECK(channel.compose(jalert, at(0)).subject == "J-ALERT");

    jalert.training_indicator = true;
    CHECK(channel.compose(jalert, at(0)).subject == "[Training] J-ALERT");

    auto overseas = make_report(Category::Overseas);
    CHECK(channel.compose(overseas, at(0)).subject == "Overseas Disaster Information");
}

TEST_CASE("deliver reports the transport result") {
    MailConfig config;
    FakeMailSender sender;
    MailChannel channel(config, sender);
    auto report = make_report(Category::Volcano);

    CHECK(channel.deliver(report, at(0)));
    REQUIRE(sender.subjects.size() == 1);
    CHECK(sender.subjects[0] == "header");

    sender.succeeds = false;
    CHECK_FALSE(channel.deliver(report, at(0)));
}

TEST_CASE("SMTP message carries encoded subject and wrapped base64 body") {
    MailConfig config;
    config.address = "ops@example.org";

    std::string body(200, 'x');
    auto message = CurlMailSender::build_message(config, "震度速報", body, at(0));

    CHECK(message.find("From: ops@example.org\r\n") != std::string::npos);
    CHECK(message.find("To: ops@example.org\r\n") != std::string::npos);
    CHECK(message.find("Subject: =?UTF-8?B?" + base64_encode("震度速報") + "?=\r\n") != std::string::npos);
    CHECK(message.find("Content-Transfer-Encoding: base64\r\n\r\n") != std::string::npos);

    auto body_start = message.find("\r\n\r\n") + 4;
    auto first_line = message.substr(body_start, message.find("\r\n", body_start) - body_start);
    CHECK(first_line.size() == 76);
}

TEST_CASE("base64 padding") {
    CHECK(base64_encode("Man") == "TWFu");
    CHECK(base64_encode("Ma") == "TWE=");
    CHECK(base64_encode("M") == "TQ==");
    CHECK(base64_encode("").empty());
}

TEST_CASE("SMTP send returns false once shutdown was requested") {
    MailConfig config;
    config.use = true;
    config.host = "127.0.0.1";
    config.port = 1;
    config.address = "agent@example.com";
    config.timeout_seconds = 5;

    ShutdownSignal shutdown;
    shutdown.request();
    CurlMailSender sender(config, &shutdown);

    auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(sender.send("subject", "body"));
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}
