#include <doctest/doctest.h>
#include "notification_dispatcher.hpp"
#include "test_support.hpp"

using testing_support::at;
using testing_support::make_report;
using testing_support::RecordingChannel;

namespace {

ChannelPolicy policy(bool report_incomplete_info, bool ignore_filter, bool report_training) {
    ChannelPolicy p;
    p.report_incomplete_info = report_incomplete_info;
    p.ignore_filter = ignore_filter;
    p.report_training = report_training;
    return p;
}

struct Harness {
    NotificationDispatcher dispatcher;
    std::vector<RecordingChannel*> channels;

    RecordingChannel& add(const std::string& name, ChannelPolicy p = {}, bool enabled = true) {
        auto channel = std::make_unique<RecordingChannel>(name, p, enabled);
        auto* raw = channel.get();
        dispatcher.add_channel(std::move(channel));
        channels.push_back(raw);
        return *raw;
    }
};

}

TEST_CASE("Unflagged report reaches every enabled channel") {
    Harness h;
    auto& file = h.add("File");
    auto& console = h.add("Console");
    auto& mail = h.add("Mail", {}, false);

    auto outcomes = h.dispatcher.dispatch(make_report(Category::Hypocenter), Disposition{}, at(0));

    REQUIRE(outcomes.size() == 3);
    CHECK(outcomes[0].delivered);
    CHECK(outcomes[1].delivered);
    CHECK_FALSE(outcomes[2].delivered);
    CHECK(outcomes[2].reason == "Use=0");
    CHECK(file.delivered.size() == 1);
    CHECK(console.delivered.size() == 1);
    CHECK(mail.delivered.empty());
}

TEST_CASE("A failing channel does not stop the others") {
    Harness h;
    auto& broken = h.add("Mail");
    broken.throws = true;
    auto& refusing = h.add("Console");
    refusing.succeeds = false;
    auto& file = h.add("File");

    auto outcomes = h.dispatcher.dispatch(make_report(Category::Volcano), Disposition{}, at(0));

    REQUIRE(outcomes.size() == 3);
    CHECK(outcomes[0].reason == "Failed");
    CHECK(outcomes[1].reason == "Failed");
    CHECK(outcomes[2].delivered);
    CHECK(file.delivered.size() == 1);
}

TEST_CASE("Filtered report only reaches channels that ignore the filter") {
    Harness h;
    auto& strict = h.add("Mail", policy(false, false, true));
    auto& lenient = h.add("File", policy(false, true, true));

    Disposition d;
    d.filtered = true;
    auto outcomes = h.dispatcher.dispatch(make_report(Category::Weather), d, at(0));

    CHECK(outcomes[0].reason == "Filtered");
    CHECK(strict.delivered.empty());
    CHECK(outcomes[1].delivered);
    CHECK(lenient.delivered.size() == 1);
}

TEST_CASE("Training report is withheld where training is not reported") {
    Harness h;
    h.add("Mail", policy(false, false, false));
    h.add("File", policy(false, false, true));

    Disposition d;
    d.training = true;
    auto outcomes = h.dispatcher.dispatch(make_report(Category::JAlert), d, at(0));

    CHECK(outcomes[0].reason == "Training");
    CHECK(outcomes[1].delivered);
}

TEST_CASE("Filtered and incomplete flags must each be waived") {
    Harness h;
    h.add("FilterOnly", policy(false, true, true));
    h.add("IncompleteOnly", policy(true, false, true));
    h.add("Both", policy(true, true, true));

    Disposition d;
    d.filtered = true;
    d.incomplete = true;
    auto outcomes = h.dispatcher.dispatch(make_report(Category::NankaiTroughEarthquake), d, at(0));

    REQUIRE(outcomes.size() == 3);
    CHECK_FALSE(outcomes[0].delivered);
    CHECK(outcomes[0].reason == "Incomplete");
    CHECK_FALSE(outcomes[1].delivered);
    CHECK(outcomes[1].reason == "Filtered");
    CHECK(outcomes[2].delivered);
}

TEST_CASE("Incomplete unfiltered report needs report_incomplete_info") {
    Harness h;
    h.add("Default");
    h.add("Partial", policy(true, false, true));

    Disposition d;
    d.incomplete = true;
    auto outcomes = h.dispatcher.dispatch(make_report(Category::NankaiTroughEarthquake), d, at(0));

    CHECK(outcomes[0].reason == "Incomplete");
    CHECK(outcomes[1].delivered);
}

TEST_CASE("Suppression reasons are checked incomplete first, then training, then filter") {
    Disposition all{true, true, true};
    CHECK(suppression_reason(policy(false, false, false), all) == "Incomplete");
    CHECK(suppression_reason(policy(true, false, false), all) == "Training");
    CHECK(suppression_reason(policy(true, false, true), all) == "Filtered");
    CHECK_FALSE(suppression_reason(policy(true, true, true), all).has_value());
}
