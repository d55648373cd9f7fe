// tests/test_approval_broker.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/executor/approval_broker.h"
#include <map>

using namespace loom;

namespace {

struct Recorder {
    std::map<NodeId, std::vector<ApprovalDecision>> seen;
    ApprovalBroker::Callback callback() {
        return [this](const NodeId& id, ApprovalDecision d) { seen[id].push_back(d); };
    }
};

} // namespace

TEST_CASE("Each approval resolves once", "[approval]") {
    ApprovalBroker broker;
    Recorder rec;
    auto deadline = ApprovalBroker::Clock::now() + std::chrono::hours(1);
    broker.open("run-1", "approve.a", deadline, rec.callback());
    broker.open("run-1", "approve.b", deadline, rec.callback());
    REQUIRE(broker.pending("run-1") == std::vector<NodeId>{"approve.a", "approve.b"});

    REQUIRE(broker.resolve("run-1", "approve.a", true));
    REQUIRE_FALSE(broker.resolve("run-1", "approve.a", false));
    REQUIRE_FALSE(broker.resolve("run-2", "approve.b", true));
    REQUIRE(broker.resolve("run-1", "approve.b", false));

    REQUIRE(rec.seen["approve.a"] == std::vector<ApprovalDecision>{ApprovalDecision::APPROVED});
    REQUIRE(rec.seen["approve.b"] == std::vector<ApprovalDecision>{ApprovalDecision::DENIED});
    REQUIRE(broker.pending("run-1").empty());
}

TEST_CASE("Deadlines expire per run", "[approval]") {
    ApprovalBroker broker;
    Recorder rec;
    auto now = ApprovalBroker::Clock::now();
    broker.open("run-1", "approve.a", now + std::chrono::seconds(1), rec.callback());
    broker.open("run-2", "approve.a", now + std::chrono::seconds(1), rec.callback());

    REQUIRE(broker.expire("run-1", now).empty());
    REQUIRE(broker.expire("run-1", now + std::chrono::seconds(2)) == std::vector<NodeId>{"approve.a"});
    REQUIRE(rec.seen["approve.a"] == std::vector<ApprovalDecision>{ApprovalDecision::TIMED_OUT});
    REQUIRE(broker.pending("run-2").size() == 1);
    REQUIRE_FALSE(broker.resolve("run-1", "approve.a", true));
}

TEST_CASE("Cancelling a run releases its approvals", "[approval]") {
    ApprovalBroker broker;
    Recorder rec;
    broker.open("run-1", "approve.a", ApprovalBroker::Clock::now() + std::chrono::hours(1), rec.callback());
    broker.cancel_run("run-1");
    REQUIRE(rec.seen["approve.a"] == std::vector<ApprovalDecision>{ApprovalDecision::CANCELLED});
    REQUIRE(broker.pending("run-1").empty());
    REQUIRE(to_string(ApprovalDecision::TIMED_OUT).size() > 0);
}
