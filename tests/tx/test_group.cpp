// strata_tx TransactionGroup and GroupSession tests

#include <catch2/catch_test_macros.hpp>
#include <strata/tx/group.hpp>
#include <strata/model/memory_model.hpp>
#include <support/test_support.hpp>

using namespace strata_tx;
using strata_model::MemoryModel;
using strata_model::ScopeKind;

namespace {

void create_in_transaction(MemoryModel& model, const std::string& name) {
    auto scope = strata_model::Scope::open(model, name, ScopeKind::Transaction, nullptr);
    REQUIRE(scope.is_ok());
    REQUIRE(model.create_element("Walls", name).is_ok());
    REQUIRE(scope->commit().is_ok());
}

} // anonymous namespace

TEST_CASE("Checkpoint text", "[tx][group]") {
    Checkpoint cp;
    cp.label = "Walls placed";
    cp.timestamp = std::chrono::system_clock::now();

    SECTION("timestamped") {
        auto text = cp.text();
        REQUIRE(text.size() == std::string("HH:MM:SS - Walls placed").size());
        REQUIRE(text.substr(8) == " - Walls placed");
        REQUIRE(text[2] == ':');
        REQUIRE(text[5] == ':');
    }

    SECTION("plain") {
        cp.timestamped = false;
        REQUIRE(cp.text() == "Walls placed");
    }
}

TEST_CASE("TransactionGroup lifecycle", "[tx][group]") {
    MemoryModel model;
    auto group = TransactionGroup::start(model, "G1", nullptr);
    REQUIRE(group.is_ok());
    REQUIRE(group->state() == GroupState::Active);
    REQUIRE(group->checkpoints().size() == 1);
    REQUIRE(group->checkpoints()[0].text() == "Started: G1");

    create_in_transaction(model, "W1");
    create_in_transaction(model, "W2");
    REQUIRE(group->add_checkpoint("Walls placed").is_ok());

    SECTION("commit makes one undo unit") {
        REQUIRE(group->commit().is_ok());
        REQUIRE(group->state() == GroupState::Committed);
        REQUIRE(model.element_count() == 2);
        REQUIRE(model.undo_stack() == std::vector<std::string>{"G1"});
    }

    SECTION("rollback reverts everything") {
        REQUIRE(group->rollback().is_ok());
        REQUIRE(group->state() == GroupState::RolledBack);
        REQUIRE(model.element_count() == 0);
        REQUIRE(model.undo_stack().empty());
    }

    SECTION("terminal groups reject transitions") {
        REQUIRE(group->commit().is_ok());

        auto again = group->rollback();
        REQUIRE(again.is_err());
        REQUIRE(again.error().as<strata_core::GroupError>()->kind == strata_core::GroupError::Kind::Terminated);
        REQUIRE(group->add_checkpoint("late").is_err());
        REQUIRE(group->commit().is_err());
        REQUIRE(group->state() == GroupState::Committed);
    }
}

TEST_CASE("TransactionGroup commit after resolved failures", "[tx][group]") {
    MemoryModel model;
    auto group = TransactionGroup::start(model, "G1", std::make_shared<strata_model::StrictPolicy>());
    REQUIRE(group.is_ok());

    {
        auto scope = strata_model::Scope::open(model, "T", ScopeKind::Transaction,
            std::make_shared<strata_model::SuppressWarningsPolicy>());
        REQUIRE(scope.is_ok());
        REQUIRE(model.create_element("Walls", "W1").is_ok());
        REQUIRE(model.post_failure(strata_model::FailureMessage::warning("overlap")).is_ok());
        REQUIRE(model.post_failure(strata_model::FailureMessage::error("joined", true)).is_ok());
        REQUIRE(scope->commit().is_ok());
    }

    REQUIRE(model.pending_failure_count() == 0);
    REQUIRE(group->commit().is_ok());
    REQUIRE(model.element_count() == 1);
}

TEST_CASE("TransactionGroup commit failure reverts the group", "[tx][group]") {
    strata_test::FaultyResource resource;
    auto group = TransactionGroup::start(resource, "G1", nullptr);
    REQUIRE(group.is_ok());

    resource.fail_commit = true;
    auto result = group->commit();
    REQUIRE(result.is_err());
    REQUIRE(group->state() == GroupState::RolledBack);
    REQUIRE(resource.open_scope_count() == 0);
}

TEST_CASE("TransactionGroup rollback refused by resource", "[tx][group]") {
    strata_test::FaultyResource resource;
    auto group = TransactionGroup::start(resource, "G1", nullptr);
    REQUIRE(group.is_ok());

    resource.fail_rollback = true;
    REQUIRE(group->rollback().is_err());
    REQUIRE(group->state() == GroupState::Active);

    resource.fail_rollback = false;
    REQUIRE(group->rollback().is_ok());
    REQUIRE(group->state() == GroupState::RolledBack);
}

TEST_CASE("GroupSession", "[tx][group]") {
    MemoryModel model;
    GroupSession session(model);

    SECTION("start and status") {
        auto name = session.start("G1");
        REQUIRE(name.is_ok());
        REQUIRE(*name == "G1");

        auto status = session.status();
        REQUIRE(status.has_active);
        REQUIRE(status.name == "G1");
        REQUIRE(status.checkpoint_count == 1);
        REQUIRE(session.rollback().is_ok());
    }

    SECTION("second start is rejected") {
        REQUIRE(session.start("G1").is_ok());
        REQUIRE(session.checkpoint("Walls placed").is_ok());
        auto before = checkpoint_texts(session.status().checkpoints);
        REQUIRE(before.size() == 2);

        auto second = session.start("G2");
        REQUIRE(second.is_err());
        const auto* error = second.error().as<strata_core::GroupError>();
        REQUIRE(error != nullptr);
        REQUIRE(error->kind == strata_core::GroupError::Kind::AlreadyActive);
        REQUIRE(error->group_name == "G1");

        auto status = session.status();
        REQUIRE(status.name == "G1");
        REQUIRE(status.checkpoint_count == 2);
        REQUIRE(checkpoint_texts(status.checkpoints) == before);
        REQUIRE(session.rollback().is_ok());
    }

    SECTION("N checkpoints give N+1 log entries") {
        REQUIRE(session.start("G1").is_ok());
        REQUIRE(session.status().checkpoint_count == 1);

        const std::size_t n = 5;
        for (std::size_t i = 0; i < n; ++i) {
            REQUIRE(session.checkpoint("").is_ok());
            REQUIRE(session.status().checkpoint_count == i + 2);
        }

        auto status = session.status();
        REQUIRE(status.checkpoints.size() == n + 1);
        REQUIRE(status.checkpoints.back().label == "Checkpoint 5");

        auto outcome = session.commit();
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->checkpoints.size() == n + 1);
    }

    SECTION("default names") {
        auto name = session.start("");
        REQUIRE(name.is_ok());
        REQUIRE(name->rfind("AI Operation ", 0) == 0);

        auto cp = session.checkpoint("");
        REQUIRE(cp.is_ok());
        REQUIRE(cp->label == "Checkpoint 1");
        REQUIRE(session.commit().is_ok());
    }

    SECTION("nothing active") {
        REQUIRE_FALSE(session.has_active());
        REQUIRE(session.commit().error().as<strata_core::GroupError>()->kind
            == strata_core::GroupError::Kind::NoActiveGroup);
        REQUIRE(session.rollback().is_err());
        REQUIRE(session.checkpoint("x").is_err());

        auto status = session.status();
        REQUIRE_FALSE(status.has_active);
        REQUIRE(status.checkpoint_count == 0);
    }

    SECTION("commit reports checkpoints and records history") {
        REQUIRE(session.start("G1").is_ok());
        create_in_transaction(model, "W1");
        REQUIRE(session.checkpoint("Walls placed").is_ok());

        auto outcome = session.commit();
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->name == "G1");
        REQUIRE(outcome->state == GroupState::Committed);
        REQUIRE(outcome->checkpoints.size() == 2);
        REQUIRE_FALSE(session.has_active());

        REQUIRE(session.history().size() == 1);
        REQUIRE(session.history()[0].name == "G1");
        REQUIRE(session.history()[0].state == GroupState::Committed);
        REQUIRE(session.history()[0].checkpoint_count == 2);

        SECTION("a new group may start") {
            REQUIRE(session.start("G2").is_ok());
            REQUIRE(session.status().checkpoint_count == 1);
            REQUIRE(session.status().checkpoints[0].text() == "Started: G2");
            REQUIRE(session.rollback().is_ok());
            REQUIRE(session.history().size() == 2);
            REQUIRE(model.element_count() == 1);
        }
    }
}

TEST_CASE("GroupSession commit failure clears the session", "[tx][group]") {
    strata_test::FaultyResource resource;
    GroupSession session(resource);
    REQUIRE(session.start("G1").is_ok());

    resource.fail_commit = true;
    auto outcome = session.commit();
    REQUIRE(outcome.is_err());
    REQUIRE(outcome.error().get_context("group") != nullptr);
    REQUIRE(*outcome.error().get_context("group") == "G1");

    REQUIRE_FALSE(session.has_active());
    REQUIRE(session.history().size() == 1);
    REQUIRE(session.history()[0].state == GroupState::RolledBack);
    REQUIRE(resource.open_scope_count() == 0);
}
