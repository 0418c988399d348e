// strata_bridge element operation tests

#include <catch2/catch_test_macros.hpp>
#include <strata/bridge/element_operations.hpp>
#include <strata/tx/batch.hpp>
#include <support/test_support.hpp>

using namespace strata_bridge;
using strata_ops::ErrorKind;
using strata_ops::Operation;
using nlohmann::json;

namespace {

struct ElementFixture {
    strata_model::MemoryModel model{"Doc"};
    strata_ops::OperationRegistry registry;

    ElementFixture() { register_element_operations(registry); }

    strata_ops::OperationResult run(const std::string& method, json params = json::object(),
                                    std::shared_ptr<strata_model::FailurePolicy> policy = nullptr) {
        strata_ops::ExecutionContext ctx(model, false, std::move(policy));
        return registry.invoke(ctx, Operation(method, std::move(params)));
    }
};

} // anonymous namespace

TEST_CASE("createElement", "[bridge][elements]") {
    ElementFixture f;

    SECTION("creates and commits its own transaction") {
        auto result = f.run("createElement", {{"category", "Walls"}, {"name", "W1"},
                                              {"parameters", {{"height", 3}}}});
        REQUIRE(result.success);
        REQUIRE(result.payload["elementId"] == 1);
        REQUIRE(result.payload["message"] == "Created Walls 1");
        REQUIRE(f.model.find(1)->parameters["height"] == 3);
        REQUIRE(f.model.undo_stack() == std::vector<std::string>{"Create Walls"});
        REQUIRE(f.model.open_scope_count() == 0);
    }

    SECTION("alias") {
        REQUIRE(f.run("addElement", {{"category", "Doors"}}).success);
        REQUIRE(f.model.count_in_category("Doors") == 1);
    }

    SECTION("category is required") {
        auto result = f.run("createElement");
        REQUIRE(result.error_kind == ErrorKind::Validation);
        REQUIRE(result.error_message == "Missing required parameter: category");
        REQUIRE(f.model.undo_stack().empty());
    }

    SECTION("parameters must be an object") {
        auto result = f.run("createElement", {{"category", "Walls"}, {"parameters", {1, 2}}});
        REQUIRE(result.error_message == "Parameter 'parameters' must be an object");
    }

    SECTION("duplicate name is a warning") {
        REQUIRE(f.run("createElement", {{"category", "Walls"}, {"name", "W1"}}).success);

        SECTION("suppressed by default") {
            REQUIRE(f.run("createElement", {{"category", "Walls"}, {"name", "W1"}}).success);
            REQUIRE(f.model.count_in_category("Walls") == 2);
        }

        SECTION("refused under a strict policy") {
            auto result = f.run("createElement", {{"category", "Walls"}, {"name", "W1"}},
                std::make_shared<strata_model::StrictPolicy>());
            REQUIRE_FALSE(result.success);
            REQUIRE(result.error_kind == ErrorKind::Resource);
            REQUIRE(result.error_message.find("already used") != std::string::npos);
            REQUIRE(f.model.count_in_category("Walls") == 1);
            REQUIRE(f.model.open_scope_count() == 0);
        }
    }
}

TEST_CASE("Element reads and edits", "[bridge][elements]") {
    ElementFixture f;
    REQUIRE(f.run("createElement", {{"category", "Walls"}, {"name", "W1"}}).success);

    SECTION("getElement") {
        auto result = f.run("getElement", {{"elementId", 1}});
        REQUIRE(result.success);
        REQUIRE(result.payload["element"]["category"] == "Walls");
        REQUIRE(result.payload["element"]["name"] == "W1");

        auto missing = f.run("getElement", {{"elementId", 9}});
        REQUIRE(missing.error_kind == ErrorKind::NotFound);
        REQUIRE(missing.error_message == "Element 9 not found");
    }

    SECTION("setParameter") {
        auto result = f.run("setElementParameter", {{"elementId", 1}, {"name", "height"}, {"value", 2.5}});
        REQUIRE(result.success);
        REQUIRE(f.model.find(1)->parameters["height"] == 2.5);

        auto missing_value = f.run("setParameter", {{"elementId", 1}, {"name", "height"}});
        REQUIRE(missing_value.error_kind == ErrorKind::Validation);

        auto empty_name = f.run("setParameter", {{"elementId", 1}, {"name", ""}, {"value", 1}});
        REQUIRE_FALSE(empty_name.success);
        REQUIRE(f.model.undo_stack().size() == 2);
    }

    SECTION("deleteElement") {
        auto result = f.run("removeElement", {{"elementId", 1}});
        REQUIRE(result.payload["deletedId"] == 1);
        REQUIRE(f.model.element_count() == 0);

        REQUIRE(f.run("deleteElement", {{"elementId", 1}}).error_kind == ErrorKind::NotFound);
        REQUIRE(f.run("deleteElement", {{"elementId", -1}}).error_kind == ErrorKind::Validation);
    }

    SECTION("counting") {
        REQUIRE(f.run("createElement", {{"category", "Doors"}}).success);
        REQUIRE(f.run("countElements").payload["count"] == 2);
        REQUIRE(f.run("countElements", {{"category", "Doors"}}).payload["count"] == 1);

        REQUIRE(f.run("assertElementCount", {{"category", "Walls"}, {"expected", 1}}).success);
        auto mismatch = f.run("verifyElementCount", {{"expected", 5}});
        REQUIRE(mismatch.error_kind == ErrorKind::State);
        REQUIRE(mismatch.error_message == "Expected 5 elements in the model, found 2");
    }
}

TEST_CASE("reportFailure", "[bridge][elements]") {
    ElementFixture f;

    SECTION("warning passes under the default policy") {
        REQUIRE(f.run("reportFailure", {{"description", "overlap"}}).success);
        REQUIRE(f.model.pending_failure_count() == 0);
    }

    SECTION("unresolvable error refuses the commit") {
        auto result = f.run("reportFailure", {{"severity", "error"}, {"description", "cannot join"}});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("cannot join") != std::string::npos);
    }

    SECTION("resolvable error is accepted") {
        REQUIRE(f.run("reportFailure", {{"severity", "error"}, {"description", "joined"},
                                        {"resolvable", true}}).success);
    }

    SECTION("bad severity") {
        auto result = f.run("reportFailure", {{"severity", "fatal"}, {"description", "x"}});
        REQUIRE(result.error_message == "Parameter 'severity' must be 'warning' or 'error'");
    }
}

TEST_CASE("Element operations without the in-memory model", "[bridge][elements]") {
    strata_test::FaultyResource resource;
    strata_ops::OperationRegistry registry;
    register_element_operations(registry);

    strata_ops::ExecutionContext ctx(resource, false);
    auto result = registry.invoke(ctx, Operation("createElement", {{"category", "Walls"}}));
    REQUIRE(result.error_kind == ErrorKind::Resource);
    REQUIRE(result.error_message == "Element operations require the in-memory model");
}

TEST_CASE("Element operations inside a batch", "[bridge][elements]") {
    ElementFixture f;
    strata_tx::BatchExecutor executor(f.registry, f.model);

    SECTION("batch owns the transaction") {
        auto result = executor.run("Layout", {
            Operation("createElement", {{"category", "Walls"}, {"name", "W1"}}),
            Operation("createElement", {{"category", "Walls"}, {"name", "W2"}}),
            Operation("setParameter", {{"elementId", 2}, {"name", "height"}, {"value", 3}}),
            Operation("assertElementCount", {{"category", "Walls"}, {"expected", 2}}),
        });
        REQUIRE(result.success());
        REQUIRE(result.created_ids == std::vector<strata_model::ElementId>{1, 2});
        REQUIRE(f.model.undo_stack() == std::vector<std::string>{"Layout"});
    }

    SECTION("a failed verification rolls the whole batch back") {
        auto result = executor.run("Layout", {
            Operation("createElement", {{"category", "Walls"}}),
            Operation("assertElementCount", {{"category", "Walls"}, {"expected", 3}}),
        });
        REQUIRE(result.rolled_back);
        REQUIRE(result.error_kind == ErrorKind::State);
        REQUIRE(f.model.element_count() == 0);
    }

    SECTION("element_json") {
        REQUIRE(executor.run("B", {Operation("createElement", {{"category", "Walls"}, {"name", "W1"}})}).success());
        auto j = element_json(*f.model.find(1));
        REQUIRE(j["id"] == 1);
        REQUIRE(j["parameters"].is_object());
    }
}
