// strata_bridge CommandDispatcher tests

#include <catch2/catch_test_macros.hpp>
#include <strata/bridge/dispatcher.hpp>
#include <strata/bridge/element_operations.hpp>
#include <support/test_support.hpp>

#include <algorithm>

using namespace strata_bridge;
using nlohmann::json;

namespace {

struct DispatchFixture {
    strata_model::MemoryModel model{"Doc"};
    strata_ops::OperationRegistry registry;
    std::unique_ptr<CommandDispatcher> dispatcher;

    explicit DispatchFixture(BridgeConfig config = {}) {
        register_element_operations(registry);
        strata_test::register_sample_operations(registry);
        dispatcher = std::make_unique<CommandDispatcher>(registry, model, std::move(config));
    }

    json call(const std::string& method, json params = json::object()) {
        return dispatcher->execute(method, params);
    }
};

json op(const std::string& method, json params = json::object()) {
    return {{"method", method}, {"params", std::move(params)}};
}

} // anonymous namespace

TEST_CASE("Dispatcher request handling", "[bridge][dispatcher]") {
    DispatchFixture f;

    SECTION("id is echoed") {
        auto response = f.dispatcher->handle({{"id", 7}, {"method", "getTransactionStatus"}});
        REQUIRE(response["success"] == true);
        REQUIRE(response["id"] == 7);
    }

    SECTION("malformed JSON") {
        auto response = json::parse(f.dispatcher->handle_line("{not json"));
        REQUIRE(response["success"] == false);
        REQUIRE(response["error"] == "Invalid JSON request");
    }

    SECTION("non-object request") {
        auto response = f.dispatcher->handle(json::array());
        REQUIRE(response["success"] == false);
        REQUIRE(response["error"] == "Request must be a JSON object");
    }

    SECTION("missing method") {
        auto response = f.dispatcher->handle({{"id", "a"}, {"params", json::object()}});
        REQUIRE(response["error"] == "Request requires a 'method' string");
        REQUIRE(response["id"] == "a");
    }

    SECTION("params must be an object") {
        auto response = f.dispatcher->handle({{"method", "countElements"}, {"params", 3}});
        REQUIRE(response["error"] == "'params' must be an object");
    }

    SECTION("unknown method") {
        auto response = f.call("fooBar");
        REQUIRE(response["success"] == false);
        REQUIRE(response["errorKind"] == "NotFound");
    }

    SECTION("built-ins resolve case-insensitively") {
        auto response = f.call("GETTRANSACTIONSTATUS");
        REQUIRE(response["success"] == true);
        REQUIRE(response["hasActiveGroup"] == false);
    }
}

TEST_CASE("Dispatcher transaction groups", "[bridge][dispatcher]") {
    DispatchFixture f;

    auto started = f.call("startTransactionGroup", {{"name", "G1"}});
    REQUIRE(started["success"] == true);
    REQUIRE(started["groupName"] == "G1");

    SECTION("second start is rejected") {
        auto second = f.call("startTransactionGroup", {{"name", "G2"}});
        REQUIRE(second["success"] == false);
        REQUIRE(second["error"] == "AlreadyActive");
        REQUIRE(second["activeGroup"] == "G1");
        REQUIRE(f.call("getTransactionStatus")["activeGroupName"] == "G1");
    }

    SECTION("checkpoint and commit") {
        REQUIRE(f.call("createElement", {{"category", "Walls"}})["success"] == true);
        auto cp = f.call("addCheckpoint", {{"name", "Walls placed"}});
        REQUIRE(cp["checkpoint"] == "Walls placed");
        REQUIRE(cp["checkpointCount"] == 2);
        REQUIRE(cp["activeGroup"] == "G1");

        auto committed = f.call("commitTransactionGroup");
        REQUIRE(committed["success"] == true);
        REQUIRE(committed["checkpoints"].size() == 2);
        REQUIRE(f.model.undo_stack() == std::vector<std::string>{"G1"});

        auto history = f.call("getUndoHistory");
        REQUIRE(history["activeTransactionGroup"].is_null());
        REQUIRE(history["groups"].size() == 1);
        REQUIRE(history["groups"][0]["state"] == "Committed");
        REQUIRE(history["undoStack"] == json::array({"G1"}));
    }

    SECTION("rollback undoes every operation") {
        REQUIRE(f.call("createElement", {{"category", "Walls"}})["success"] == true);
        REQUIRE(f.call("createElement", {{"category", "Walls"}})["success"] == true);

        auto rolled_back = f.call("rollbackTransactionGroup");
        REQUIRE(rolled_back["success"] == true);
        REQUIRE(rolled_back["rolledBackCheckpoints"].size() == 1);
        REQUIRE(f.model.element_count() == 0);
        REQUIRE(f.model.undo_stack().empty());
    }
}

TEST_CASE("Dispatcher group commands without a group", "[bridge][dispatcher]") {
    DispatchFixture f;

    auto committed = f.call("commitTransactionGroup");
    REQUIRE(committed["success"] == false);
    REQUIRE(committed["error"] == "NoActiveGroup");
    REQUIRE(committed.contains("message"));

    REQUIRE(f.call("rollbackTransactionGroup")["error"] == "NoActiveGroup");
    REQUIRE(f.call("addCheckpoint", {{"name", "x"}})["error"] == "NoActiveGroup");

    auto status = f.call("getTransactionStatus");
    REQUIRE(status["hasActiveGroup"] == false);
    REQUIRE(status["activeGroupName"].is_null());
    REQUIRE(status["checkpointCount"] == 0);
}

TEST_CASE("Dispatcher batchExecute", "[bridge][dispatcher]") {
    DispatchFixture f;

    SECTION("stop on error") {
        auto response = f.call("batchExecute", {
            {"batchName", "B"},
            {"operations", {op("opA"), op("opB"), op("opC")}},
        });
        REQUIRE(response["success"] == false);
        REQUIRE(response["batchName"] == "B");
        REQUIRE(response["succeededCount"] == 1);
        REQUIRE(response["failedCount"] == 1);
        REQUIRE(response["rolledBack"] == true);
        REQUIRE(response["results"].size() == 2);
        REQUIRE(response["results"][1]["error"] == "X not found");
        REQUIRE(response["error"] == "Operation 1 (opB) failed: X not found. Transaction rolled back.");
        REQUIRE(f.model.element_count() == 0);
    }

    SECTION("continue past failures through the alias") {
        auto response = f.call("executeBatch", {
            {"transactionName", "Legacy"},
            {"stopOnError", false},
            {"operations", {op("opA"), op("opB"), op("opC")}},
        });
        REQUIRE(response["batchName"] == "Legacy");
        REQUIRE(response["committed"] == true);
        REQUIRE(response["succeededCount"] == 2);
        REQUIRE(response["createdElementIds"].size() == 2);
        REQUIRE(response["success"] == false);
        REQUIRE(f.model.undo_stack() == std::vector<std::string>{"Legacy"});
    }

    SECTION("rollbackOnError is read when stopOnError is absent") {
        auto response = f.call("batchExecute", {
            {"rollbackOnError", false},
            {"allowPartialSuccess", true},
            {"operations", {op("opA"), op("opB")}},
        });
        REQUIRE(response["success"] == true);
        REQUIRE(response["batchName"] == "Batch Operation");
    }

    SECTION("element operations in one undo unit") {
        auto response = f.call("batchExecute", {
            {"batchName", "Layout"},
            {"operations", {
                op("createElement", {{"category", "Walls"}, {"name", "W1"}}),
                op("createElement", {{"category", "Walls"}, {"name", "W2"}}),
                op("setParameter", {{"elementId", 1}, {"name", "height"}, {"value", 3.0}}),
            }},
        });
        REQUIRE(response["success"] == true);
        REQUIRE(response["createdElementIds"] == json::array({1, 2}));
        REQUIRE(f.model.count_in_category("Walls") == 2);
        REQUIRE(f.model.undo_stack() == std::vector<std::string>{"Layout"});
    }

    SECTION("missing operations") {
        auto response = f.call("batchExecute");
        REQUIRE(response["success"] == false);
        REQUIRE(response["error"] == "No operations provided. 'operations' array is required.");
    }

    SECTION("operation items that are not objects fail") {
        auto response = f.call("batchExecute", {{"operations", {1}}});
        REQUIRE(response["success"] == false);
        REQUIRE(response["results"][0]["method"] == "(empty)");
    }

    SECTION("configured defaults apply") {
        BridgeConfig config;
        config.default_batch_name = "Nightly";
        config.stop_on_error = false;
        DispatchFixture g(config);

        auto response = g.call("batchExecute", {{"operations", {op("opB"), op("opA")}}});
        REQUIRE(response["batchName"] == "Nightly");
        REQUIRE(response["committed"] == true);
    }
}

TEST_CASE("Dispatcher safeExecute and verifyAndRollback", "[bridge][dispatcher]") {
    DispatchFixture f;

    SECTION("safeExecute success") {
        auto response = f.call("safeExecute", {{"method", "createElement"}, {"params", {{"category", "Doors"}}}});
        REQUIRE(response["success"] == true);
        REQUIRE(response["method"] == "createElement");
        REQUIRE(response["wasRolledBack"] == false);
        REQUIRE(response["result"]["elementId"] == 1);
    }

    SECTION("safeExecute rolls back a throwing method") {
        auto response = f.call("safeExecute", {{"method", "boom"}});
        REQUIRE(response["success"] == false);
        REQUIRE(response["wasRolledBack"] == true);
        REQUIRE(response["errorKind"] == "Exception");
        REQUIRE(response["message"] == "'boom' threw exception and was rolled back");
        REQUIRE(f.model.element_count() == 0);
    }

    SECTION("safeExecute without a method") {
        auto response = f.call("safeExecute");
        REQUIRE(response["success"] == false);
        REQUIRE(response["error"] == "method name required");
    }

    SECTION("verifyAndRollback completes") {
        auto response = f.call("verifyAndRollback", {
            {"method", "createElement"}, {"params", {{"category", "Walls"}}},
            {"verifyMethod", "assertElementCount"}, {"verifyParams", {{"category", "Walls"}, {"expected", 1}}},
        });
        REQUIRE(response["success"] == true);
        REQUIRE(response["phase"] == "complete");
        REQUIRE(response["verifyResult"]["count"] == 1);
        REQUIRE(f.model.element_count() == 1);
    }

    SECTION("verifyAndRollback undoes on failed verification") {
        auto response = f.call("verifyAndRollback", {
            {"method", "createElement"}, {"params", {{"category", "Walls"}}},
            {"verifyMethod", "verifyElementCount"}, {"verifyParams", {{"category", "Walls"}, {"expected", 2}}},
        });
        REQUIRE(response["success"] == false);
        REQUIRE(response["phase"] == "verification");
        REQUIRE(response["wasRolledBack"] == true);
        REQUIRE(response["verifyResult"]["error"] == "Expected 2 elements in 'Walls', found 1");
        REQUIRE(f.model.element_count() == 0);
    }

    SECTION("verifyAndRollback requires both methods") {
        auto response = f.call("verifyAndRollback", {{"method", "createElement"}});
        REQUIRE(response["success"] == false);
        REQUIRE(response["error"] == "Both method and verifyMethod are required");
    }
}

TEST_CASE("Dispatcher executeWithUndo", "[bridge][dispatcher]") {
    DispatchFixture f;

    SECTION("unknown method") {
        auto response = f.call("executeWithUndo", {{"method", "m"}});
        REQUIRE(response["success"] == false);
        REQUIRE(response["error"] == "Method 'm' not found");
    }

    SECTION("method is required") {
        auto response = f.call("executeWithUndo");
        REQUIRE(response["error"] == "Missing required parameter: method");
    }

    SECTION("adds a checkpoint inside a group") {
        REQUIRE(f.call("startTransactionGroup", {{"name", "G1"}})["success"] == true);

        auto response = f.call("executeWithUndo", {
            {"method", "createElement"}, {"params", {{"category", "Walls"}}}, {"undoName", "Place wall"},
        });
        REQUIRE(response["success"] == true);
        REQUIRE(response["undoName"] == "Place wall");
        REQUIRE(response["message"] == "Executed 'createElement' with undo point");

        auto status = f.call("getTransactionStatus");
        REQUIRE(status["checkpointCount"] == 2);
        auto last = status["checkpoints"][1].get<std::string>();
        REQUIRE(last.substr(last.size() - std::string("Execute: Place wall").size()) == "Execute: Place wall");

        REQUIRE(f.call("commitTransactionGroup")["success"] == true);
        REQUIRE(f.model.undo_stack() == std::vector<std::string>{"G1"});
    }

    SECTION("standalone undo name") {
        auto response = f.call("executeWithUndo", {{"method", "opA"}, {"undoName", "Sample it"}});
        REQUIRE(response["success"] == true);
        REQUIRE(f.model.undo_stack() == std::vector<std::string>{"Sample it"});
    }
}

TEST_CASE("Dispatcher listMethods", "[bridge][dispatcher]") {
    DispatchFixture f;

    SECTION("all methods") {
        auto response = f.call("listMethods");
        REQUIRE(response["success"] == true);
        REQUIRE(response["count"] == response["methods"].size());
        auto categories = response["categories"].get<std::vector<std::string>>();
        REQUIRE(std::find(categories.begin(), categories.end(), "Transaction") != categories.end());
        REQUIRE(std::find(categories.begin(), categories.end(), "Elements") != categories.end());
    }

    SECTION("filtered by category") {
        auto response = f.call("getMethods", {{"category", "transaction"}});
        REQUIRE(response["count"] == f.dispatcher->builtin_methods().size());
        for (const auto& method : response["methods"]) {
            REQUIRE(method["category"] == "Transaction");
        }
    }

    SECTION("unknown category") {
        REQUIRE(f.call("listMethods", {{"category", "Nope"}})["count"] == 0);
    }
}

TEST_CASE("Dispatcher standalone operations commit individually", "[bridge][dispatcher]") {
    DispatchFixture f;

    REQUIRE(f.call("createElement", {{"category", "Walls"}})["success"] == true);
    REQUIRE(f.call("createElement", {{"category", "Doors"}})["success"] == true);
    REQUIRE(f.model.undo_stack().size() == 2);

    auto count = f.call("countElements", {{"category", "Walls"}});
    REQUIRE(count["count"] == 1);

    auto deleted = f.call("deleteElement", {{"elementId", 1}});
    REQUIRE(deleted["deletedId"] == 1);
    REQUIRE(f.call("countElements")["count"] == 1);
}
