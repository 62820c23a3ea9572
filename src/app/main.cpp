#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "app/cli_parser.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/purchase_proposer.hpp"
#include "runtime/scripted_proposer.hpp"
#include "session/artifact_writer.hpp"
#include "session/step_log.hpp"
#include "session/task_session.hpp"
#include "store/catalog_seed.hpp"
#include "store/resource_store.hpp"

namespace {

namespace errors = shopagent::core::errors;
using shopagent::session::SessionState;

void report(const std::string& what, const errors::AgentError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = shopagent::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        report("Input error", errors::get_error(parsed));
        return 2;
    }
    const auto& req = errors::get_value(parsed);
    if (req.verbose) {
        shopagent::core::logging::Logger::get().set_min_level(
            shopagent::core::logging::LogLevel::DEBUG);
    }

    // 2. Build the store from the demo catalog or the given file
    shopagent::store::CatalogSeed seed = shopagent::store::default_catalog();
    if (req.catalog_file.has_value()) {
        auto loaded = shopagent::store::load_catalog_file(req.catalog_file.value());
        if (errors::is_error(loaded)) {
            report("Failed to load catalog", errors::get_error(loaded));
            return 3;
        }
        seed = errors::get_value(loaded);
    } else if (req.simulate_race) {
        seed.competing_purchase = shopagent::store::demo_competing_purchase();
    }
    if (!req.simulate_race) {
        seed.competing_purchase.clear();
    }

    auto created = shopagent::store::ResourceStore::create(std::move(seed));
    if (errors::is_error(created)) {
        report("Invalid catalog", errors::get_error(created));
        return 3;
    }
    auto store = errors::get_value(created);

    // 3. Pick the proposer
    std::unique_ptr<shopagent::runtime::ActionProposer> proposer;
    if (req.plan_file.has_value()) {
        auto script = shopagent::runtime::load_script_file(req.plan_file.value());
        if (errors::is_error(script)) {
            report("Failed to load plan", errors::get_error(script));
            return 3;
        }
        proposer = std::make_unique<shopagent::runtime::ScriptedProposer>(
            errors::get_value(script));
    } else {
        proposer = std::make_unique<shopagent::runtime::PurchaseProposer>();
    }

    shopagent::runtime::ExecutorOptions options;
    options.step_budget = req.max_steps;
    shopagent::session::TaskSession session(req.task_description, store, options);
    const std::string session_id = session.id();
    shopagent::core::logging::Logger::get().set_session_id(session_id);
    LOG_INFO("Session started for goal: " + req.task_description);

    std::cout << shopagent::session::render_inventory(store->inventory_snapshot())
              << std::endl;

    shopagent::session::ArtifactWriter artifact_writer(req.working_directory);
    auto request_artifact = artifact_writer.write_request(session_id, req);
    if (errors::is_error(request_artifact)) {
        report("Failed to write request artifact", errors::get_error(request_artifact));
        return 6;
    }
    auto artifact_path = errors::get_value(request_artifact);

    // 4. Run, rendering and recording each step as it lands
    bool artifact_failed = false;
    auto on_step = [&](const shopagent::protocol::Step& step) {
        std::cout << shopagent::session::render_step(step) << std::endl;
        if (artifact_failed) {
            return;
        }
        auto step_artifact = artifact_writer.write_step(session_id, step);
        if (errors::is_error(step_artifact)) {
            report("Failed to write step artifact", errors::get_error(step_artifact));
            artifact_failed = true;
        }
    };

    auto execution = session.run(*proposer, on_step);
    if (errors::is_error(execution)) {
        const auto& err = errors::get_error(execution);
        report("Session failed", err);
        auto failure_artifact = artifact_writer.write_final(
            session_id, SessionState::Failed, "Session failed.", err.message);
        if (errors::is_error(failure_artifact)) {
            report("Failed to write failure artifact", errors::get_error(failure_artifact));
        }
        return 1;
    }
    if (artifact_failed) {
        return 6;
    }

    const auto& result = errors::get_value(execution);
    LOG_INFO("Session summary: " + result.summary);
    LOG_INFO("Final session state: " + shopagent::session::to_string(session.state()));

    std::cout << shopagent::session::render_inventory(store->inventory_snapshot())
              << std::endl;
    std::cout << shopagent::session::render_basket(store->view_basket()) << std::endl;

    std::optional<std::string> final_error;
    if (result.error.has_value()) {
        report("Session failed", *result.error);
        final_error = result.error->message;
    }
    auto final_artifact = artifact_writer.write_final(session_id, session.state(),
                                                      result.summary, final_error);
    if (errors::is_error(final_artifact)) {
        report("Failed to write final artifact", errors::get_error(final_artifact));
        return 6;
    }
    artifact_path = errors::get_value(final_artifact);
    LOG_INFO("Artifacts: " + artifact_path.string());

    if (session.state() == SessionState::Failed) {
        return 1;
    }
    return session.state() == SessionState::Done ? 0 : 4;
}
