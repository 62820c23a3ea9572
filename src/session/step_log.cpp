#include "session/step_log.hpp"

#include <sstream>

namespace shopagent::session {

using nlohmann::json;

std::string format_parameters(const json& parameters) {
    if (!parameters.is_object()) {
        return protocol::to_text(parameters);
    }

    std::ostringstream out;
    bool first = true;
    for (auto it = parameters.begin(); it != parameters.end(); ++it) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << it.key() << '=';
        if (it->is_string()) {
            out << '\'' << it->get<std::string>() << '\'';
        } else {
            out << protocol::to_text(*it);
        }
    }
    return out.str();
}

std::string render_step(const protocol::Step& step) {
    std::ostringstream out;
    out << "step_" << step.number << ": " << step.rationale << '\n';
    out << "  tool='" << step.action.name << '\'';
    const std::string parameters = format_parameters(step.action.parameters);
    if (!parameters.empty()) {
        out << ' ' << parameters;
    }
    out << '\n';
    out << "  OUTPUT " << protocol::to_text(protocol::to_json(step.result));
    return out.str();
}

std::string render_inventory(const std::vector<store::ProductListing>& inventory) {
    std::ostringstream out;
    out << "Inventory:";
    for (const auto& listing : inventory) {
        out << "\n  " << listing.product.sku << " (" << listing.product.name
            << ") price=" << listing.product.price
            << " available=" << listing.available;
    }
    return out.str();
}

std::string render_basket(const std::vector<store::BasketLine>& basket) {
    std::ostringstream out;
    out << "Basket:";
    if (basket.empty()) {
        out << " (empty)";
    }
    for (const auto& line : basket) {
        out << "\n  " << line.sku << " x" << line.quantity;
    }
    return out.str();
}

}  // namespace shopagent::session
