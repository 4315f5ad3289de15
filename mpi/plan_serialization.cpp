///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "plan_serialization.hpp"
#include <stdexcept>


///////////////////////////
///    SERIALIZATION    ///
///////////////////////////
void serializePlan(const PlanMessage& message, const GuestIndex& guests, std::vector<int>& buffer) {
    buffer.clear();
    buffer.push_back(message.iterations);
    buffer.push_back((int)message.finalState);
    buffer.push_back((int)message.plan.tables.size());
    for (const Table& table : message.plan.tables) {
        buffer.push_back((int)table.guestIds.size());
        for (const std::string& gid : table.guestIds) {
            buffer.push_back(guests.indexOf(gid));
        }
    }
}

PlanMessage deserializePlan(const std::vector<int>& buffer, const GuestIndex& guests) {
    size_t pos = 0;
    auto next = [&]() -> int {
        if (pos >= buffer.size()) throw std::runtime_error("Truncated plan buffer");
        return buffer[pos++];
    };

    PlanMessage message;
    message.iterations = next();
    message.finalState = (OptimizerState)next();

    int tableCount = next();
    message.plan.tables.reserve(tableCount);
    for (int t = 0; t < tableCount; ++t) {
        Table table{tableLabel(t), {}};
        int count = next();
        for (int i = 0; i < count; ++i) {
            int idx = next();
            if (idx < 0 || idx >= guests.size()) {
                throw std::runtime_error("Plan buffer references unknown guest position " + std::to_string(idx));
            }
            table.guestIds.push_back(guests.guests()[idx].id);
        }
        message.plan.tables.push_back(std::move(table));
    }
    return message;
}
