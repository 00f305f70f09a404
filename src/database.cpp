#include "tickflow/database/database.hpp"

namespace tickflow {

Database::Database(std::shared_ptr<const DatabaseLayout> layout, uint64_t tick, Timestamp timestamp)
    : layout_(std::move(layout))
    , tick_(tick)
    , timestamp_(timestamp) {
    fields_.reserve(layout_->size());
    filled_.reserve(layout_->size());
    for (const auto& field : layout_->fields()) {
        fields_.push_back(field.make_default());
        filled_.push_back(!field.additional);
    }
}

std::string Database::field_to_json(std::size_t index) const {
    return layout_->fields()[index].to_json(fields_[index]);
}

std::string Database::to_json(const std::vector<std::size_t>& selection) const {
    std::string json = "{";
    bool first = true;
    
    auto append = [&](std::size_t index) {
        if (!filled_[index]) {
            return;
        }
        if (!first) {
            json += ",";
        }
        first = false;
        json += rfl::json::write(layout_->fields()[index].name) + ":" + field_to_json(index);
    };
    
    if (selection.empty()) {
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            append(i);
        }
    } else {
        for (std::size_t index : selection) {
            append(index);
        }
    }
    
    json += "}";
    return json;
}

} // namespace tickflow
