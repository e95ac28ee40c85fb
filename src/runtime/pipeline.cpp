#include <colex/runtime/pipeline.hpp>

#include <spdlog/spdlog.h>

namespace colex::runtime {

auto MemoryPipeline::add(std::string name, TypedColumn column) -> Result<void> {
    Role role = default_role(column.kind());
    return append_column(std::move(name), std::move(column), role, false);
}

auto MemoryPipeline::get_column(const std::string& name) const -> Result<Field> {
    if (auto it = index_.find(name); it != index_.end()) {
        return columns_[it->second].field;
    }
    return make_error(ErrorKind::Lookup, "{} not in pipeline", name);
}

auto MemoryPipeline::append_column(std::string name, TypedColumn column, Role role,
                                   bool renormalize) -> Result<void> {
    if (column.size() == 0) {
        return make_error(ErrorKind::Shape, "cannot append empty column '{}'", name);
    }
    if (index_.contains(name)) {
        return make_error(ErrorKind::Shape, "field '{}' already exists", name);
    }
    const std::size_t length = column.size();
    if (columns_.empty()) {
        rows_ = length;
    } else if (length != rows_) {
        if (rows_ <= 1) {
            spdlog::debug("pipeline grows from {} to {} rows for field '{}'", rows_, length, name);
            for (auto& entry : columns_) {
                // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
                entry.field.column =
                    std::make_shared<const TypedColumn>(broadcast_to(*entry.field.column, length));
            }
            rows_ = length;
        } else if (length == 1) {
            column = broadcast_to(column, rows_);
        } else {
            return make_error(ErrorKind::Shape, "field '{}' has {} rows, pipeline has {}", name,
                              length, rows_);
        }
    }
    index_[name] = columns_.size();
    columns_.push_back(Entry{
        .name = std::move(name),
        .field = Field{.column = std::make_shared<const TypedColumn>(std::move(column)),
                       .role = role},
        .normalized = renormalize,
    });
    return {};
}

auto MemoryPipeline::drop_column(const std::string& name) -> Result<void> {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return make_error(ErrorKind::Lookup, "{} not in pipeline", name);
    }
    columns_.erase(columns_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index();
    return {};
}

auto MemoryPipeline::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& entry : columns_) {
        out.push_back(entry.name);
    }
    return out;
}

auto MemoryPipeline::is_normalized(const std::string& name) const -> bool {
    if (auto it = index_.find(name); it != index_.end()) {
        return columns_[it->second].normalized;
    }
    return false;
}

void MemoryPipeline::rebuild_index() {
    index_.clear();
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        index_.emplace(columns_[i].name, i);
    }
}

}  // namespace colex::runtime
