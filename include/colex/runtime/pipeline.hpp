#pragma once

#include <colex/core/error.hpp>
#include <colex/core/typed_column.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace colex::runtime {

/// A column as stored by a Pipeline: shared, never mutated in place.
struct Field {
    std::shared_ptr<const TypedColumn> column;
    Role role = Role::Undetermined;
};

/// Columnar data source and sink consumed by the evaluator.
///
/// All fields of one pipeline share the same row count.
class Pipeline {
   public:
    virtual ~Pipeline() = default;

    [[nodiscard]] virtual auto rows() const -> std::size_t = 0;

    /// Fetch a field; LookupError when it does not exist.
    [[nodiscard]] virtual auto get_column(const std::string& name) const -> Result<Field> = 0;

    /// Add a field.  `renormalize` asks the store to recompute any normalization
    /// statistics it keeps for the field.
    [[nodiscard]] virtual auto append_column(std::string name, TypedColumn column, Role role,
                                             bool renormalize) -> Result<void> = 0;

    [[nodiscard]] virtual auto drop_column(const std::string& name) -> Result<void> = 0;

    [[nodiscard]] virtual auto contains(const std::string& name) const -> bool = 0;

    /// Field names in insertion order.
    [[nodiscard]] virtual auto names() const -> std::vector<std::string> = 0;
};

/// In-memory Pipeline with copy-on-write column entries.
///
/// Appending to a pipeline of at most one row may change its row count: existing
/// columns are repeated to the new length.  Otherwise lengths must agree.
class MemoryPipeline final : public Pipeline {
   public:
    MemoryPipeline() = default;

    /// Convenience for building fixtures; the role defaults from the column kind.
    [[nodiscard]] auto add(std::string name, TypedColumn column) -> Result<void>;

    [[nodiscard]] auto rows() const -> std::size_t override { return rows_; }
    [[nodiscard]] auto get_column(const std::string& name) const -> Result<Field> override;
    [[nodiscard]] auto append_column(std::string name, TypedColumn column, Role role,
                                     bool renormalize) -> Result<void> override;
    [[nodiscard]] auto drop_column(const std::string& name) -> Result<void> override;
    [[nodiscard]] auto contains(const std::string& name) const -> bool override {
        return index_.contains(name);
    }
    [[nodiscard]] auto names() const -> std::vector<std::string> override;

    /// Whether the field was appended with a renormalization request.
    [[nodiscard]] auto is_normalized(const std::string& name) const -> bool;

   private:
    struct Entry {
        std::string name;
        Field field;
        bool normalized = false;
    };

    void rebuild_index();

    std::vector<Entry> columns_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t rows_ = 0;
};

}  // namespace colex::runtime
