#pragma once

#include <rowbridge/core/dataset.hpp>
#include <rowbridge/core/error.hpp>
#include <rowbridge/frame/transform.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rowbridge::frame {

/// Old name → new name pairs, applied in the order given.
using RenameMap = std::vector<std::pair<std::string, std::string>>;

/// Rename one column. Rows are shared with the input, not copied.
[[nodiscard]] auto rename_column(const Dataset& dataset, const std::string& old_name,
                                 const std::string& new_name) -> Result<Dataset>;

/// Apply `names` pair by pair against the evolving schema.
///
/// A source name is looked up among the columns this call has not renamed
/// yet first, and only then among columns an earlier pair produced. So
/// {a→b, b→c} turns [a, b] into [b, c] (the second pair renames the original
/// b) and turns [a] into [c] (the second pair follows the chain). Names
/// must be unique once every pair has been applied. An empty map returns the
/// dataset unchanged.
[[nodiscard]] auto rename_columns(const Dataset& dataset, const RenameMap& names)
    -> Result<Dataset>;

/// Parse "old=new,old2=new2" into a RenameMap.
[[nodiscard]] auto parse_rename_spec(std::string_view spec) -> Result<RenameMap>;

class RenameColumns final : public FrameTransform {
   public:
    explicit RenameColumns(RenameMap names) : names_(std::move(names)) {}

    [[nodiscard]] auto name() const -> std::string override { return "rename_columns"; }
    [[nodiscard]] auto work(const Dataset& state) const -> Result<Dataset> override {
        return rename_columns(state, names_);
    }

    [[nodiscard]] auto names() const noexcept -> const RenameMap& { return names_; }

   private:
    RenameMap names_;
};

}  // namespace rowbridge::frame
