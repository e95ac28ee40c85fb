#include <colex/runtime/function_registry.hpp>

#include <algorithm>
#include <cctype>

namespace colex::runtime {

namespace {

auto fold_case(std::string_view name) -> std::string {
    std::string key(name);
    std::ranges::transform(key, key.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return key;
}

auto make_builtin_registry() -> FunctionRegistry {
    FunctionRegistry registry;
    register_math_functions(registry);
    register_window_functions(registry);
    register_conversion_functions(registry);
    register_reduction_functions(registry);
    register_plot_functions(registry);
    return registry;
}

}  // namespace

void FunctionRegistry::add(FunctionDescriptor descriptor) {
    auto key = fold_case(descriptor.name);
    registry_.insert_or_assign(std::move(key), std::move(descriptor));
}

auto FunctionRegistry::find(std::string_view name) const -> const FunctionDescriptor* {
    if (auto it = registry_.find(fold_case(name)); it != registry_.end()) {
        return &it->second;
    }
    return nullptr;
}

auto FunctionRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(registry_.size());
    for (const auto& [key, descriptor] : registry_) {
        out.push_back(descriptor.name);
    }
    std::ranges::sort(out);
    return out;
}

auto FunctionRegistry::builtin() -> const FunctionRegistry& {
    static const FunctionRegistry registry = make_builtin_registry();
    return registry;
}

}  // namespace colex::runtime
