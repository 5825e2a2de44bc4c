#include "safepath/path_component.hpp"
#include "safepath/errors.hpp"

#include <iterator>

namespace safepath {

ComponentError classify_component(const std::filesystem::path& candidate) {
    if (candidate.empty()) {
        return ComponentError::Empty;
    }
    if (candidate.has_root_name()) {
        return ComponentError::RootName;
    }
    if (candidate.has_root_directory()) {
        return ComponentError::RootDirectory;
    }

    // "a/b" and "a/" both iterate to two elements; the latter ends in an
    // empty filename.
    auto it = candidate.begin();
    const std::filesystem::path& first = *it;
    if (std::next(it) != candidate.end()) {
        return ComponentError::MultipleComponents;
    }

    if (first == ".") {
        return ComponentError::CurrentDirectory;
    }
    if (first == "..") {
        return ComponentError::ParentDirectory;
    }
    return ComponentError::None;
}

std::optional<PathComponent> PathComponent::create(std::filesystem::path candidate) {
    if (classify_component(candidate) != ComponentError::None) {
        return std::nullopt;
    }
    return PathComponent(std::move(candidate));
}

std::optional<PathComponent> validate_component(const std::filesystem::path& candidate) {
    return PathComponent::create(candidate);
}

} // namespace safepath
