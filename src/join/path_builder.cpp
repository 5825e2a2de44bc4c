#include "safepath/path_builder.hpp"

namespace safepath {

void PathBuilder::push(const PathComponent& component) {
    path_ /= component.path();
}

void PathBuilder::push_unchecked(const std::filesystem::path& part) {
    path_ /= part;
}

ComponentError PathBuilder::push_checked(const std::filesystem::path& part) {
    auto component = PathComponent::create(part);
    if (!component) {
        return classify_component(part);
    }
    push(*component);
    return ComponentError::None;
}

} // namespace safepath
