#pragma once

// Convenience header pulling in the whole public API.

#include "safepath/errors.hpp"
#include "safepath/join.hpp"
#include "safepath/path_builder.hpp"
#include "safepath/path_component.hpp"
#include "safepath/sanitize.hpp"
#include "safepath/sanitize_policy.hpp"
