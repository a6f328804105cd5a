#pragma once

#include "model.hpp"
#include <string>

namespace namewise {

/// JSON description of every resolved name in the model and where it came
/// from. Two snapshots are equal exactly when the models name everything alike.
std::string to_json(const schema_model& model, int indent = -1);

} // namespace namewise
