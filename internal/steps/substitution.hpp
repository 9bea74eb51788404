#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/env.hpp"

namespace ferry::steps {

using Store = std::map<std::string, std::string>;

struct LoopFrame {
  std::string value;
  std::size_t index{0};
};

/*
  What a step's string fields may refer to:

    ${NAME}, {env.NAME}   merged environment
    {store.KEY}           values kept by store / read steps
    {loop.value}          current item inside a group loop
    {loop.index}          zero-based iteration

  Unknown names resolve to "". Any other brace text is left alone.
*/
struct Scope {
  util::EnvMap             env;
  const Store*             store{nullptr};
  std::optional<LoopFrame> loop;
};

std::string Substitute(std::string_view text, const Scope& scope);

// False for "", "false", "0", "no", "off" (any case, surrounding blanks ignored).
bool IsTruthy(std::string_view text);

// Substitutes, then applies IsTruthy.
bool EvaluateCondition(std::string_view condition, const Scope& scope);

} // namespace ferry::steps
