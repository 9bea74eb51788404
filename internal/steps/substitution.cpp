#include "substitution.hpp"

#include <cctype>

namespace ferry::steps {

namespace {

bool IsNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

std::string Lookup(const std::map<std::string, std::string>* values, const std::string& key) {
  if (values == nullptr) return {};
  auto it = values->find(key);
  return it == values->end() ? std::string() : it->second;
}

// Resolves "env.X", "store.X", "loop.value", "loop.index"; nullopt for anything else.
std::optional<std::string> Resolve(const std::string& reference, const Scope& scope) {
  auto starts = [&](std::string_view prefix) { return reference.compare(0, prefix.size(), prefix) == 0; };

  if (starts("env.")) return Lookup(&scope.env, reference.substr(4));
  if (starts("store.")) return Lookup(scope.store, reference.substr(6));
  if (reference == "loop.value") return scope.loop ? scope.loop->value : std::string();
  if (reference == "loop.index") return scope.loop ? std::to_string(scope.loop->index) : std::string();
  return std::nullopt;
}

} // namespace

std::string Substitute(std::string_view text, const Scope& scope) {
  std::string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const bool dollar = text[i] == '$' && i + 1 < text.size() && text[i + 1] == '{';
    if (!dollar && text[i] != '{') {
      out += text[i++];
      continue;
    }

    const std::size_t open  = dollar ? i + 2 : i + 1;
    std::size_t       close = open;
    while (close < text.size() && IsNameChar(text[close])) ++close;

    if (close == open || close >= text.size() || text[close] != '}') {
      out += text[i++];
      continue;
    }

    const std::string name(text.substr(open, close - open));
    if (dollar) {
      out += Lookup(&scope.env, name);
    } else if (auto resolved = Resolve(name, scope)) {
      out += *resolved;
    } else {
      out.append(text.substr(i, close + 1 - i));
    }
    i = close + 1;
  }
  return out;
}

bool IsTruthy(std::string_view text) {
  std::string value;
  for (char c : text) value += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return false;
  value = value.substr(first, value.find_last_not_of(" \t\r\n") - first + 1);

  return value != "false" && value != "0" && value != "no" && value != "off";
}

bool EvaluateCondition(std::string_view condition, const Scope& scope) {
  return IsTruthy(Substitute(condition, scope));
}

} // namespace ferry::steps
