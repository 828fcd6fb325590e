#include "byterate/plural-rule.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "byterate/errors.hpp"

namespace byterate {

namespace {

std::string Suffixed(std::string_view unit, std::string_view suffix) {
  std::string ret;
  ret.reserve(unit.size() + suffix.size());
  ret.append(unit);
  ret.append(suffix);
  return ret;
}

}  // namespace

std::string DefaultPluralRule::formKey(int64_t count, std::string_view unit) const {
  return count == 1 ? std::string(unit) : Suffixed(unit, "s");
}

std::string SlavicPluralRule::formKey(int64_t count, std::string_view unit) const {
  const int64_t mod10 = count % 10;
  const int64_t mod100 = count % 100;
  if (mod10 == 1 && mod100 != 11) {
    return std::string(unit);
  }
  if (mod10 >= 2 && mod10 <= 4 && (mod100 < 10 || mod100 >= 20)) {
    return Suffixed(unit, "_few");
  }
  return Suffixed(unit, "s");
}

std::string ArabicPluralRule::formKey(int64_t count, std::string_view unit) const {
  if (count == 1 || count == 2) {
    return std::string(unit);
  }
  if (count >= 3 && count <= 10) {
    return Suffixed(unit, "s");
  }
  return Suffixed(unit, "s_many");
}

std::string InvariantPluralRule::formKey([[maybe_unused]] int64_t count, std::string_view unit) const {
  return Suffixed(unit, "s");
}

FunctionPluralRule::FunctionPluralRule(Function function) : _function(std::move(function)) {
  if (!_function) {
    throw InvalidArgumentError("Plural function should not be empty");
  }
}

std::shared_ptr<const PluralRule> MakePluralRule(std::string_view name) {
  if (name == "default") {
    return std::make_shared<DefaultPluralRule>();
  }
  if (name == "slavic") {
    return std::make_shared<SlavicPluralRule>();
  }
  if (name == "arabic") {
    return std::make_shared<ArabicPluralRule>();
  }
  if (name == "invariant") {
    return std::make_shared<InvariantPluralRule>();
  }
  throw InvalidArgumentError("Unknown plural rule '{}'", name);
}

}  // namespace byterate
