#include <verity/matching/parser.hpp>
#include <verity/matching/whitespace.hpp>

#include <cctype>
#include <vector>

namespace verity::matching {

namespace {

bool is_space(const char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() && is_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

std::vector<std::string_view> split_whitespace(const std::string_view value) {
  auto tokens = std::vector<std::string_view>{};
  auto begin = std::size_t{0};
  while (begin < value.size()) {
    while (begin < value.size() && is_space(value[begin])) {
      ++begin;
    }
    auto end = begin;
    while (end < value.size() && !is_space(value[end])) {
      ++end;
    }
    if (end > begin) {
      tokens.push_back(value.substr(begin, end - begin));
    }
    begin = end;
  }
  return tokens;
}

void append_joined(std::string& out, const std::string_view part) {
  if (part.empty()) {
    return;
  }
  if (!out.empty()) {
    out.push_back(' ');
  }
  out.append(part);
}

}  // namespace

parsed_name_t parse_display_name(const std::string_view display_name) {
  const auto unified = unify_whitespace(display_name);
  auto name = trim(unified);
  auto parsed = parsed_name_t{};

  if (auto comma = name.find(','); comma != std::string_view::npos) {
    parsed.family = std::string{trim(name.substr(0, comma))};
    auto rest = name.substr(comma + 1);
    while (!rest.empty()) {
      auto next = rest.find(',');
      append_joined(parsed.given, trim(rest.substr(0, next)));
      if (next == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(next + 1);
    }
    return parsed;
  }

  auto tokens = split_whitespace(name);
  if (tokens.empty()) {
    return parsed;
  }
  if (tokens.size() == 1) {
    parsed.given = std::string{tokens.front()};
    return parsed;
  }
  parsed.family = std::string{tokens.back()};
  tokens.pop_back();
  for (const auto token : tokens) {
    append_joined(parsed.given, token);
  }
  return parsed;
}

}  // namespace verity::matching
