#include "rlreward/completion.hpp"

namespace rlreward {

namespace {

struct TextOf {
  std::string operator()(const std::string& s) const { return s; }
  std::string operator()(const Message& m) const { return m.content; }
  std::string operator()(const std::vector<Message>& conversation) const {
    return conversation.empty() ? std::string() : conversation.front().content;
  }
};

}  // namespace

std::string completion_text(const Completion& completion) {
  return std::visit(TextOf{}, completion);
}

std::vector<std::string> completion_texts(const std::vector<Completion>& completions) {
  std::vector<std::string> out;
  out.reserve(completions.size());
  for (const auto& c : completions) out.push_back(completion_text(c));
  return out;
}

}  // namespace rlreward
