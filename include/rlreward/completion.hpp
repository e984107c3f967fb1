#pragma once

// rlreward/completion.hpp - Accepted completion shapes.
//
// Trainers hand completions over in different shapes: a bare string, a chat
// message record, or a conversation (list of messages). All are normalized to
// plain text before extraction or format checking.

#include <string>
#include <variant>
#include <vector>

namespace rlreward {

struct Message {
  std::string role;
  std::string content;
};

using Completion = std::variant<std::string, Message, std::vector<Message>>;

// Plain text of a completion. A conversation yields its first message's
// content; an empty conversation yields "".
std::string completion_text(const Completion& completion);

std::vector<std::string> completion_texts(const std::vector<Completion>& completions);

}  // namespace rlreward
