#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"

namespace ragquery::prompts {

extern const std::string_view kDefaultSystemPrompt;
extern const std::string_view kNoContextPlaceholder;

// Prior answers are cut to this many bytes when replayed as history.
constexpr std::size_t kHistoryAnswerPreviewBytes = 200;

// Folds the history window into the question. Returns the question unchanged
// when there is no history.
std::string with_history(const std::vector<ConversationTurn>& history, std::string_view question);

// Final user message: context block followed by the question.
std::string rag_user_prompt(std::string_view question, std::string_view context);

}  // namespace ragquery::prompts
