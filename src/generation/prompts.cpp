#include "generation/prompts.hpp"

#include <sstream>

#include "util/text.hpp"

namespace ragquery::prompts {

const std::string_view kDefaultSystemPrompt =
    "You are an AI assistant helping users find information from their documents. "
    "Use the provided context to answer questions accurately and helpfully.\n"
    "\n"
    "Guidelines:\n"
    "- Base your answers primarily on the provided context\n"
    "- If the context doesn't contain enough information, say so clearly\n"
    "- Cite specific documents when possible\n"
    "- Be concise but comprehensive\n"
    "- If asked about something not in the context, acknowledge the limitation";

const std::string_view kNoContextPlaceholder = "No relevant context available.";

std::string with_history(const std::vector<ConversationTurn>& history, std::string_view question) {
    if (history.empty()) {
        return std::string{question};
    }

    std::ostringstream oss;
    oss << "Given our recent conversation:\n";
    for (const auto& turn : history) {
        oss << "User: " << turn.question << '\n';
        oss << "AI: " << text::preview(turn.answer, kHistoryAnswerPreviewBytes) << '\n';
    }
    oss << "\nNew question: " << question;
    return oss.str();
}

std::string rag_user_prompt(std::string_view question, std::string_view context) {
    std::ostringstream oss;
    oss << "Context Information:\n"
        << (text::is_blank(context) ? kNoContextPlaceholder : context) << "\n\n"
        << "User Question: " << question << "\n\n"
        << "Please provide a helpful answer based on the context above. "
           "If the context doesn't contain sufficient information to fully answer the question, "
           "please say so clearly.";
    return oss.str();
}

}  // namespace ragquery::prompts
