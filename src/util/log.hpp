#pragma once

#include <string_view>

namespace ragquery::log {

enum class Level { Debug, Info, Warn, Error };

// Lines below the threshold are dropped. The initial threshold comes from
// RAG_LOG_LEVEL (debug|info|warn|error), default info.
void set_threshold(Level level);
Level threshold();
bool enabled(Level level);

void write(Level level, std::string_view message);
void debug(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

}  // namespace ragquery::log
